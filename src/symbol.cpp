#include <symbol.hpp>

#include <algorithm>
#include <utility>
#include <tuple>

namespace pie
{

symbol::symbol(std::string name, std::uint32_t offset)
  : name(std::move(name)), offset(offset)
{  }

bool symbol_table::add(symbol s)
{
  auto key = s.name;
  return symbols.emplace(std::move(key), std::move(s)).second;
}

bool symbol_table::has(std::string_view name) const
{
  return symbols.find(std::string(name)) != symbols.end();
}

std::optional<std::uint32_t> symbol_table::lookup(std::string_view name) const
{
  auto it = symbols.find(std::string(name));
  if(it == symbols.end())
    return std::nullopt;
  return it->second.offset;
}

bool symbol_table::set_offset(std::string_view name, std::uint32_t offset)
{
  auto it = symbols.find(std::string(name));
  if(it == symbols.end())
    return false;

  // robin_map only hands out const references to the key/value pair
  it.value().offset = offset;
  return true;
}

std::vector<symbol> symbol_table::sorted() const
{
  std::vector<symbol> v;
  v.reserve(symbols.size());

  for(auto& p : symbols)
    v.push_back(p.second);

  std::sort(v.begin(), v.end(), [](const symbol& lhs, const symbol& rhs)
      { return std::tie(lhs.offset, lhs.name) < std::tie(rhs.offset, rhs.name); });
  return v;
}

}
