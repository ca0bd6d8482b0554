#pragma once

#include <tsl/robin_map.h>

#include <string_view>
#include <optional>
#include <cstdint>
#include <string>
#include <vector>

namespace pie
{

struct symbol
{
  symbol(std::string name, std::uint32_t offset);

  std::string name;
  std::uint32_t offset;
};

/**
 * Maps label names to their offsets for the duration of one assembler run.
 * Code labels get their offset on insertion, string constants are patched
 * once the read-only cursor is known.
 */
class symbol_table
{
public:
  using map_type = tsl::robin_map<std::string, symbol>;

  // false if the name is taken, the table is left untouched then
  bool add(symbol s);

  bool has(std::string_view name) const;
  std::optional<std::uint32_t> lookup(std::string_view name) const;

  bool set_offset(std::string_view name, std::uint32_t offset);

  std::size_t size() const
  { return symbols.size(); }

  bool empty() const
  { return symbols.empty(); }

  map_type::const_iterator begin() const
  { return symbols.begin(); }

  map_type::const_iterator end() const
  { return symbols.end(); }

  // ordered by offset, then by name
  std::vector<symbol> sorted() const;
private:
  map_type symbols;
};

}
