#include <source_range.hpp>

#include <algorithm>
#include <tuple>

namespace pie
{

source_range::source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                                    std::size_t column_end, std::size_t row_end)
  : module(module), column_beg(column_beg), row_beg(row_beg), column_end(column_end), row_end(row_end)
{  }

source_range& source_range::widen(const source_range& other)
{
  // ranges are compared row first, a range on a later row always ends later
  if(std::tie(other.row_beg, other.column_beg) < std::tie(row_beg, column_beg))
  {
    row_beg = other.row_beg;
    column_beg = other.column_beg;
  }
  if(std::tie(row_end, column_end) < std::tie(other.row_end, other.column_end))
  {
    row_end = other.row_end;
    column_end = other.column_end;
  }
  return *this;
}

source_range& source_range::operator+=(const source_range& other)
{ return this->widen(other); }

std::string source_range::to_string() const
{
  return module + ":"
    + std::to_string(row_beg) + ":"
    + std::to_string(column_beg);
}

void to_json(nlohmann::json& j, const source_range& s)
{
  j = nlohmann::json{
    { "module", s.module },
    { "col_beg", s.column_beg },
    { "row_beg", s.row_beg },
    { "col_end", s.column_end },
    { "row_end", s.row_end },
  };
}

void from_json(const nlohmann::json& j, source_range& s)
{
  s = source_range { j.at("module").get<std::string>(),
                     j.at("col_beg").get<std::size_t>(),
                     j.at("row_beg").get<std::size_t>(),
                     j.at("col_end").get<std::size_t>(),
                     j.at("row_end").get<std::size_t>()
  };
}

}
