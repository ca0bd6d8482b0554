#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string_view>
#include <string>

namespace pie
{

struct source_range
{
  std::string module;

  std::size_t column_beg { 0 };
  std::size_t row_beg { 0 };

  std::size_t column_end { 0 };
  std::size_t row_end { 0 };

  source_range() = default;

  source_range(std::string_view module, std::size_t column_beg, std::size_t row_beg,
                                        std::size_t column_end, std::size_t row_end);

  source_range& widen(const source_range& range);
  source_range& operator+=(const source_range& range);

  std::string to_string() const;
};

void to_json(nlohmann::json& j, const source_range& s);
void from_json(const nlohmann::json& j, source_range& s);

}
