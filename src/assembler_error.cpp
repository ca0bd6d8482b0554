#include <assembler_error.hpp>

#include <algorithm>
#include <utility>

namespace pie
{

bool operator==(const assembler_error& lhs, const assembler_error& rhs)
{
  return lhs.kind == rhs.kind && lhs.instruction == rhs.instruction && lhs.detail == rhs.detail;
}

void report::error(error_kind kind, std::optional<std::uint32_t> instruction,
                   std::string detail, source_range loc)
{
  errors.push_back(assembler_error { kind, instruction, std::move(detail), std::move(loc) });
}

void report::warn(error_kind kind, std::optional<std::uint32_t> instruction,
                  std::string detail, source_range loc)
{
  warnings.push_back(assembler_error { kind, instruction, std::move(detail), std::move(loc) });
}

bool report::has_error(error_kind kind) const
{
  return std::any_of(errors.begin(), errors.end(), [kind](const assembler_error& e) { return e.kind == kind; });
}

bool report::has_warning(error_kind kind) const
{
  return std::any_of(warnings.begin(), warnings.end(), [kind](const assembler_error& e) { return e.kind == kind; });
}

}
