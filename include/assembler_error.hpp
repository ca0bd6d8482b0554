#pragma once

#include <source_range.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <optional>
#include <cstdint>
#include <string>
#include <vector>

namespace pie
{

enum class error_kind : std::uint8_t
{
  // errors
  parse_error,
  no_segment_declaration_found,
  string_constant_declared_without_label,
  string_constant_expected,
  symbol_already_declared,
  insufficient_sections,
  unresolved_label,
  opcode_in_operand_field,
  string_in_operand_field,
  integer_out_of_range,
  operand_overflow,

  // warnings
  unknown_section_header,
  unknown_directive,
  section_operands_ignored,
  integer_truncated,
  label_offset_truncated,
};

NLOHMANN_JSON_SERIALIZE_ENUM( error_kind, {
  { error_kind::parse_error, "parse-error" },
  { error_kind::no_segment_declaration_found, "no-segment-declaration-found" },
  { error_kind::string_constant_declared_without_label, "string-constant-declared-without-label" },
  { error_kind::string_constant_expected, "string-constant-expected" },
  { error_kind::symbol_already_declared, "symbol-already-declared" },
  { error_kind::insufficient_sections, "insufficient-sections" },
  { error_kind::unresolved_label, "unresolved-label" },
  { error_kind::opcode_in_operand_field, "opcode-in-operand-field" },
  { error_kind::string_in_operand_field, "string-in-operand-field" },
  { error_kind::integer_out_of_range, "integer-out-of-range" },
  { error_kind::operand_overflow, "operand-overflow" },
  { error_kind::unknown_section_header, "unknown-section-header" },
  { error_kind::unknown_directive, "unknown-directive" },
  { error_kind::section_operands_ignored, "section-operands-ignored" },
  { error_kind::integer_truncated, "integer-truncated" },
  { error_kind::label_offset_truncated, "label-offset-truncated" },
})

struct assembler_error
{
  error_kind kind;

  // index of the offending instruction in source order, if it is tied to one
  std::optional<std::uint32_t> instruction;

  // label name, directive name, literal text or parser message
  std::string detail;

  source_range loc;
};

bool operator==(const assembler_error& lhs, const assembler_error& rhs);

/// Errors and warnings collected during one assembler run.
struct report
{
  void error(error_kind kind, std::optional<std::uint32_t> instruction,
             std::string detail = {}, source_range loc = {});
  void warn(error_kind kind, std::optional<std::uint32_t> instruction,
            std::string detail = {}, source_range loc = {});

  bool failed() const
  { return !errors.empty(); }

  bool has_error(error_kind kind) const;
  bool has_warning(error_kind kind) const;

  std::vector<assembler_error> errors;
  std::vector<assembler_error> warnings;
};

}
