#pragma once

#include <diagnostic.hpp>

#include <fmt/format.h>

namespace pie
{
namespace diagnostic_db
{

#define db_entry(lv, name, txt) static const auto name = [](const source_range& range) \
{ return mk_diag::lv(range, __COUNTER__, txt); }

#define db_entry_arg(lv, name, txt) static const auto name = [](const source_range& range, auto t) \
{ return mk_diag::lv(range, __COUNTER__, fmt::format(FMT_STRING(txt), t)); }

namespace args
{

db_entry(error, unknown_arg, "Unknown command line argument!");
db_entry(error, emit_not_present, "Selected emit class is unknown!");
db_entry(error, num_cores_too_small, "Number of cores smaller than one.");
db_entry(warn, num_cores_too_large, "Number of cores bigger than the number of concurrent threads supported by the implementation.");
db_entry_arg(error, cannot_open_file, "Cannot open file \"{}\".");
db_entry_arg(error, cannot_write_file, "Cannot write to file \"{}\".");

}

namespace assembler
{

db_entry_arg(error, parse_error, "{}");
db_entry_arg(error, no_segment_declaration_found, "Label \"{}\" is declared before any segment, expected \".data\" or \".code\" first.");
db_entry(error, string_constant_declared_without_label, "String constant declared without a label.");
db_entry_arg(error, string_constant_expected, "\".asciiz\" for label \"{}\" expects a string constant.");
db_entry_arg(error, symbol_already_declared, "Symbol \"{}\" has already been declared.");
db_entry_arg(error, insufficient_sections, "Expected exactly two sections (\".data\" and \".code\"), instead found {}.");
db_entry_arg(error, unresolved_label, "Label \"{}\" was never declared.");
db_entry_arg(error, opcode_in_operand_field, "Opcode \"{}\" found in operand field.");
db_entry_arg(error, string_in_operand_field, "String {} may only follow \".asciiz\".");
db_entry_arg(error, integer_out_of_range, "\"{}\" does not fit into 32 bits.");
db_entry_arg(error, operand_overflow, "Operands of \"{}\" do not fit into a single word.");

db_entry_arg(warn, unknown_section_header, "Unknown section header \".{}\" is ignored.");
db_entry_arg(warn, unknown_directive, "Unknown directive \".{}\" is ignored.");
db_entry_arg(warn, section_operands_ignored, "Operands of section header \".{}\" are ignored.");
db_entry_arg(warn, integer_truncated, "\"{}\" is truncated to 16 bits.");
db_entry_arg(warn, label_offset_truncated, "Offset of label \"{}\" is truncated to 16 bits.");

}

#undef db_entry
#undef db_entry_arg

}
}
