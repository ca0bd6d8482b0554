#pragma once

#include <assembler_error.hpp>
#include <program.hpp>
#include <symbol.hpp>

#include <string_view>
#include <optional>
#include <cstdint>
#include <vector>
#include <array>

namespace pie
{
  // "-21-"
  static constexpr std::array<unsigned char, 4> pie_header_prefix { 45, 50, 49, 45 };

  // index of the last header byte, the padding runs up to and including it
  static constexpr std::size_t pie_header_last_byte = 64;

  // the body starts right after the header
  static constexpr std::size_t pie_header_length = pie_header_last_byte + 1;

  enum class assembler_phase : std::uint8_t
  {
    first,
    second
  };

  enum class section_kind : std::uint8_t
  {
    data,
    code,
    unknown
  };

  section_kind section_from_name(std::string_view name);
  std::string_view section_to_name(section_kind kind);

  struct section
  {
    section_kind kind;
    std::uint32_t starting_instruction;
  };

  /// Everything one run mutates. Moved from phase one into phase two.
  struct assembler_state
  {
    assembler_phase phase { assembler_phase::first };

    symbol_table symbols;

    // read-only data segment and its write cursor
    std::vector<unsigned char> ro;
    std::uint32_t ro_offset { 0 };

    std::vector<unsigned char> bytecode;

    std::vector<section> sections;
    std::optional<section> current_section;

    std::uint32_t current_instruction { 0 };

    report diagnostics;

    // REPL lines neither need sections nor a header
    bool fragment { false };
  };

  /// Result of one run. `bytes` is empty whenever `errors` is not.
  struct assembly
  {
    bool ok() const
    { return errors.empty(); }

    std::vector<unsigned char> bytes;

    std::vector<assembler_error> errors;
    std::vector<assembler_error> warnings;

    symbol_table symbols;
    std::vector<unsigned char> read_only;
    std::vector<section> sections;
  };

  struct assembler
  {
    // full two pass run producing header + body
    static assembly assemble(std::string_view source, std::string_view module = "#TXT#");

    // body words only, for single REPL lines
    static assembly assemble_line(std::string_view line);

    static std::vector<unsigned char> pie_header();

  private:
    static assembly run(std::string_view source, std::string_view module, bool fragment);

    static assembler_state phase_one(const program& prog, assembler_state&& st);
    static assembler_state phase_two(const program& prog, assembler_state&& st);

    // returns whether the label was entered into the symbol table
    static bool process_label_declaration(const instruction& instr, assembler_state& st);
    static void process_directive(const instruction& instr, bool label_registered, assembler_state& st);
    static void process_section_header(const instruction& instr, section_kind kind, assembler_state& st);
    static void handle_asciiz(const instruction& instr, bool label_registered, assembler_state& st);

    static assembly finish(assembler_state&& st, std::vector<unsigned char> bytes);
  };
}
