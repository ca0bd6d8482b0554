#pragma once

#include <assembler_error.hpp>
#include <source_range.hpp>
#include <program.hpp>
#include <token.hpp>

#include <string_view>
#include <type_traits>
#include <optional>
#include <sstream>
#include <array>
#include <string>
#include <vector>

namespace pie
{

class base_reader
{
protected:
  base_reader(std::string_view text, std::string_view module);

  // yields the next char that is neither whitespace nor part of a comment, EOF at the end
  int getc();

  // next raw char on the current line without consuming it, '\n' at the end of the line
  int peekc() const;
protected:
  std::string module;
  std::istringstream is;

  std::string linebuf;

  std::size_t col;
  std::size_t row;
};

template<typename T>
struct read_result
{
  bool ok() const
  { return !failure.has_value(); }

  std::vector<T> data;

  // first grammar failure, the reader does not recover from it
  std::optional<assembler_error> failure;
};

/**
 * Tokenizer and recursive descent reader for the assembly language:
 *
 *   program     := instruction+
 *   instruction := [label ':'] (opcode | '.' directive) operand{0,3}
 *   operand     := '#' integer | '@' label | '$' register | '\'' string '\''
 *
 * Whitespace (newlines included) only separates tokens, `;` starts a comment
 * running to the end of the line.
 */
class asm_reader : base_reader
{
public:
  static constexpr std::size_t lookahead_size = 1;

  template<typename T>
  static read_result<T> read(std::string_view text, std::string_view module = "#TXT#")
  { static_assert(!std::is_same_v<T, T>, "unimplemented"); return {}; }

private:
  asm_reader(std::string_view text, std::string_view module) : base_reader(text, module)
  {
    for(std::size_t i = 0; i < next_toks.size(); ++i)
      consume();

    // need one additional consume to initialize `current`
    consume();
  }

  token gett();

  void consume();

  // keeps whichever failure comes first in the source
  void fail(std::string message, const source_range& loc);
private:
  instruction parse_instruction();
  void parse_operands(instruction& instr);

  std::string read_while(bool (*pred)(int));
  source_range range_from(std::size_t beg_col, std::size_t beg_row) const;
private:
  token old;
  token current;
  std::array<token, lookahead_size> next_toks;

  std::optional<assembler_error> failure;
};

template<>
read_result<token> asm_reader::read<token>(std::string_view text, std::string_view module);

template<>
read_result<instruction> asm_reader::read<instruction>(std::string_view text, std::string_view module);

}
