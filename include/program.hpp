#pragma once

#include <assembler_error.hpp>
#include <symbol.hpp>
#include <token.hpp>

#include <optional>
#include <vector>
#include <string>
#include <utility>

namespace pie
{
  /// One logical source line: `[label:] (opcode | .directive) [operand]{0,3}`.
  struct instruction
  {
    static constexpr std::size_t max_operands = 3;

    bool is_label() const
    { return lab.has_value(); }

    bool is_opcode() const
    { return op.has_value(); }

    bool is_directive() const
    { return dir.has_value(); }

    bool has_operands() const
    { return !args.empty(); }

    std::optional<std::string> label_name() const;
    std::optional<std::string> directive_name() const;

    // contents of the first operand if it is a string literal
    std::optional<std::string> string_constant() const;

    std::optional<token> lab;
    std::optional<token> op;
    std::optional<token> dir;
    std::vector<token> args;

    source_range loc;
  };

  bool operator==(const instruction& lhs, const instruction& rhs);

  struct program
  {
    program(std::vector<instruction> instr) : instructions(std::move(instr))
    {  }

    program() : instructions()
    {  }

    // words of all opcode instructions in source order, no validation happens here
    std::vector<unsigned char> to_u8_vec(const symbol_table& symbols, report& rep) const;

    std::vector<instruction> instructions;
  };
}
