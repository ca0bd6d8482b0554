#pragma once

#include <source_range.hpp>
#include <vm_opcodes.hpp>

#include <string_view>
#include <cstdint>
#include <string>
#include <utility>

namespace pie
{
  enum class token_kind : std::int_fast8_t
  {
    Undef,
    Opcode,
    Register,
    IntegerOperand,
    LabelDecl,
    LabelUse,
    Directive,
    String,
    EndOfFile = -1,
  };

  std::string_view kind_to_str(token_kind kind);

  class token
  {
  public:
    token(token_kind kind, op_code opc, std::string data, source_range range)
      : kind(kind), opc(opc), data(std::move(data)), loc(std::move(range))
    {  }

    token(token_kind kind, std::string data, source_range range = {})
      : kind(kind), opc(op_code::IGL), data(std::move(data)), loc(std::move(range))
    {  }

    token()
      : kind(token_kind::Undef), opc(op_code::IGL), data(), loc()
    {  }

    // textual form as it would appear in source, e.g. "$3" or "@loop"
    std::string to_source() const;

    token_kind kind;
    op_code opc;

    // mnemonic, register digits, literal text, label or directive name, string contents
    std::string data;
    source_range loc;
  };

  // structural, the location does not take part
  bool operator==(const token& lhs, const token& rhs);
  bool operator!=(const token& lhs, const token& rhs);
}
