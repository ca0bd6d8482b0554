#include <token.hpp>

namespace pie
{

std::string_view kind_to_str(token_kind kind)
{
  switch(kind)
  {
  default:
  case token_kind::EndOfFile: return "EOF";
  case token_kind::Undef: return "Undefined";
  case token_kind::Opcode: return "Opcode";
  case token_kind::Register: return "Register";
  case token_kind::IntegerOperand: return "IntegerOperand";
  case token_kind::LabelDecl: return "LabelDecl";
  case token_kind::LabelUse: return "LabelUse";
  case token_kind::Directive: return "Directive";
  case token_kind::String: return "String";
  }
}

std::string token::to_source() const
{
  switch(kind)
  {
  default:
  case token_kind::Undef:
  case token_kind::EndOfFile:
  case token_kind::Opcode:
    return data;
  case token_kind::Register:
    return "$" + data;
  case token_kind::IntegerOperand:
    return "#" + data;
  case token_kind::LabelDecl:
    return data + ":";
  case token_kind::LabelUse:
    return "@" + data;
  case token_kind::Directive:
    return "." + data;
  case token_kind::String:
    return "'" + data + "'";
  }
}

bool operator==(const token& lhs, const token& rhs)
{
  return lhs.kind == rhs.kind && lhs.opc == rhs.opc && lhs.data == rhs.data;
}

bool operator!=(const token& lhs, const token& rhs)
{
  return !(lhs == rhs);
}

}
