#include <vm_opcodes.hpp>

#include <tsl/robin_map.h>

using namespace std::literals::string_view_literals;

namespace pie
{

static const auto mnemonic_map = tsl::robin_map<std::string_view, op_code>({
  { "load"sv,   op_code::LOAD },
  { "add"sv,    op_code::ADD },
  { "sub"sv,    op_code::SUB },
  { "mul"sv,    op_code::MUL },
  { "div"sv,    op_code::DIV },
  { "hlt"sv,    op_code::HLT },
  { "jmp"sv,    op_code::JMP },
  { "jmpf"sv,   op_code::JMPF },
  { "jmpb"sv,   op_code::JMPB },
  { "eq"sv,     op_code::EQ },
  { "neq"sv,    op_code::NEQ },
  { "gte"sv,    op_code::GTE },
  { "lte"sv,    op_code::LTE },
  { "lt"sv,     op_code::LT },
  { "gt"sv,     op_code::GT },
  { "jmpe"sv,   op_code::JMPE },
  { "nop"sv,    op_code::NOP },
  { "aloc"sv,   op_code::ALOC },
  { "inc"sv,    op_code::INC },
  { "dec"sv,    op_code::DEC },
  { "igl"sv,    op_code::IGL }
});

op_code mnemonic_to_opcode(std::string_view mnemonic)
{
  if(auto it = mnemonic_map.find(mnemonic); it != mnemonic_map.end())
    return it->second;
  return op_code::IGL;
}

std::string_view opcode_to_mnemonic(op_code opc)
{
  switch(opc)
  {
  default:
  case op_code::IGL:  return "igl";
  case op_code::LOAD: return "load";
  case op_code::ADD:  return "add";
  case op_code::SUB:  return "sub";
  case op_code::MUL:  return "mul";
  case op_code::DIV:  return "div";
  case op_code::HLT:  return "hlt";
  case op_code::JMP:  return "jmp";
  case op_code::JMPF: return "jmpf";
  case op_code::JMPB: return "jmpb";
  case op_code::EQ:   return "eq";
  case op_code::NEQ:  return "neq";
  case op_code::GTE:  return "gte";
  case op_code::LTE:  return "lte";
  case op_code::LT:   return "lt";
  case op_code::GT:   return "gt";
  case op_code::JMPE: return "jmpe";
  case op_code::NOP:  return "nop";
  case op_code::ALOC: return "aloc";
  case op_code::INC:  return "inc";
  case op_code::DEC:  return "dec";
  }
}

}
