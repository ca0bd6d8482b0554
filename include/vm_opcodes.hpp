#pragma once

#include <string_view>
#include <cstdint>

namespace pie
{

// Byte values must match what the execution engine decodes.
enum class op_code : std::uint8_t
{
  LOAD  = 0,
  ADD   = 1,
  SUB   = 2,
  MUL   = 3,
  DIV   = 4,
  HLT   = 5,
  JMP   = 6,
  JMPF  = 7,
  JMPB  = 8,
  EQ    = 9,
  NEQ   = 10,
  GTE   = 11,
  LTE   = 12,
  LT    = 13,
  GT    = 14,
  JMPE  = 15,
  NOP   = 16,
  ALOC  = 17,
  INC   = 18,
  DEC   = 19,
  IGL   = 100
};

constexpr op_code byte_to_opcode(unsigned char byte)
{
  switch(byte)
  {
  default:
    return op_code::IGL;
  case 0: case 1: case 2: case 3: case 4:
  case 5: case 6: case 7: case 8: case 9:
  case 10: case 11: case 12: case 13: case 14:
  case 15: case 16: case 17: case 18: case 19:
    return static_cast<op_code>(byte);
  }
}

constexpr unsigned char opcode_to_byte(op_code opc)
{ return static_cast<unsigned char>(opc); }

// Mnemonic lookup, unknown words yield IGL.
op_code mnemonic_to_opcode(std::string_view mnemonic);
std::string_view opcode_to_mnemonic(op_code opc);

}
