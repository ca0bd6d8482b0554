#pragma once

#include <assembler_error.hpp>
#include <vm_opcodes.hpp>
#include <program.hpp>
#include <symbol.hpp>
#include <token.hpp>

#include <cassert>
#include <cstdint>
#include <vector>
#include <array>

namespace pie
{
  // every opcode instruction occupies exactly one word in the body
  static constexpr std::size_t word_size = 4;

  // Label offsets and integers are emitted as 16 bit values, anything above is truncated.
  static constexpr std::uint32_t max_encodable_offset = 0xFFFF;

  /**
   * Appends the bytes for a single operand to `out`:
   *  - register       -> 1 byte
   *  - integer, label -> 2 bytes, high byte first
   * Failures are recorded in `rep` and nothing is appended.
   */
  void encode_operand(const token& t, const symbol_table& symbols, report& rep,
                      std::uint32_t instr_idx, std::vector<unsigned char>& out);

  // One zero padded word for opcode instructions, nothing for directives.
  std::vector<unsigned char> encode_instruction(const instruction& instr, const symbol_table& symbols,
                                                report& rep, std::uint32_t instr_idx);

  /// Reads a word back the way the engine fetches it.
  struct decoded_word
  {
    op_code opcode() const
    { return byte_to_opcode(bytes[0]); }

    // operand slots are numbered from 0, i.e. slot 0 is byte 1 of the word
    std::uint8_t reg(std::size_t slot) const
    {
      assert(slot + 1 < word_size && "Register slot lies outside of the word.");
      return bytes[1 + slot];
    }

    // a 16 bit value spans two slots, so only slots 0 and 1 can start one
    std::uint16_t u16(std::size_t slot) const
    {
      assert(slot + 2 < word_size && "16 bit value would run past the end of the word.");
      return static_cast<std::uint16_t>((bytes[1 + slot] << 8) | bytes[2 + slot]);
    }

    std::int16_t i16(std::size_t slot) const
    { return static_cast<std::int16_t>(u16(slot)); }

    std::array<unsigned char, word_size> bytes;
  };

  decoded_word decode_word(const unsigned char* word);
}
