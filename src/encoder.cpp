#include <encoder.hpp>

#include <algorithm>
#include <charconv>
#include <limits>

namespace pie
{

static void push_u16(std::uint16_t value, std::vector<unsigned char>& out)
{
  unsigned char first  = (value & 0b11111111'00000000) >> 8;
  unsigned char second = value & 0b11111111;

  out.push_back(first);
  out.push_back(second);
}

// literal text as kept by the reader, i.e. without '#' but with an optional sign
static std::optional<std::int32_t> parse_integer(std::string_view text)
{
  if(!text.empty() && text.front() == '+')
    text.remove_prefix(1);

  std::int32_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if(ec != std::errc() || ptr != text.data() + text.size())
    return std::nullopt;
  return value;
}

void encode_operand(const token& t, const symbol_table& symbols, report& rep,
                    std::uint32_t instr_idx, std::vector<unsigned char>& out)
{
  switch(t.kind)
  {
  default:
  case token_kind::Opcode:
    rep.error(error_kind::opcode_in_operand_field, instr_idx, t.to_source(), t.loc);
    break;

  case token_kind::String:
    rep.error(error_kind::string_in_operand_field, instr_idx, t.to_source(), t.loc);
    break;

  case token_kind::Register:
    {
      std::uint8_t regnum = 0;
      auto [ptr, ec] = std::from_chars(t.data.data(), t.data.data() + t.data.size(), regnum);
      if(ec != std::errc() || ptr != t.data.data() + t.data.size())
      {
        rep.error(error_kind::integer_out_of_range, instr_idx, t.to_source(), t.loc);
        break;
      }
      out.push_back(regnum);
    } break;

  case token_kind::IntegerOperand:
    {
      auto value = parse_integer(t.data);
      if(!value)
      {
        rep.error(error_kind::integer_out_of_range, instr_idx, t.to_source(), t.loc);
        break;
      }
      if(*value < std::numeric_limits<std::int16_t>::min() || *value > std::numeric_limits<std::uint16_t>::max())
        rep.warn(error_kind::integer_truncated, instr_idx, t.to_source(), t.loc);

      push_u16(static_cast<std::uint16_t>(*value), out);
    } break;

  case token_kind::LabelUse:
    {
      auto offset = symbols.lookup(t.data);
      if(!offset)
      {
        rep.error(error_kind::unresolved_label, instr_idx, t.data, t.loc);
        break;
      }
      if(*offset > max_encodable_offset)
        rep.warn(error_kind::label_offset_truncated, instr_idx, t.data, t.loc);

      push_u16(static_cast<std::uint16_t>(*offset & max_encodable_offset), out);
    } break;
  }
}

std::vector<unsigned char> encode_instruction(const instruction& instr, const symbol_table& symbols,
                                              report& rep, std::uint32_t instr_idx)
{
  if(!instr.op)
    return {};

  std::vector<unsigned char> to_return { opcode_to_byte(instr.op->opc) };

  for(auto& t : instr.args)
    encode_operand(t, symbols, rep, instr_idx, to_return);

  if(to_return.size() > word_size)
  {
    rep.error(error_kind::operand_overflow, instr_idx, std::string(opcode_to_mnemonic(instr.op->opc)), instr.loc);
    to_return.resize(word_size);
  }

  // pad to full word
  to_return.resize(word_size, 0);
  return to_return;
}

decoded_word decode_word(const unsigned char* word)
{
  decoded_word w;
  std::copy(word, word + word_size, w.bytes.begin());
  return w;
}

}
