#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <encoder.hpp>
#include <reader.hpp>

#include <string>
#include <vector>

using namespace pie;

static instruction parse_one(std::string_view text)
{
  auto w = asm_reader::read<instruction>(text);

  REQUIRE(w.ok());
  REQUIRE(w.data.size() == 1);
  return w.data[0];
}

TEST_CASE( "opcodes", "[Opcodes]" ) {
  SECTION( "byte-values" ) {
    REQUIRE(opcode_to_byte(op_code::LOAD) == 0);
    REQUIRE(opcode_to_byte(op_code::HLT) == 5);
    REQUIRE(opcode_to_byte(op_code::JMPE) == 15);
    REQUIRE(opcode_to_byte(op_code::DEC) == 19);
    REQUIRE(opcode_to_byte(op_code::IGL) == 100);
  }

  SECTION( "unknown-bytes-are-illegal" ) {
    REQUIRE(byte_to_opcode(20) == op_code::IGL);
    REQUIRE(byte_to_opcode(255) == op_code::IGL);
    REQUIRE(byte_to_opcode(9) == op_code::EQ);
  }

  SECTION( "mnemonics" ) {
    for(unsigned char b = 0; b < 20; ++b)
      REQUIRE(mnemonic_to_opcode(opcode_to_mnemonic(byte_to_opcode(b))) == byte_to_opcode(b));
  }
}

TEST_CASE( "encoder", "[Encoder]" ) {
  symbol_table symbols;
  report rep;

  SECTION( "opcode-only-word" ) {
    auto bytes = encode_instruction(parse_one("hlt"), symbols, rep, 0);

    REQUIRE(!rep.failed());
    REQUIRE(bytes == std::vector<unsigned char>{ 5, 0, 0, 0 });
  }

  SECTION( "register-and-integer" ) {
    auto bytes = encode_instruction(parse_one("load $1 #500"), symbols, rep, 0);

    REQUIRE(!rep.failed());
    REQUIRE(bytes == std::vector<unsigned char>{ 0, 1, 0x01, 0xF4 });
  }

  SECTION( "three-registers" ) {
    auto bytes = encode_instruction(parse_one("add $0 $1 $2"), symbols, rep, 0);

    REQUIRE(!rep.failed());
    REQUIRE(bytes == std::vector<unsigned char>{ 1, 0, 1, 2 });
  }

  SECTION( "directives-emit-nothing" ) {
    auto bytes = encode_instruction(parse_one(".code"), symbols, rep, 0);

    REQUIRE(bytes.empty());
  }

  SECTION( "registers-round-trip" ) {
    for(int r = 0; r < 32; ++r)
    {
      auto bytes = encode_instruction(parse_one("inc $" + std::to_string(r)), symbols, rep, 0);

      REQUIRE(bytes.size() == word_size);
      auto w = decode_word(bytes.data());
      REQUIRE(w.opcode() == op_code::INC);
      REQUIRE(w.reg(0) == r);
    }
    REQUIRE(!rep.failed());
  }

  SECTION( "integers-round-trip" ) {
    bool all_equal = true;
    for(std::int32_t v = -32768; v <= 65535; ++v)
    {
      std::vector<unsigned char> out;
      encode_operand(token(token_kind::IntegerOperand, std::to_string(v)), symbols, rep, 0, out);

      if(out.size() != 2 || static_cast<std::uint16_t>(((out[0] << 8) | out[1])) != static_cast<std::uint16_t>(v))
        all_equal = false;
    }
    REQUIRE(all_equal);
    REQUIRE(!rep.failed());
    REQUIRE(rep.warnings.empty());
  }

  SECTION( "negative-integer" ) {
    auto bytes = encode_instruction(parse_one("load $0 #-2"), symbols, rep, 0);

    auto w = decode_word(bytes.data());
    REQUIRE(w.i16(1) == -2);
    REQUIRE(w.u16(1) == 0xFFFE);
  }

  SECTION( "sixteen-bit-value-in-last-slot" ) {
    auto bytes = encode_instruction(parse_one("load $7 #513"), symbols, rep, 0);

    auto w = decode_word(bytes.data());
    REQUIRE(w.reg(0) == 7);
    REQUIRE(w.u16(1) == 513);
    REQUIRE(w.reg(2) == 0x01);
  }

  SECTION( "integer-truncated" ) {
    auto bytes = encode_instruction(parse_one("load $0 #65536"), symbols, rep, 3);

    REQUIRE(!rep.failed());
    REQUIRE(rep.has_warning(error_kind::integer_truncated));
    REQUIRE(rep.warnings.front().instruction == std::optional<std::uint32_t>(3));
    REQUIRE(bytes == std::vector<unsigned char>{ 0, 0, 0, 0 });
  }

  SECTION( "integer-out-of-range" ) {
    encode_instruction(parse_one("load $0 #99999999999"), symbols, rep, 0);

    REQUIRE(rep.has_error(error_kind::integer_out_of_range));
  }

  SECTION( "label-resolution" ) {
    symbols.add(symbol("test", 0x0114));

    auto bytes = encode_instruction(parse_one("jmpe @test"), symbols, rep, 0);

    REQUIRE(!rep.failed());
    REQUIRE(bytes == std::vector<unsigned char>{ 15, 0x01, 0x14, 0 });
  }

  SECTION( "label-offset-truncated" ) {
    symbols.add(symbol("far", 0x10004));

    auto bytes = encode_instruction(parse_one("jmp @far"), symbols, rep, 0);

    REQUIRE(!rep.failed());
    REQUIRE(rep.has_warning(error_kind::label_offset_truncated));
    REQUIRE(bytes == std::vector<unsigned char>{ 6, 0x00, 0x04, 0 });
  }

  SECTION( "unresolved-label" ) {
    encode_instruction(parse_one("jmp @nowhere"), symbols, rep, 2);

    REQUIRE(rep.failed());
    REQUIRE(rep.errors.front().kind == error_kind::unresolved_label);
    REQUIRE(rep.errors.front().detail == "nowhere");
    REQUIRE(rep.errors.front().instruction == std::optional<std::uint32_t>(2));
  }

  SECTION( "string-operand" ) {
    encode_instruction(parse_one("load $0 'str'"), symbols, rep, 0);

    REQUIRE(rep.has_error(error_kind::string_in_operand_field));
  }

  SECTION( "opcode-operand" ) {
    std::vector<unsigned char> out;
    encode_operand(token(token_kind::Opcode, op_code::HLT, "hlt", source_range{}), symbols, rep, 0, out);

    REQUIRE(out.empty());
    REQUIRE(rep.has_error(error_kind::opcode_in_operand_field));
  }

  SECTION( "operand-overflow" ) {
    auto bytes = encode_instruction(parse_one("load #1 #2 #3"), symbols, rep, 0);

    REQUIRE(rep.has_error(error_kind::operand_overflow));
    REQUIRE(bytes.size() == word_size);
  }
}
