#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <diagnostic.hpp>
#include <assembler.hpp>
#include <encoder.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace pie;

static std::vector<unsigned char> body_of(const assembly& a)
{
  REQUIRE(a.bytes.size() >= pie_header_length);
  return std::vector<unsigned char>(a.bytes.begin() + pie_header_length, a.bytes.end());
}

static std::vector<unsigned char> word_at(const std::vector<unsigned char>& body, std::size_t idx)
{
  REQUIRE(body.size() >= (idx + 1) * word_size);
  return std::vector<unsigned char>(body.begin() + idx * word_size, body.begin() + (idx + 1) * word_size);
}

TEST_CASE( "PIE header", "[Header]" ) {
  auto header = assembler::pie_header();

  REQUIRE(header.size() == pie_header_length);
  REQUIRE(header.size() == 65);
  REQUIRE(std::equal(pie_header_prefix.begin(), pie_header_prefix.end(), header.begin()));
  REQUIRE(std::all_of(header.begin() + pie_header_prefix.size(), header.end(), [](unsigned char c) { return c == 0; }));
}

TEST_CASE( "successful assembly", "[Assembler]" ) {

  SECTION( "deterministic" ) {
    const std::string src = ".data\nmsg: .asciiz 'Hi'\n.code\nload $0 #1\njmp @msg\nhlt";

    auto a = assembler::assemble(src);
    auto b = assembler::assemble(src);

    REQUIRE(a.ok());
    REQUIRE(a.bytes == b.bytes);
  }

  SECTION( "header-and-alignment" ) {
    auto a = assembler::assemble(".data\n.code\nload $0 #100\nadd $0 $1 $2\nhlt");

    REQUIRE(a.ok());
    REQUIRE(a.warnings.empty());
    REQUIRE(std::equal(pie_header_prefix.begin(), pie_header_prefix.end(), a.bytes.begin()));
    REQUIRE(std::all_of(a.bytes.begin() + 4, a.bytes.begin() + pie_header_length, [](unsigned char c) { return c == 0; }));

    auto body = body_of(a);
    REQUIRE(body.size() % word_size == 0);
    REQUIRE(body.size() == 3 * word_size);
    REQUIRE(word_at(body, 0) == std::vector<unsigned char>{ 0, 0, 0, 100 });
    REQUIRE(word_at(body, 1) == std::vector<unsigned char>{ 1, 0, 1, 2 });
    REQUIRE(word_at(body, 2) == std::vector<unsigned char>{ 5, 0, 0, 0 });
  }

  SECTION( "label-resolution" ) {
    auto a = assembler::assemble(".data\n.code\nhello: inc $0\njmp @hello\nhlt");

    REQUIRE(a.ok());
    // directives occupy an instruction slot as well
    REQUIRE(a.symbols.lookup("hello") == std::optional<std::uint32_t>(2 * word_size));

    auto jmp = decode_word(word_at(body_of(a), 1).data());
    REQUIRE(jmp.opcode() == op_code::JMP);
    REQUIRE(jmp.u16(0) == 8);
  }

  SECTION( "forward-reference" ) {
    auto a = assembler::assemble(".data\n.code\njmp @end\nnop\nend: hlt");

    REQUIRE(a.ok());
    auto jmp = decode_word(word_at(body_of(a), 0).data());
    REQUIRE(jmp.u16(0) == 4 * word_size);
  }

  SECTION( "string-constant" ) {
    auto a = assembler::assemble(".data\nmsg: .asciiz 'Hi'\n.code\nhlt");

    REQUIRE(a.ok());
    REQUIRE(a.symbols.lookup("msg") == std::optional<std::uint32_t>(0));
    REQUIRE(a.read_only == std::vector<unsigned char>{ 'H', 'i', 0 });
    REQUIRE(a.bytes.size() == pie_header_length + word_size);
  }

  SECTION( "second-string-constant" ) {
    auto a = assembler::assemble(".data\na: .asciiz 'Hi'\nb: .asciiz 'there'\n.code\nhlt");

    REQUIRE(a.ok());
    REQUIRE(a.symbols.lookup("b") == std::optional<std::uint32_t>(3));
    REQUIRE(a.read_only.size() == 9);
  }

  SECTION( "concrete-scenario" ) {
    auto a = assembler::assemble(".data\n.code\n"
        "load $0 #100\nload $1 #1\nload $2 #0\ntest: inc $0\nneq $0 $2\njmpe @test\nhlt");

    REQUIRE(a.ok());
    REQUIRE(a.bytes.size() == pie_header_length + 28);
    REQUIRE(a.bytes.size() == 93);

    auto body = body_of(a);
    REQUIRE(a.symbols.lookup("test") == std::optional<std::uint32_t>(20));
    REQUIRE(word_at(body, 3) == std::vector<unsigned char>{ 18, 0, 0, 0 });
    REQUIRE(word_at(body, 5) == std::vector<unsigned char>{ 15, 0x00, 0x14, 0 });
    REQUIRE(word_at(body, 6) == std::vector<unsigned char>{ 5, 0, 0, 0 });
  }

  SECTION( "unknown-directives-warn" ) {
    auto a = assembler::assemble(".data\n.bss\n.word #1\n.code\nhlt");

    REQUIRE(a.ok());
    REQUIRE(a.warnings.size() == 2);
    REQUIRE(a.warnings[0].kind == error_kind::unknown_section_header);
    REQUIRE(a.warnings[0].detail == "bss");
    REQUIRE(a.warnings[1].kind == error_kind::unknown_directive);
    REQUIRE(a.warnings[1].instruction == std::optional<std::uint32_t>(2));
  }

  SECTION( "section-operands-ignored" ) {
    auto a = assembler::assemble(".data #1\n.code\nhlt");

    REQUIRE(a.ok());
    REQUIRE(a.warnings.size() == 1);
    REQUIRE(a.warnings[0].kind == error_kind::section_operands_ignored);
  }
}

TEST_CASE( "failing assembly", "[Assembler]" ) {

  SECTION( "parse-error" ) {
    auto a = assembler::assemble(".data\n.code\nload $x", "mod");

    REQUIRE(!a.ok());
    REQUIRE(a.bytes.empty());
    REQUIRE(a.errors.size() == 1);
    REQUIRE(a.errors[0].kind == error_kind::parse_error);
    REQUIRE(a.errors[0].loc.to_string() == "mod:3:6");
  }

  SECTION( "duplicate-symbol" ) {
    auto a = assembler::assemble(".data\n.code\na: hlt\na: nop");

    REQUIRE(!a.ok());
    REQUIRE(a.bytes.empty());
    REQUIRE(a.errors.size() == 1);
    REQUIRE(a.errors[0].kind == error_kind::symbol_already_declared);
    REQUIRE(a.errors[0].detail == "a");
    REQUIRE(a.errors[0].instruction == std::optional<std::uint32_t>(3));
  }

  SECTION( "errors-are-batched" ) {
    auto a = assembler::assemble(".data\n.code\na: hlt\na: nop\nb: hlt\nb: nop\n.asciiz 'x'");

    REQUIRE(a.errors.size() == 3);
    REQUIRE(a.errors[0].kind == error_kind::symbol_already_declared);
    REQUIRE(a.errors[1].kind == error_kind::symbol_already_declared);
    REQUIRE(a.errors[2].kind == error_kind::string_constant_declared_without_label);
    REQUIRE(a.bytes.empty());
  }

  SECTION( "section-counts" ) {
    for(auto src : { "hlt", ".code\nhlt", ".data\n.code\n.code\nhlt" })
    {
      auto a = assembler::assemble(src);

      REQUIRE(!a.ok());
      REQUIRE(a.bytes.empty());
      REQUIRE(a.errors.size() == 1);
      REQUIRE(a.errors[0].kind == error_kind::insufficient_sections);
    }
    REQUIRE(assembler::assemble(".code\nhlt").errors[0].detail == "1");
    REQUIRE(assembler::assemble(".data\n.code\nhlt").ok());
  }

  SECTION( "label-before-any-section" ) {
    auto a = assembler::assemble("start: hlt\n.data\n.code");

    REQUIRE(a.errors.size() == 1);
    REQUIRE(a.errors[0].kind == error_kind::no_segment_declaration_found);
    REQUIRE(a.errors[0].detail == "start");
  }

  SECTION( "string-without-label" ) {
    auto a = assembler::assemble(".data\n.asciiz 'Hi'\n.code\nhlt");

    REQUIRE(a.errors.size() == 1);
    REQUIRE(a.errors[0].kind == error_kind::string_constant_declared_without_label);
  }

  SECTION( "asciiz-without-string" ) {
    auto a = assembler::assemble(".data\nmsg: .asciiz #1\n.code\nhlt");

    REQUIRE(a.errors.size() == 1);
    REQUIRE(a.errors[0].kind == error_kind::string_constant_expected);
  }

  SECTION( "unresolved-label" ) {
    auto a = assembler::assemble(".data\n.code\njmp @nowhere\nhlt");

    REQUIRE(!a.ok());
    REQUIRE(a.bytes.empty());
    REQUIRE(a.errors.size() == 1);
    REQUIRE(a.errors[0].kind == error_kind::unresolved_label);
    REQUIRE(a.errors[0].instruction == std::optional<std::uint32_t>(2));
  }

  SECTION( "errors-become-diagnostics" ) {
    diagnostic.reset();

    auto a = assembler::assemble(".data\n.code\njmp @nowhere\nhlt");
    diagnostic <<= a.errors;

    REQUIRE(!diagnostic.empty());
    REQUIRE(diagnostic.error_code() == 1);
    diagnostic.reset();
  }
}

TEST_CASE( "line assembly", "[Assembler]" ) {

  SECTION( "single-word" ) {
    auto a = assembler::assemble_line("load $0 #100");

    REQUIRE(a.ok());
    REQUIRE(a.bytes == std::vector<unsigned char>{ 0, 0, 0, 100 });
  }

  SECTION( "directive-only" ) {
    auto a = assembler::assemble_line(".data");

    REQUIRE(a.ok());
    REQUIRE(a.bytes.empty());
  }

  SECTION( "label-without-section" ) {
    auto a = assembler::assemble_line("loop: jmp @loop");

    REQUIRE(a.ok());
    REQUIRE(a.bytes == std::vector<unsigned char>{ 6, 0, 0, 0 });
  }

  SECTION( "label-of-another-line" ) {
    auto a = assembler::assemble_line("jmp @loop");

    REQUIRE(!a.ok());
    REQUIRE(a.errors[0].kind == error_kind::unresolved_label);
  }
}
