#include <reader.hpp>
#include <vm_opcodes.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cctype>
#include <tuple>

namespace pie
{

constexpr static int eof = std::char_traits<char>::eof();

static bool is_digit(int ch)
{ return ch != eof && std::isdigit(ch); }

static bool is_alpha(int ch)
{ return ch != eof && std::isalpha(ch); }

static bool is_ident(int ch)
{ return ch != eof && (std::isalnum(ch) || ch == '_'); }

static bool is_not_quote(int ch)
{ return ch != '\'' && ch != '\n'; }

base_reader::base_reader(std::string_view text, std::string_view module)
  : module(module), is(std::string(text)), linebuf(), col(0), row(0)
{  }

int base_reader::getc()
{
  for(;;)
  {
    if(col >= linebuf.size())
    {
      if(!std::getline(is, linebuf))
      {
        linebuf.clear();
        col = 0;
        return eof;
      }
      row++;
      col = 0;
      continue;
    }
    const int ch = static_cast<unsigned char>(linebuf[col++]);

    // comments run until the end of the line
    if(ch == ';')
    {
      col = linebuf.size();
      continue;
    }
    if(std::isspace(ch))
      continue;

    return ch;
  }
}

int base_reader::peekc() const
{
  if(col >= linebuf.size())
    return '\n';
  return static_cast<unsigned char>(linebuf[col]);
}

std::string asm_reader::read_while(bool (*pred)(int))
{
  std::string str;
  while(col < linebuf.size() && pred(static_cast<unsigned char>(linebuf[col])))
    str.push_back(linebuf[col++]);
  return str;
}

source_range asm_reader::range_from(std::size_t beg_col, std::size_t beg_row) const
{
  return source_range { module, beg_col, beg_row, col, row };
}

void asm_reader::fail(std::string message, const source_range& loc)
{
  if(failure && std::tie(failure->loc.row_beg, failure->loc.column_beg) <= std::tie(loc.row_beg, loc.column_beg))
    return;

  failure = assembler_error { error_kind::parse_error, std::nullopt, std::move(message), loc };
}

///// Tokenization

token asm_reader::gett()
{
  const int ch = getc();
  const std::size_t beg_row = row;
  const std::size_t beg_col = col; // 1-based column of `ch`

  if(ch == eof)
    return token(token_kind::EndOfFile, "", source_range { module, col + 1, row, col + 1, row });

  switch(ch)
  {
  default:
    {
      std::string bad;
      bad.push_back(static_cast<char>(ch));
      bad += read_while([](int c) { return c != eof && !std::isspace(c); });

      fail(fmt::format("Can not tokenize \"{}\".", bad), range_from(beg_col, beg_row));
    } break;

  case '$':
    {
      auto digits = read_while(is_digit);
      if(digits.empty() || is_ident(peekc()))
      {
        fail(fmt::format("Register expects digits after \"$\", instead got \"${}\".", digits + read_while(is_ident)),
             range_from(beg_col, beg_row));
        break;
      }
      unsigned int regnum = 0;
      auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), regnum);
      if(ec != std::errc() || ptr != digits.data() + digits.size() || regnum > 255)
      {
        fail(fmt::format("Register \"${}\" does not fit into a byte.", digits), range_from(beg_col, beg_row));
        break;
      }
      return token(token_kind::Register, op_code::IGL, digits, range_from(beg_col, beg_row));
    }

  case '#':
    {
      std::string literal;
      if(peekc() == '-' || peekc() == '+')
        literal.push_back(linebuf[col++]);

      auto digits = read_while(is_digit);
      if(digits.empty() || is_ident(peekc()))
      {
        fail(fmt::format("\"#{}\" is not a number.", literal + digits + read_while(is_ident)),
             range_from(beg_col, beg_row));
        break;
      }
      // range checks happen when the literal is encoded
      return token(token_kind::IntegerOperand, op_code::IGL, literal + digits, range_from(beg_col, beg_row));
    }

  case '@':
    {
      auto name = read_while(is_ident);
      if(name.empty())
      {
        fail("Label usage expects a name after \"@\".", range_from(beg_col, beg_row));
        break;
      }
      return token(token_kind::LabelUse, op_code::IGL, name, range_from(beg_col, beg_row));
    }

  case '.':
    {
      auto name = read_while(is_alpha);
      if(name.empty() || is_ident(peekc()))
      {
        fail(fmt::format("Directive \".{}\" must only consist of letters.", name + read_while(is_ident)),
             range_from(beg_col, beg_row));
        break;
      }
      return token(token_kind::Directive, op_code::IGL, name, range_from(beg_col, beg_row));
    }

  case '\'':
    {
      auto contents = read_while(is_not_quote);
      if(col >= linebuf.size() || linebuf[col] != '\'')
      {
        fail(fmt::format("Unterminated string literal \"'{}\".", contents), range_from(beg_col, beg_row));
        break;
      }
      ++col; // closing quote
      return token(token_kind::String, op_code::IGL, contents, range_from(beg_col, beg_row));
    }

  case 'a': case 'b': case 'c': case 'd': case 'e': case 'f': case 'g': case 'h': case 'i':
  case 'j': case 'k': case 'l': case 'm': case 'n': case 'o': case 'p': case 'q': case 'r':
  case 's': case 't': case 'u': case 'v': case 'w': case 'x': case 'y': case 'z':
  case 'A': case 'B': case 'C': case 'D': case 'E': case 'F': case 'G': case 'H': case 'I':
  case 'J': case 'K': case 'L': case 'M': case 'N': case 'O': case 'P': case 'Q': case 'R':
  case 'S': case 'T': case 'U': case 'V': case 'W': case 'X': case 'Y': case 'Z':
  case '0': case '1': case '2': case '3': case '4': case '5': case '6': case '7': case '8': case '9':
  case '_':
    {
      std::string name;
      name.push_back(static_cast<char>(ch));
      name += read_while(is_ident);

      // labeldef
      if(peekc() == ':')
      {
        ++col;
        return token(token_kind::LabelDecl, op_code::IGL, name, range_from(beg_col, beg_row));
      }
      // otherwise only an opcode remains, unknown mnemonics are IGL
      if(std::all_of(name.begin(), name.end(), [](char c) { return is_alpha(static_cast<unsigned char>(c)); }))
        return token(token_kind::Opcode, mnemonic_to_opcode(name), name, range_from(beg_col, beg_row));

      fail(fmt::format("Can not tokenize \"{}\".", name), range_from(beg_col, beg_row));
    } break;
  }
  return token(token_kind::Undef, "", range_from(beg_col, beg_row));
}

void asm_reader::consume()
{
  old = current;
  current = next_toks[0];

  for(std::size_t i = 0, j = 1; j < next_toks.size(); ++i, ++j)
    std::swap(next_toks[i], next_toks[j]);

  // stop tokenizing past the first failure
  if(failure)
    next_toks.back() = token(token_kind::EndOfFile, "", current.loc);
  else
    next_toks.back() = gett();
}

///// Parsing

void asm_reader::parse_operands(instruction& instr)
{
  while(instr.args.size() < instruction::max_operands)
  {
    switch(current.kind)
    {
    default:
      return;

    // same order as the alternatives of the grammar
    case token_kind::IntegerOperand:
    case token_kind::LabelUse:
    case token_kind::Register:
    case token_kind::String:
      {
        instr.loc += current.loc;
        instr.args.push_back(current);
        consume();
      } break;
    }
  }
}

instruction asm_reader::parse_instruction()
{
  instruction instr;
  instr.loc = current.loc;

  if(current.kind == token_kind::LabelDecl)
  {
    instr.lab = current;
    consume();
  }

  switch(current.kind)
  {
  default:
    {
      fail(fmt::format("Expected an opcode or a directive, instead got \"{}\".", current.to_source()), current.loc);
      return instr;
    }

  case token_kind::EndOfFile:
    {
      fail(fmt::format("Label \"{}\" must be followed by an opcode or a directive.", instr.lab ? instr.lab->data : ""),
           instr.loc);
      return instr;
    }

  case token_kind::Opcode:
    {
      instr.op = current;
    } break;

  case token_kind::Directive:
    {
      instr.dir = current;
    } break;
  }
  instr.loc += current.loc;
  consume();

  parse_operands(instr);
  return instr;
}

template<>
read_result<token> asm_reader::read<token>(std::string_view text, std::string_view module)
{
  asm_reader r(text, module);

  read_result<token> res;
  while(r.current.kind != token_kind::EndOfFile && !r.failure)
  {
    res.data.push_back(r.current);
    r.consume();
  }
  res.failure = r.failure;
  return res;
}

template<>
read_result<instruction> asm_reader::read<instruction>(std::string_view text, std::string_view module)
{
  asm_reader r(text, module);

  read_result<instruction> res;
  while(r.current.kind != token_kind::EndOfFile && !r.failure)
  {
    res.data.emplace_back(r.parse_instruction());
  }
  if(res.data.empty() && !r.failure)
    r.fail("Module must not be empty.", r.current.loc);

  res.failure = r.failure;
  if(res.failure)
    res.data.clear();
  return res;
}

}
