#include <diagnostic.hpp>
#include <compiler.hpp>
#include <encoder.hpp>
#include <reader.hpp>
#include <repl.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <fstream>
#include <sstream>

namespace pie
{

template<typename T>
std::string base_repl<T>::prompt_line()
{
  std::string line;
  std::getline(*in, line);
  return line;
}

template<typename T>
bool base_repl<T>::prompt_yes_no()
{
  std::string answer;
  do
  {
    answer = prompt_line();
  }
  while(!in->eof() && !(answer == "Y" || answer == "y" || answer.empty() || answer == "yes" || answer == "YES"
     || answer == "Yes" || answer == "n" || answer == "N"  || answer == "no"  || answer == "No"
     || answer == "NO"));

  return answer == "Y"   || answer == "y"   || answer.empty()
      || answer == "yes" || answer == "YES" || answer == "Yes";
}

template<typename T>
void base_repl<T>::quit()
{ stopped = true; }

template<typename T>
void base_repl<T>::history()
{
  for(const auto& cmd : commands)
    fmt::print(out, "{}\n", cmd);
}

template<typename T>
void base_repl<T>::write(const std::vector<std::string>& source)
{
  fmt::print(out, "File: ");

  std::string filepath = prompt_line();
  if(filepath.empty())
    return;

  fmt::print(out, "\nStore REPL commands? Y/n: ");
  const bool store_cmds = prompt_yes_no();

  std::fstream file(filepath, std::ios::out);
  if(!file.is_open())
  {
    fmt::print(out, "\nCannot write to \"{}\".\n", filepath);
    return;
  }
  for(const auto& str : store_cmds ? commands : source)
  {
    if(str.empty())
      continue;

    file << str << "\n";
  }

  fmt::print(out, "\nState written to \"{}\".\n", filepath);
}

template struct base_repl<repl::REPL>;


namespace repl
{
  REPL::REPL(std::string_view module, std::istream& in, std::FILE* out)
    : base_repl(in, out)
  {
    if(module == "STDIN")
      return;

    auto src = read_module(module);
    if(!src)
    {
      fmt::print(out, "Cannot open \"{}\".\n", module);
      return;
    }
    std::istringstream ss(*src);
    for(std::string line; std::getline(ss, line); )
      process_line(line);
  }

  void REPL::run_impl()
  {
    fmt::print(out, ">> pieasm, type 'quit to leave.\n");

    while(!stopped)
    {
      fmt::print(out, "(pie) > ");

      std::string line = prompt_line();

      process_command(line);
    }
  }

  void REPL::process_command(const std::string& line)
  {
    // a last line without newline still counts
    if(line == "'quit" || (line.empty() && in->eof()))
      quit();
    else if(line == "'history")
      history();
    else if(line == "'source")
      source_listing();
    else if(line == "'assemble")
      assemble();
    else if(line == "'program")
      program();
    else if(line == "'symbols")
      symbols();
    else if(line == "'clear")
    {
      buffer.clear();
      pending_label.reset();
      last.reset();
    }
    else if(line == "'load")
      load();
    else if(line == "'write")
      write(buffer);
    else if(!line.empty() && line.front() == '\'')
    {
      fmt::print(out, "Unknown command \"{}\".\n", line);
      return;
    }
    else
    {
      process_line(line);
      return;
    }
    commands.emplace_back(line);
  }

  void REPL::flush_diagnostics()
  {
    if(!diagnostic.empty())
    {
      diagnostic.print(out);
      diagnostic.discard();
    }
  }

  void REPL::process_line(const std::string& line)
  {
    const auto toks = asm_reader::read<token>(line, "REPL");

    // blank lines and comments carry no instruction
    if(toks.ok() && toks.data.empty())
      return;

    // a label may stand on its own line, it belongs to the next instruction
    if(!pending_label && toks.ok() && toks.data.size() == 1 && toks.data[0].kind == token_kind::LabelDecl)
    {
      pending_label = line;
      buffer.emplace_back(line);
      commands.emplace_back(line);
      return;
    }

    const std::string text = pending_label ? *pending_label + "\n" + line : line;

    auto w = asm_reader::read<instruction>(text, "REPL");
    if(!w.ok())
    {
      diagnostic <<= mk_diag::from(*w.failure);
      flush_diagnostics();

      if(failed_inputs++ > 1)
        fmt::print(out, "Type \"'quit\" or hit Ctrl-D to quit.\n");
      return;
    }
    pending_label.reset();
    buffer.emplace_back(line);
    commands.emplace_back(line);

    auto result = assembler::assemble_line(text);
    diagnostic <<= result.warnings;
    if(!result.ok())
    {
      // labels of other lines resolve on 'assemble
      std::vector<assembler_error> errs;
      std::copy_if(result.errors.begin(), result.errors.end(), std::back_inserter(errs),
          [](auto& e) { return e.kind != error_kind::unresolved_label; });
      diagnostic <<= errs;
    }
    flush_diagnostics();

    for(std::size_t off = 0; off + word_size <= result.bytes.size(); off += word_size)
    {
      auto wd = decode_word(result.bytes.data() + off);
      fmt::print(out, "{:02x} {:02x} {:02x} {:02x}    {}\n",
          wd.bytes[0], wd.bytes[1], wd.bytes[2], wd.bytes[3], opcode_to_mnemonic(wd.opcode()));
    }
  }

  void REPL::source_listing()
  {
    for(std::size_t i = 0; i < buffer.size(); ++i)
      fmt::print(out, "{:>4}  {}\n", i + 1, buffer[i]);
  }

  void REPL::assemble()
  {
    std::string src;
    for(auto& l : buffer)
    {
      src += l;
      src += '\n';
    }
    auto result = assembler::assemble(src, "REPL");

    diagnostic <<= result.warnings;
    diagnostic <<= result.errors;
    flush_diagnostics();

    if(result.ok())
      fmt::print(out, "Assembled {} bytes.\n", result.bytes.size());
    last = std::move(result);
  }

  void REPL::program()
  {
    if(!last || !last->ok())
    {
      fmt::print(out, "Nothing assembled yet, use 'assemble.\n");
      return;
    }
    auto& bytes = last->bytes;
    for(std::size_t i = 0; i < bytes.size(); ++i)
    {
      fmt::print(out, "{:02x}", bytes[i]);
      if((i + 1) % 16 == 0 || i + 1 == bytes.size())
        fmt::print(out, "\n");
      else
        fmt::print(out, " ");
    }
  }

  void REPL::symbols()
  {
    if(!last)
    {
      fmt::print(out, "Nothing assembled yet, use 'assemble.\n");
      return;
    }
    for(auto& s : last->symbols.sorted())
      fmt::print(out, "{:<16} {:04x}\n", s.name, s.offset);
  }

  void REPL::load()
  {
    fmt::print(out, "File: ");

    std::string filepath = prompt_line();
    if(filepath.empty())
      return;

    auto src = read_module(filepath);
    if(!src)
    {
      fmt::print(out, "\nCannot open \"{}\".\n", filepath);
      return;
    }
    std::istringstream ss(*src);
    for(std::string line; std::getline(ss, line); process_line(line))
      ;
    fmt::print(out, "\nState loaded from \"{}\".\n", filepath);
  }
}

}
