#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <assembler.hpp>
#include <compiler.hpp>
#include <encoder.hpp>
#include <reader.hpp>
#include <symbol.hpp>
#include <token.hpp>
#include <repl.hpp>

#include <fmt/format.h>

#include <functional>
#include <algorithm>
#include <iostream>
#include <iterator>
#include <fstream>
#include <sstream>
#include <future>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>
#include <map>

namespace pie
{

std::optional<std::string> read_module(std::string_view path)
{
  std::stringstream ss;
  if(path == "STDIN")
    ss << std::cin.rdbuf();
  else
  {
    std::ifstream file(std::string(path), std::ios::in | std::ios::binary);
    if(!file.is_open())
      return std::nullopt;
    ss << file.rdbuf();
  }
  return ss.str();
}

std::string make_listing(const assembly& result)
{
  const auto& bytes = result.bytes;

  std::string out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "header: {} bytes\n", std::min(bytes.size(), pie_header_length));
  for(std::size_t off = pie_header_length; off + word_size <= bytes.size(); off += word_size)
  {
    auto w = decode_word(bytes.data() + off);
    fmt::format_to(it, "{:04x}:  {:02x} {:02x} {:02x} {:02x}    {}\n", off - pie_header_length,
        w.bytes[0], w.bytes[1], w.bytes[2], w.bytes[3], opcode_to_mnemonic(w.opcode()));
  }

  fmt::format_to(it, "sections:\n");
  for(auto& s : result.sections)
    fmt::format_to(it, "  .{:<15} {:04x}\n", section_to_name(s.kind), s.starting_instruction * word_size);

  if(!result.symbols.empty())
  {
    fmt::format_to(it, "symbols:\n");
    for(auto& s : result.symbols.sorted())
      fmt::format_to(it, "  {:<16} {:04x}\n", s.name, s.offset);
  }
  if(!result.read_only.empty())
  {
    fmt::format_to(it, "read-only:");
    for(auto b : result.read_only)
      fmt::format_to(it, " {:02x}", b);
    fmt::format_to(it, "\n");
  }
  return out;
}

static std::string output_path_for(std::string_view module)
{
  if(config.files.size() <= 1)
    return config.output_file;
  return std::string(module) + ".pie";
}

static std::optional<assembly> assemble_module(std::string_view module)
{
  auto src = read_module(module);
  if(!src)
  {
    diagnostic <<= diagnostic_db::args::cannot_open_file(source_range { std::string(module), 0, 0, 0, 0 }, module);
    return std::nullopt;
  }
  auto result = assembler::assemble(*src, module);

  diagnostic <<= result.warnings;
  diagnostic <<= result.errors;
  return result;
}

static const std::map<emit_classes, std::function<void(std::string_view)>> emitter =
{
  { emit_classes::help, [](auto) { print_emit_classes(stdout); } },
  { emit_classes::repl, [](std::string_view t)
    {
      repl::REPL repl(t);

      repl.run();
    } },
  { emit_classes::tokens, [](std::string_view t)
    {
      auto src = read_module(t);
      if(!src)
      {
        diagnostic <<= diagnostic_db::args::cannot_open_file(source_range { std::string(t), 0, 0, 0, 0 }, t);
        return;
      }
      auto w = asm_reader::read<token>(*src, t);
      if(!w.ok())
        diagnostic <<= mk_diag::from(*w.failure);

      std::string out;
      for(auto& tok : w.data)
      {
        fmt::format_to(std::back_inserter(out), "Token \'{}\' at {} with data \"{}\".\n",
            kind_to_str(tok.kind), tok.loc.to_string(), tok.data);
      }
      fmt::print("{}", out);
    } },
  { emit_classes::listing, [](std::string_view t)
    {
      auto result = assemble_module(t);
      if(!result || !result->ok())
        return; // <- diagnostic will contain an error

      fmt::print("{}", make_listing(*result));
    } },
  { emit_classes::pie, [](std::string_view t)
    {
      auto result = assemble_module(t);
      if(!result || !result->ok())
        return;

      const auto path = output_path_for(t);
      std::ofstream file(path, std::ios::out | std::ios::binary);
      if(!file.is_open()
       || !file.write(reinterpret_cast<const char*>(result->bytes.data()), result->bytes.size()))
        diagnostic <<= diagnostic_db::args::cannot_write_file(source_range { std::string(t), 0, 0, 0, 0 }, path);
    } },
};

void compiler::go()
{
  std::vector<std::string_view> tasks;
  if(config.files.empty())
    tasks = { "STDIN" };
  else
    tasks.assign(config.files.begin(), config.files.end());

  // the REPL owns the terminal
  const std::size_t num_cores = config.emit_class == emit_classes::repl ? 1 : config.num_cores;

  std::vector<std::future<void>> runners;
  for(auto tit = tasks.begin(); tit != tasks.end(); )
  {
    for(std::size_t i = runners.size(); tit != tasks.end() && i < num_cores; ++i)
    {
      auto t = *tit;

      runners.emplace_back(std::async(std::launch::async, [t]() { emitter.at(config.emit_class)(t); }));

      ++tit;
    }
    for(auto rit = runners.begin(); rit != runners.end(); )
    {
      if(rit->wait_for(std::chrono::nanoseconds(100)) == std::future_status::ready)
      {
        rit->get();
        rit = runners.erase(rit);
      }
      else
        ++rit;
    }
  }
  for(auto& r : runners)
    r.get();
}

}
