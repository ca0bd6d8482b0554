#pragma once

#include <assembler.hpp>

#include <string_view>
#include <iostream>
#include <optional>
#include <cstdio>
#include <string>
#include <vector>

namespace pie
{

/**
 * This REPL ("Read, Eval, Print"-Loop) assembles every line on entry
 * and keeps the accepted lines as a source buffer that can be assembled
 * into a full artifact at any time.
 */
template<typename repl>
struct base_repl
{
  base_repl(std::istream& in, std::FILE* out) : in(&in), out(out)
  {  }

  void run()
  { static_cast<repl&>(*this).run_impl(); }

  void quit();
  void history();
  void write(const std::vector<std::string>& source);

  std::vector<std::string> commands;

  bool stopped { false };
protected:
  std::string prompt_line();
  bool prompt_yes_no();

  std::istream* in;
  std::FILE* out;
};

namespace repl
{

  struct REPL : base_repl<REPL>
  {
    friend struct base_repl<REPL>; // <- allow base_repl to call run_impl
  public:
    // `module` is preloaded into the buffer unless it is `STDIN`
    REPL(std::string_view module, std::istream& in = std::cin, std::FILE* out = stdout);

    void process_command(const std::string& line);

    const std::vector<std::string>& source() const
    { return buffer; }

    const std::optional<assembly>& last_assembly() const
    { return last; }
  private:
    void run_impl();

    void process_line(const std::string& line);
    void flush_diagnostics();

    void source_listing();
    void assemble();
    void program();
    void symbols();
    void load();
  private:
    std::vector<std::string> buffer;
    std::optional<assembly> last;

    // label line still waiting for its instruction
    std::optional<std::string> pending_label;

    std::size_t failed_inputs { 0 };
  };

}

}
