#pragma once

#include <assembler.hpp>
#include <config.hpp>

#include <string_view>
#include <optional>
#include <string>
#include <vector>

namespace pie
{

// full contents of a module, `STDIN` reads the standard input
std::optional<std::string> read_module(std::string_view path);

// renders an assembled artifact as one line per word plus sections, symbols and read-only data
std::string make_listing(const assembly& result);

struct compiler
{
  void go();
};

}
