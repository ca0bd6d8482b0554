#include <arguments_parser.hpp>
#include <diagnostic.hpp>
#include <compiler.hpp>
#include <config.hpp>

#include <cstdio>

int main(int argc, const char** argv)
{
  using namespace pie;

  arguments::parse(argc, argv, stdout);

  // argument errors and help output end the run before any module is touched
  if(diagnostic.error_code() == 0 && !config.print_help)
    compiler{}.go();

  diagnostic.print(stdout);
  return diagnostic.error_code();
}
