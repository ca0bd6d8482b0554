#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdio>
#include <string>
#include <vector>

namespace pie
{

enum class emit_classes
{
  undef,
  help,
  repl,
  tokens,
  listing,
  pie,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::repl, "repl" },
  { emit_classes::tokens, "tokens" },
  { emit_classes::listing, "listing" },
  { emit_classes::pie, "pie" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::repl,
  emit_classes::tokens,
  emit_classes::listing,
  emit_classes::pie,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };

  emit_classes emit_class { emit_classes::help };
  std::size_t num_cores { 1 };

  std::vector<std::string> files;
  std::string output_file { "a.pie" };
};

inline config_t config;

}
