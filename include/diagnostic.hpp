#pragma once

#include <assembler_error.hpp>
#include <source_range.hpp>

#include <nlohmann/json.hpp>
#include <tsl/robin_map.h>

#include <fmt/format.h>

#include <string_view>
#include <functional>
#include <cstdint>
#include <cstdio>
#include <utility>
#include <string>
#include <vector>
#include <mutex>

namespace pie
{

enum class diag_level : unsigned char
{
  error = 1,
  warn  = 1 << 1,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::warn, "warn" },
})

namespace mk_diag
{
nlohmann::json error(const source_range& range,
                     std::uint_fast16_t hrc, const std::string_view& message);

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t hrc, const std::string_view& message);

// picks the catalogue entry for an assembler error or warning
nlohmann::json from(const assembler_error& e);
}

namespace detail
{
  struct position
  {
    std::string module;
    std::size_t row;
    std::size_t col;

    bool operator==(const position& other) const
    { return module == other.module && row == other.row && col == other.col; }
  };
  inline position make_position(std::string module, std::size_t row, std::size_t col)
  {
    return position { std::move(module), row, col };
  }
}

}

namespace std
{
  template<>
  struct hash<::pie::detail::position>
  {
    std::size_t operator()(const ::pie::detail::position& p) const
    {
      return ((std::hash<std::string>()(p.module)
               ^ (std::hash<std::size_t>()(p.row) << 1)) >> 1)
               ^ (std::hash<std::size_t>()(p.col) << 1);
    }
  };
}

namespace pie
{

/**
 * Collects diagnostics of all assembler runs of the process and prints them
 * ordered by position. May be fed from several worker threads.
 */
struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  ~diagnostics_manager();

  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);

  // every error and warning of a run
  diagnostics_manager& operator<<=(const std::vector<assembler_error>& errors);

  bool empty() const { return data.empty(); }

  void print(std::FILE* file);
  int error_code() const;

  inline void reset() { std::lock_guard<std::mutex> guard(mut); err = 0; data.clear(); printed = printed_default; }

  // forgets the messages that were shown already, the error code stays
  inline void discard() { std::lock_guard<std::mutex> guard(mut); data.clear(); printed = printed_default; }
private:
  tsl::robin_map<detail::position, std::vector<nlohmann::json>> data;

  int err { 0 };
  std::mutex mut;

#ifndef PIE_TESTING
  static constexpr bool printed_default = false;
#else
  static constexpr bool printed_default = true;
#endif
  bool printed { printed_default };
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();

}
