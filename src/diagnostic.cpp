#include <diagnostic_db.hpp>
#include <diagnostic.hpp>

#include <fmt/color.h>

#include <algorithm>
#include <cassert>
#include <tuple>

namespace pie
{

namespace mk_diag
{

nlohmann::json warn(const source_range& range,
                    std::uint_fast16_t hrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::warn;

  j["hrc"] = hrc;
  j["message"] = message;

  return j;
}

nlohmann::json error(const source_range& range,
                     std::uint_fast16_t hrc, const std::string_view& message)
{
  nlohmann::json j;

  j["range"] = range;

  j["level"] = diag_level::error;

  j["hrc"] = hrc;
  j["message"] = message;

  return j;
}

nlohmann::json from(const assembler_error& e)
{
  namespace db = diagnostic_db::assembler;

  nlohmann::json j;
  switch(e.kind)
  {
  default:
  case error_kind::parse_error:                            j = db::parse_error(e.loc, e.detail); break;
  case error_kind::no_segment_declaration_found:           j = db::no_segment_declaration_found(e.loc, e.detail); break;
  case error_kind::string_constant_declared_without_label: j = db::string_constant_declared_without_label(e.loc); break;
  case error_kind::string_constant_expected:               j = db::string_constant_expected(e.loc, e.detail); break;
  case error_kind::symbol_already_declared:                j = db::symbol_already_declared(e.loc, e.detail); break;
  case error_kind::insufficient_sections:                  j = db::insufficient_sections(e.loc, e.detail); break;
  case error_kind::unresolved_label:                       j = db::unresolved_label(e.loc, e.detail); break;
  case error_kind::opcode_in_operand_field:                j = db::opcode_in_operand_field(e.loc, e.detail); break;
  case error_kind::string_in_operand_field:                j = db::string_in_operand_field(e.loc, e.detail); break;
  case error_kind::integer_out_of_range:                   j = db::integer_out_of_range(e.loc, e.detail); break;
  case error_kind::operand_overflow:                       j = db::operand_overflow(e.loc, e.detail); break;
  case error_kind::unknown_section_header:                 j = db::unknown_section_header(e.loc, e.detail); break;
  case error_kind::unknown_directive:                      j = db::unknown_directive(e.loc, e.detail); break;
  case error_kind::section_operands_ignored:               j = db::section_operands_ignored(e.loc, e.detail); break;
  case error_kind::integer_truncated:                      j = db::integer_truncated(e.loc, e.detail); break;
  case error_kind::label_offset_truncated:                 j = db::label_offset_truncated(e.loc, e.detail); break;
  }
  j["kind"] = e.kind;
  if(e.instruction)
    j["instruction"] = *e.instruction;
  return j;
}

}

diagnostics_manager::~diagnostics_manager()
{ assert((printed || data.empty()) && "Messages have been printed."); }

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  const auto range = msg["range"].get<source_range>();

  data[detail::make_position(range.module, range.row_beg, range.column_beg)].push_back(msg);
  printed = printed_default;

  return *this;
}

diagnostics_manager& diagnostics_manager::operator<<=(const std::vector<assembler_error>& errors)
{
  for(auto& e : errors)
    *this <<= mk_diag::from(e);
  return *this;
}

void diagnostics_manager::print(std::FILE* file)
{
  std::lock_guard<std::mutex> guard(mut);
  if(printed)
    return;

  std::vector<const decltype(data)::value_type*> ordered;
  ordered.reserve(data.size());
  for(auto& w : data)
    ordered.push_back(&w);

  std::sort(ordered.begin(), ordered.end(), [](auto* lhs, auto* rhs)
      { return std::tie(lhs->first.module, lhs->first.row, lhs->first.col)
             < std::tie(rhs->first.module, rhs->first.row, rhs->first.col); });

  for(auto* w : ordered)
  {
    for(auto& v : w->second)
    {
      const auto range = v["range"].get<source_range>();
      fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}: ", range.to_string());

      auto lv = v["level"].get<diag_level>();

      switch(lv)
      {
      default:
      case diag_level::error:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(PE-{}) ", v["hrc"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;

      case diag_level::warn:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(PE-{}) ", v["hrc"].get<std::uint_fast16_t>());
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", v["message"].get<std::string>());
        } break;
      }
      fmt::print(file, fg(fmt::color::white), "\n");
    }
  }
  printed = true;
}

int diagnostics_manager::error_code() const
{
  return err;
}

}
