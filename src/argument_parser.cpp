#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <iterator>
#include <thread>

namespace pie
{

void print_emit_classes(std::FILE* f)
{
  fmt::print(f, "emit classes: ");

  for(auto it = std::begin(emit_classes_list); it != std::end(emit_classes_list); ++it)
  {
    if(std::next(it) == std::end(emit_classes_list))
      fmt::print(f, "{}\n", nlohmann::json(*it).get<std::string>());
    else
      fmt::print(f, "{}, ", nlohmann::json(*it).get<std::string>());
  }
}

namespace arguments
{

static const source_range args_range { "args", 0, 0, 0, 0 };

void parse(int argc, const char** argv, std::FILE* out)
{
  detail::CmdOptions options("pieasm", "Assembler producing PIE bytecode for the register machine.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false", [](auto) { return std::make_any<bool>(true); })
    (",f,-files", "Accepts arbitrary list of files.", std::make_any<std::vector<std::string>>(), "STDIN",
      [](auto x) { return std::make_any<std::vector<std::string>>(x.begin(), x.end()); })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::help), "help",
      [](auto x)
      {
        if(x.empty() || x.front().empty())
          return std::make_any<emit_classes>(emit_classes::help);

        nlohmann::json easy_conversion = std::string(x.front());
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return std::make_any<emit_classes>(easy_conversion.get<emit_classes>());

        diagnostic <<= diagnostic_db::args::emit_not_present(args_range);
        return std::make_any<emit_classes>(emit_classes::help);
      })
    ("o,-output", "Output file to write to, only used for a single input.", std::make_any<std::string>("a.pie"), "a.pie",
      [](auto x)
      {
        if(x.empty())
          return std::make_any<std::string>("a.pie");
        return std::make_any<std::string>(x.front());
      })
    ("j,-num-cores", "Number of cores to use for processing modules. \"*\" to determine automatically.", std::make_any<std::size_t>(1), "1",
      [](auto x)
      {
        if(x.empty())
          return std::make_any<std::size_t>(1);
        if(x.front() == "*")
          return std::make_any<std::size_t>(std::max(1U, std::thread::hardware_concurrency()));

        std::size_t v = 1;
        try
        { v = static_cast<std::size_t>(std::stoull(std::string(x.front()))); }
        catch(const std::invalid_argument&)
        {
          diagnostic <<= diagnostic_db::args::unknown_arg(args_range);
          return std::make_any<std::size_t>(1);
        }
        catch(const std::out_of_range&)
        {
          diagnostic <<= diagnostic_db::args::num_cores_too_large(args_range);
          return std::make_any<std::size_t>(std::max(1U, std::thread::hardware_concurrency()));
        }

        if(v == 0)
        {
          diagnostic <<= diagnostic_db::args::num_cores_too_small(args_range);
          v = 1;
        }
        else if(v > std::thread::hardware_concurrency())
          diagnostic <<= diagnostic_db::args::num_cores_too_large(args_range);
        return std::make_any<std::size_t>(v);
      })
    ;

  auto map = options.parse(argc, argv);

  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  if(const auto& files = std::any_cast<const std::vector<std::string>&>(map["f"]); !files.empty())
  {
    config.files = files;
  }
  config.num_cores = std::any_cast<std::size_t>(map["j"]);
  config.emit_class = std::any_cast<emit_classes>(map["-emit="]);
  if(config.emit_class == emit_classes::help && !config.print_help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }
  config.output_file = std::any_cast<std::string>(map["o"]);
}

namespace detail
{

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    std::any default_value, std::string_view default_value_str, const std::function<std::any(const std::vector<std::string_view>&)>& f)
{
  bool has_equals = false;
  std::vector<std::string_view> opts;

  auto take = [&opts, &has_equals](std::string_view opt)
  {
    if(!opt.empty() && opt.back() == '=')
    {
      opt.remove_suffix(1); // <- get rid of equals
      has_equals = true;
    }
    opts.emplace_back(opt);
  };

  for(auto it = opt_list.find(','); it != std::string_view::npos; it = opt_list.find(','))
  {
    take(opt_list.substr(0, it));
    opt_list.remove_prefix(it + 1); // + 1 to remove comma
  }
  take(opt_list);

  ot->data.push_back(CmdOption { opts, description, std::move(default_value), default_value_str, f, has_equals });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }


struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {
    reset_cur_opt();
  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  void reset_cur_opt()
  {
    cur_opt = std::nullopt;
    implicit = false;

    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(f.empty()) // if we have an implicit argument, make this the initial current option
        {
          cur_opt = v;
          implicit = true;
        }
      }
    }
  }

  std::map<std::string, std::any>& parse()
  {
    for(auto& str : *args)
    {
      if(str.size() > 1 && str[0] == '-')
        parse_option(str);
      else
        parse_arg(str);
    }
    flush();

    return *map;
  }

  void flush()
  {
    // an implicit option without arguments keeps its default
    if(cur_opt.has_value() && !(implicit && opt_args.empty()))
    {
      std::any a = cur_opt->parser(opt_args);
      for(auto& o : cur_opt->opt)
        (*map)[static_cast<std::string>(o) + (cur_opt->has_equals ? "=" : "")] = a;
    }
    else if(!cur_opt.has_value() && !opt_args.empty())
      diagnostic <<= diagnostic_db::args::unknown_arg(source_range { "args", 0, 0, 0, 0 });

    opt_args.clear();
  }

  void parse_arg(const std::string_view& str)
  {
    opt_args.push_back(str);

    // equals options take exactly one argument
    if(cur_opt.has_value() && cur_opt->has_equals)
    {
      flush();
      reset_cur_opt();
    }
  }

  void parse_option(const std::string_view& str)
  {
    flush();

    cur_opt = std::nullopt;
    implicit = false;
    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(!f.empty() && str.find(f) == 1 && str.size() - 1 == f.size()) // first char of str is `-`, after that it should match
          cur_opt = v;
      }
    }
    if(!cur_opt.has_value())
      diagnostic <<= diagnostic_db::args::unknown_arg(source_range { "args", 0, 0, 0, 0 });
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map; // <- not a string_view, since we need to append '=' sometimes

  CmdOptions* cmdopts;

  std::vector<std::string_view> opt_args;
  std::optional<CmdOption> cur_opt;
  bool implicit { false };
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(auto& v : data)
  {
    for(auto f : v.opt)
    {
      map[static_cast<std::string>(f) + (v.has_equals ? "=" : "")] = v.default_value;
    }
  }
  if(argc - 1 <= 0)
    return map;

  std::vector<std::string_view> args;
  args.reserve(argc - 1);

  for(int i = 1; i < argc; ++i)
  {
    // We want to split options at equals
    std::string_view v = argv[i];
    if(auto it = v.find('='); !v.empty() && v[0] == '-' && it != std::string_view::npos)
    {
      // grab the option
      args.push_back(v.substr(0, it));

      // grab its argument
      args.push_back(v.substr(it + 1));
    }
    else
      args.push_back(v);
  }

  std::map<std::string, std::any>& result = CmdParse(args, map, *this);
  return result;
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto it = v.opt.begin(); it != v.opt.end(); ++it)
    {
      if(it->empty())
        continue;
      args += "-";
      args += *it;
      if(std::next(it) != v.opt.end())
        args += " or ";
    }
    fmt::print(f, "{}    {} [default={}]\n", args, v.description, v.default_value_str);
  }
}

}

}
}
