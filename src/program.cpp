#include <program.hpp>
#include <encoder.hpp>

#include <algorithm>
#include <iterator>

namespace pie
{

std::optional<std::string> instruction::label_name() const
{
  if(lab)
    return lab->data;
  return std::nullopt;
}

std::optional<std::string> instruction::directive_name() const
{
  if(dir)
    return dir->data;
  return std::nullopt;
}

std::optional<std::string> instruction::string_constant() const
{
  if(!args.empty() && args.front().kind == token_kind::String)
    return args.front().data;
  return std::nullopt;
}

bool operator==(const instruction& lhs, const instruction& rhs)
{
  return lhs.lab == rhs.lab && lhs.op == rhs.op && lhs.dir == rhs.dir && lhs.args == rhs.args;
}

std::vector<unsigned char> program::to_u8_vec(const symbol_table& symbols, report& rep) const
{
  std::vector<unsigned char> v;
  v.reserve(instructions.size() * word_size);

  for(std::size_t idx = 0; idx < instructions.size(); ++idx)
  {
    const auto& intermediate = encode_instruction(instructions[idx], symbols, rep, static_cast<std::uint32_t>(idx));

    std::move(intermediate.begin(), intermediate.end(), std::back_inserter(v));
  }

  v.shrink_to_fit();
  return v;
}

}
