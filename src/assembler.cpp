#include <assembler.hpp>
#include <encoder.hpp>
#include <reader.hpp>

#include <algorithm>
#include <iterator>
#include <utility>
#include <string>

namespace pie
{

section_kind section_from_name(std::string_view name)
{
  if(name == "data")
    return section_kind::data;
  if(name == "code")
    return section_kind::code;
  return section_kind::unknown;
}

std::string_view section_to_name(section_kind kind)
{
  switch(kind)
  {
  case section_kind::data: return "data";
  case section_kind::code: return "code";
  default:
  case section_kind::unknown: return "unknown";
  }
}

assembly assembler::assemble(std::string_view source, std::string_view module)
{
  return run(source, module, false);
}

assembly assembler::assemble_line(std::string_view line)
{
  return run(line, "REPL", true);
}

std::vector<unsigned char> assembler::pie_header()
{
  std::vector<unsigned char> header(pie_header_prefix.begin(), pie_header_prefix.end());

  header.resize(pie_header_length, 0);
  return header;
}

assembly assembler::run(std::string_view source, std::string_view module, bool fragment)
{
  auto parsed = asm_reader::read<instruction>(source, module);
  if(!parsed.ok())
  {
    assembly failed;
    failed.errors.push_back(*parsed.failure);
    return failed;
  }
  const program prog(std::move(parsed.data));

  assembler_state st;
  st.fragment = fragment;

  auto first = phase_one(prog, std::move(st));

  if(first.diagnostics.failed())
    return finish(std::move(first), {});

  if(!first.fragment && first.sections.size() != 2)
  {
    first.diagnostics.error(error_kind::insufficient_sections, std::nullopt, std::to_string(first.sections.size()),
                            source_range { module, 1, 1, 1, 1 });
    return finish(std::move(first), {});
  }

  auto second = phase_two(prog, std::move(first));

  if(second.diagnostics.failed())
    return finish(std::move(second), {});

  std::vector<unsigned char> bytes;
  if(!second.fragment)
    bytes = pie_header();

  bytes.reserve(bytes.size() + second.bytecode.size());
  std::copy(second.bytecode.begin(), second.bytecode.end(), std::back_inserter(bytes));

  return finish(std::move(second), std::move(bytes));
}

assembler_state assembler::phase_one(const program& prog, assembler_state&& st)
{
  st.phase = assembler_phase::first;
  st.current_instruction = 0;

  for(auto& i : prog.instructions)
  {
    bool label_registered = false;
    if(i.is_label())
      label_registered = process_label_declaration(i, st);

    if(i.is_directive())
      process_directive(i, label_registered, st);

    // every instruction takes up one word of address space, directives included
    st.current_instruction++;
  }
  st.phase = assembler_phase::second;

  return std::move(st);
}

assembler_state assembler::phase_two(const program& prog, assembler_state&& st)
{
  st.current_instruction = 0;

  for(auto& i : prog.instructions)
  {
    // sections are only tracked again, phase two never adds new ones
    if(i.is_directive())
      process_directive(i, false, st);

    st.current_instruction++;
  }
  st.bytecode = prog.to_u8_vec(st.symbols, st.diagnostics);

  return std::move(st);
}

bool assembler::process_label_declaration(const instruction& instr, assembler_state& st)
{
  if(!st.current_section && !st.fragment)
  {
    st.diagnostics.error(error_kind::no_segment_declaration_found, st.current_instruction,
                         instr.lab->data, instr.lab->loc);
    return false;
  }
  if(st.symbols.has(instr.lab->data))
  {
    st.diagnostics.error(error_kind::symbol_already_declared, st.current_instruction,
                         instr.lab->data, instr.lab->loc);
    return false;
  }
  return st.symbols.add(symbol(instr.lab->data,
                               st.current_instruction * static_cast<std::uint32_t>(word_size)));
}

void assembler::process_directive(const instruction& instr, bool label_registered, assembler_state& st)
{
  const auto name = *instr.directive_name();

  if(auto kind = section_from_name(name); kind != section_kind::unknown)
  {
    process_section_header(instr, kind, st);
  }
  else if(name == "asciiz")
  {
    handle_asciiz(instr, label_registered, st);
  }
  else if(st.phase == assembler_phase::first)
  {
    if(instr.has_operands())
      st.diagnostics.warn(error_kind::unknown_directive, st.current_instruction, name, instr.dir->loc);
    else
      st.diagnostics.warn(error_kind::unknown_section_header, st.current_instruction, name, instr.dir->loc);
  }
}

void assembler::process_section_header(const instruction& instr, section_kind kind, assembler_state& st)
{
  const section new_section { kind, st.current_instruction };

  if(st.phase == assembler_phase::second)
  {
    st.current_section = new_section;
    return;
  }
  if(instr.has_operands())
    st.diagnostics.warn(error_kind::section_operands_ignored, st.current_instruction,
                        instr.dir->data, instr.dir->loc);

  st.sections.push_back(new_section);
  st.current_section = new_section;
}

void assembler::handle_asciiz(const instruction& instr, bool label_registered, assembler_state& st)
{
  // the string is laid out once, in phase one
  if(st.phase != assembler_phase::first)
    return;

  const auto label = instr.label_name();
  if(!label)
  {
    st.diagnostics.error(error_kind::string_constant_declared_without_label, st.current_instruction,
                         "", instr.dir->loc);
    return;
  }
  const auto str = instr.string_constant();
  if(!str)
  {
    st.diagnostics.error(error_kind::string_constant_expected, st.current_instruction, *label, instr.loc);
    return;
  }

  // the label points to the first byte of the string
  if(label_registered && !st.symbols.set_offset(*label, st.ro_offset))
    st.diagnostics.error(error_kind::unresolved_label, st.current_instruction, *label, instr.lab->loc);

  for(unsigned char byte : *str)
  {
    st.ro.push_back(byte);
    st.ro_offset++;
  }
  st.ro.push_back(0);
  st.ro_offset++;
}

assembly assembler::finish(assembler_state&& st, std::vector<unsigned char> bytes)
{
  assembly result;

  result.errors = std::move(st.diagnostics.errors);
  result.warnings = std::move(st.diagnostics.warnings);
  result.symbols = std::move(st.symbols);
  result.read_only = std::move(st.ro);
  result.sections = std::move(st.sections);

  if(result.errors.empty())
    result.bytes = std::move(bytes);
  return result;
}

}
