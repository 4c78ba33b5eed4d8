// spawn_dsl/codegen/cpp_emitter.cpp - IR to C++ text
#include "spawn_dsl/codegen/cpp_emitter.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace spawn_dsl::codegen
{

std::string CppEmitter::emit(const SpawnProgramIR & ir)
{
  out_.clear();
  depth_ = 0;
  for (const auto & inst : ir.instructions) {
    emit_instruction(inst);
  }
  return out_;
}

void CppEmitter::line(std::string_view text)
{
  out_.append(static_cast<size_t>(depth_ * options_.indent_width), ' ');
  out_.append(text);
  out_ += '\n';
}

std::string CppEmitter::join_args(const std::vector<std::string> & args)
{
  return fmt::format("{}", fmt::join(args, ", "));
}

void CppEmitter::emit_block(std::string_view body)
{
  if (body.find_first_not_of(" \t\r\n") == std::string_view::npos) {
    line("{}");
    return;
  }
  line(fmt::format("{{ {} }}", body));
}

void CppEmitter::emit_self_binding()
{
  line(fmt::format("const auto {} = {}.id();", options_.self_name, options_.builder_name));
}

void CppEmitter::emit_instruction(const Instruction & inst)
{
  const std::string & b = options_.builder_name;
  const std::string & sp = options_.spawner;

  switch (inst.op) {
    case OpKind::BindSpawner:
      line(fmt::format("auto && {} = ({});", sp, inst.text));
      break;

    case OpKind::BeginEntity:
      line(inst.name.empty() ? std::string("[&] {") : fmt::format("const auto {} = [&] {{", inst.name));
      ++depth_;
      break;

    case OpKind::EndEntity:
      line(fmt::format("return {};", options_.self_name));
      --depth_;
      line("}();");
      break;

    case OpKind::Create:
      line(fmt::format("auto {} = {}.create({});", b, sp, join_args(inst.args)));
      emit_self_binding();
      break;

    case OpKind::AddChild:
      line(fmt::format(
        "auto {} = {}.entity({}).add_child({});", b, sp, inst.target, join_args(inst.args)));
      emit_self_binding();
      break;

    case OpKind::Insert:
      line(fmt::format("auto {} = {}.entity({});", b, sp, inst.target));
      if (!inst.args.empty()) {
        line(fmt::format("{}.insert({});", b, join_args(inst.args)));
      }
      emit_self_binding();
      break;

    case OpKind::SetParent:
      line(fmt::format("{}.set_parent({});", b, inst.target));
      break;

    case OpKind::CallMethod:
      line(fmt::format("{}.{}({});", b, inst.name, join_args(inst.args)));
      break;

    case OpKind::RunBlock:
    case OpKind::InjectBlock:
      emit_block(inst.text);
      break;

    case OpKind::ReleaseBuilder:
      line(fmt::format("{}.release();", b));
      break;

    case OpKind::BeginGroup:
      line("{");
      ++depth_;
      line(fmt::format("const auto {} = {};", options_.parent_name, options_.self_name));
      break;

    case OpKind::EndGroup:
    case OpKind::EndFlow:
      --depth_;
      line("}");
      break;

    case OpKind::BeginFlow: {
      const char * keyword = inst.flow == FlowKind::If    ? "if"
                             : inst.flow == FlowKind::For ? "for"
                                                          : "while";
      line(fmt::format("{} ({}) {{", keyword, inst.text));
      ++depth_;
      break;
    }

    case OpKind::ElseBranch:
      --depth_;
      line(inst.text.empty() ? std::string("} else {") : fmt::format("}} else if ({}) {{", inst.text));
      ++depth_;
      break;

    case OpKind::FlowJump:
      line(inst.jump == JumpKind::Break ? "break;" : "continue;");
      break;
  }
}

}  // namespace spawn_dsl::codegen
