// spawn_dsl/codegen/ir.cpp - IR helpers
#include "spawn_dsl/codegen/ir.hpp"

namespace spawn_dsl::codegen
{

std::string_view to_string(OpKind op) noexcept
{
  switch (op) {
    case OpKind::BindSpawner:
      return "BindSpawner";
    case OpKind::BeginEntity:
      return "BeginEntity";
    case OpKind::EndEntity:
      return "EndEntity";
    case OpKind::Create:
      return "Create";
    case OpKind::AddChild:
      return "AddChild";
    case OpKind::Insert:
      return "Insert";
    case OpKind::SetParent:
      return "SetParent";
    case OpKind::CallMethod:
      return "CallMethod";
    case OpKind::RunBlock:
      return "RunBlock";
    case OpKind::ReleaseBuilder:
      return "ReleaseBuilder";
    case OpKind::BeginGroup:
      return "BeginGroup";
    case OpKind::EndGroup:
      return "EndGroup";
    case OpKind::InjectBlock:
      return "InjectBlock";
    case OpKind::BeginFlow:
      return "BeginFlow";
    case OpKind::ElseBranch:
      return "ElseBranch";
    case OpKind::EndFlow:
      return "EndFlow";
    case OpKind::FlowJump:
      return "FlowJump";
  }
  return "<unknown>";
}

}  // namespace spawn_dsl::codegen
