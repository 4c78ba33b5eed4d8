// spawn_dsl/literals/literal_expander.hpp - Literal macro expansion in payloads
#pragma once

#include <optional>
#include <string>

#include "spawn_dsl/ast/ast.hpp"
#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/literals/literal.hpp"

namespace spawn_dsl::literals
{

/**
 * Rewrites `v!(...)`, `c!(...)` and `e!(...)` inside an opaque payload into
 * the rendered C++ expressions, leaving every other byte of the payload
 * untouched.
 *
 * Every malformed literal in the payload is reported before giving up.
 */
class LiteralExpander
{
public:
  LiteralExpander(const LiteralOptions & options, DiagnosticBag & diags)
  : options_(options), diags_(diags)
  {
  }

  /// Expanded payload text, or nullopt if any literal was malformed.
  [[nodiscard]] std::optional<std::string> expand(const OpaqueExpr & expr);

private:
  const LiteralOptions & options_;
  DiagnosticBag & diags_;
};

}  // namespace spawn_dsl::literals
