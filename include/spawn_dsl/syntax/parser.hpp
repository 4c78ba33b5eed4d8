// spawn_dsl/syntax/parser.hpp - Parser producing the spawn AST
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spawn_dsl/ast/ast.hpp"
#include "spawn_dsl/ast/ast_context.hpp"
#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/basic/source_manager.hpp"
#include "spawn_dsl/syntax/token_tree.hpp"

namespace spawn_dsl::syntax
{

/// Where an item list appears; parented forms are only legal at top level.
enum class ItemContext : uint8_t {
  TopLevel,
  Group,
};

/**
 * Recursive-descent parser over a balanced TokenTree.
 *
 * Errors are reported to the DiagnosticBag as SyntaxErrors. The erroring
 * construct is dropped and parsing resumes at the next item, so one pass
 * reports every independent error. Tokens and payload text point into the
 * SourceFile, which must outlive the resulting AST.
 */
class Parser
{
public:
  Parser(AstContext & ast, const SourceFile & source, DiagnosticBag & diags, TokenTree tree)
  : ast_(ast), source_(source), diags_(diags), tree_(std::move(tree))
  {
  }

  [[nodiscard]] SpawnProgram * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_limit() const;
  [[nodiscard]] bool at_kw(std::string_view kw) const;

  const Token & advance();
  bool match(TokenKind k);

  /// Index just past the group opened at `open_idx`.
  [[nodiscard]] size_t after_group(size_t open_idx) const { return tree_.partner[open_idx] + 1; }

  void error_at(SourceRange range, std::string msg, std::string label = "");

  // Recovery: a failed form is skipped up to where the next item can start.
  void skip_one();
  void skip_chain();
  void skip_definition();
  [[nodiscard]] bool at_item_start() const;
  void synchronize_item();

  // Items
  [[nodiscard]] gsl::span<Item *> parse_items_until(size_t limit, ItemContext ctx);
  [[nodiscard]] Item * parse_item(ItemContext ctx);
  [[nodiscard]] EntityForm * parse_entity_form(ItemContext ctx);
  [[nodiscard]] bool parse_definition(EntityForm * entity, ItemContext ctx);
  [[nodiscard]] Extension * parse_extension();
  [[nodiscard]] ChildGroup * parse_child_group();
  [[nodiscard]] InjectedCodeBlock * parse_code_block();

  // Flow
  [[nodiscard]] Item * parse_flow(ItemContext ctx);
  [[nodiscard]] IfFlow * parse_if(ItemContext ctx);
  [[nodiscard]] std::optional<gsl::span<Item *>> parse_flow_body(
    ItemContext ctx, std::string_view what);
  [[nodiscard]] OpaqueExpr * parse_paren_payload(std::string_view what);

  // Opaque payloads
  [[nodiscard]] OpaqueExpr * make_opaque(size_t begin, size_t end);
  [[nodiscard]] OpaqueExpr * group_payload(size_t open_idx);
  [[nodiscard]] std::optional<gsl::span<OpaqueExpr *>> split_list(
    size_t open_idx, std::string_view element);
  [[nodiscard]] gsl::span<NameRef *> collect_captures(size_t begin, size_t end);

  AstContext & ast_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  TokenTree tree_;
  size_t idx_ = 0;
  size_t limit_ = 0;       // index of the closer of the list being parsed
  int loop_depth_ = 0;     // enclosing for/while bodies
};

/**
 * Full front end: lex, build the token tree, parse.
 *
 * Returns the program even when errors were reported; erroring constructs
 * are simply absent from it.
 */
[[nodiscard]] SpawnProgram * parse_source(
  const SourceFile & source, AstContext & ast, DiagnosticBag & diags);

}  // namespace spawn_dsl::syntax
