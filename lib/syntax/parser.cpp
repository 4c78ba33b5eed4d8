// spawn_dsl/syntax/parser.cpp - Recursive-descent parser for .spawn sources
#include "spawn_dsl/syntax/parser.hpp"

#include <algorithm>
#include <iterator>

#include "spawn_dsl/syntax/lexer.hpp"

namespace spawn_dsl::syntax
{

namespace
{

// Identifiers in opaque payloads that can never name an entity.
constexpr std::string_view k_cpp_keywords[] = {
  "alignas",   "alignof",      "and",      "asm",          "auto",        "bool",
  "break",     "case",         "catch",    "char",         "class",       "const",
  "constexpr", "const_cast",   "continue", "decltype",     "default",     "delete",
  "do",        "double",       "dynamic_cast", "else",     "enum",        "explicit",
  "extern",    "false",        "float",    "for",          "friend",      "goto",
  "if",        "inline",       "int",      "long",         "mutable",     "namespace",
  "new",       "noexcept",     "not",      "nullptr",      "operator",    "or",
  "private",   "protected",    "public",   "reinterpret_cast", "return",  "short",
  "signed",    "sizeof",       "static",   "static_assert", "static_cast", "struct",
  "switch",    "template",     "this",     "throw",        "true",        "try",
  "typedef",   "typeid",       "typename", "union",        "unsigned",    "using",
  "virtual",   "void",         "volatile", "while",        "xor",
};

bool is_cpp_keyword(std::string_view ident)
{
  return std::find(std::begin(k_cpp_keywords), std::end(k_cpp_keywords), ident) !=
         std::end(k_cpp_keywords);
}

bool is_flow_keyword(std::string_view ident)
{
  return ident == "if" || ident == "for" || ident == "while" || ident == "break" ||
         ident == "continue";
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tree_.size()) {
    return tree_.tokens.back();
  }
  return tree_[i];
}

bool Parser::at(TokenKind k) const { return !at_limit() && cur().kind == k; }

bool Parser::at_limit() const { return idx_ >= limit_ || cur().kind == TokenKind::Eof; }

bool Parser::at_kw(std::string_view kw) const { return !at_limit() && cur().is_ident(kw); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (idx_ + 1 < tree_.size()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

void Parser::error_at(SourceRange range, std::string msg, std::string label)
{
  diags_.report(DiagCategory::SyntaxError, range, std::move(msg), std::move(label));
}

void Parser::skip_one()
{
  if (is_open_delim(cur().kind)) {
    idx_ = after_group(idx_);
  } else {
    advance();
  }
}

void Parser::skip_chain()
{
  while (at(TokenKind::Dot)) {
    advance();
    if (at(TokenKind::Identifier)) {
      advance();
    }
    if (!at_limit() && is_open_delim(cur().kind)) {
      idx_ = after_group(idx_);
    }
  }
}

void Parser::skip_definition()
{
  if (at(TokenKind::LParen)) {
    idx_ = after_group(idx_);
  }
  skip_chain();
}

bool Parser::at_item_start() const
{
  if (at_limit()) {
    return true;
  }
  switch (cur().kind) {
    case TokenKind::Semicolon:
    case TokenKind::LParen:
    case TokenKind::LBrace:
      return true;
    case TokenKind::LBracket:
      return tree_[after_group(idx_)].kind == TokenKind::Gt;
    case TokenKind::Identifier: {
      const TokenKind next = cur(1).kind;
      return is_flow_keyword(cur().text) || next == TokenKind::LParen ||
             next == TokenKind::Plus || next == TokenKind::Gt;
    }
    default:
      return false;
  }
}

void Parser::synchronize_item()
{
  skip_chain();
  while (!at_item_start()) {
    skip_one();
  }
}

// ============================================================================
// Program
// ============================================================================

SpawnProgram * Parser::parse_program()
{
  idx_ = 0;
  limit_ = tree_.size() - 1;

  // A leading `[expr]` not followed by `>` names the spawner.
  OpaqueExpr * spawner = nullptr;
  if (at(TokenKind::LBracket) && tree_[after_group(idx_)].kind != TokenKind::Gt) {
    const size_t open = idx_;
    spawner = group_payload(open);
    if (spawner->empty()) {
      error_at(tree_[open].range.merge(tree_[tree_.partner[open]].range),
               "Expected identifier or expression", "empty spawner expression");
    }
    idx_ = after_group(open);
  }

  const gsl::span<Item *> items = parse_items_until(limit_, ItemContext::TopLevel);
  return ast_.create<SpawnProgram>(
    spawner, items, SourceRange(0, static_cast<uint32_t>(source_.size())));
}

// ============================================================================
// Items
// ============================================================================

gsl::span<Item *> Parser::parse_items_until(size_t limit, ItemContext ctx)
{
  const size_t saved_limit = limit_;
  limit_ = limit;

  std::vector<Item *> items;
  while (!at_limit()) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }

    const size_t before = idx_;
    if (Item * item = parse_item(ctx)) {
      items.push_back(item);
    } else {
      // A form that failed on its first token still gives that token up.
      if (idx_ == before) {
        skip_one();
      }
      synchronize_item();
    }
    if (idx_ == before) {
      skip_one();
    }
  }

  limit_ = saved_limit;
  return ast_.copy_to_arena(items);
}

Item * Parser::parse_item(ItemContext ctx)
{
  if (at(TokenKind::LBrace)) {
    return parse_code_block();
  }
  if (at(TokenKind::Identifier) && is_flow_keyword(cur().text)) {
    return parse_flow(ctx);
  }
  return parse_entity_form(ctx);
}

EntityForm * Parser::parse_entity_form(ItemContext ctx)
{
  const Token & first = cur();
  auto * entity = ast_.create<EntityForm>(first.range);
  entity->in_group = (ctx == ItemContext::Group);

  if (at(TokenKind::Plus)) {
    error_at(first.range, "insertion requires an explicit target name", "missing target");
    advance();
    skip_definition();
    return nullptr;
  }

  const bool ident_parent = at(TokenKind::Identifier) && cur(1).kind == TokenKind::Gt;
  const bool expr_parent =
    at(TokenKind::LBracket) && tree_[after_group(idx_)].kind == TokenKind::Gt;

  if (ident_parent || expr_parent) {
    if (ident_parent) {
      entity->parent_ref =
        ast_.create<NameRef>(ast_.intern(first.text), RefRole::Parent, first.range);
      advance();
    } else {
      const size_t open = idx_;
      entity->parent_expr = group_payload(open);
      if (entity->parent_expr->empty()) {
        error_at(first.range, "expected a parent expression inside '[ ]'");
        return nullptr;
      }
      idx_ = after_group(open);
    }
    const Token & gt = advance();

    if (ctx == ItemContext::Group) {
      error_at(first.range.merge(gt.range), "Parented is not allowed as a child");
      if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::LParen) {
        advance();
      }
      skip_definition();
      return nullptr;
    }

    if (at(TokenKind::Plus) || (at(TokenKind::Identifier) && cur(1).kind == TokenKind::Plus)) {
      error_at(cur().range, "an insertion cannot be parented", "unexpected insertion");
      if (at(TokenKind::Identifier)) {
        advance();
      }
      advance();
      skip_definition();
      return nullptr;
    }
    if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::LParen) {
      entity->name = ast_.intern(cur().text);
      entity->name_range = cur().range;
      advance();
    }
  } else if (at(TokenKind::Identifier)) {
    const Token & ident = cur();
    const TokenKind next = cur(1).kind;
    if (next == TokenKind::Plus) {
      entity->insertion_target =
        ast_.create<NameRef>(ast_.intern(ident.text), RefRole::InsertionTarget, ident.range);
      advance();
      advance();
    } else if (next == TokenKind::LParen) {
      entity->name = ast_.intern(ident.text);
      entity->name_range = ident.range;
      advance();
    } else {
      error_at(
        ident.range,
        ctx == ItemContext::TopLevel
          ? "Expected '>' for parented, '+' for inserted, or '()' for entity"
          : "Expected '+' for inserted, or '()' for entity");
      return nullptr;
    }
  } else if (!at(TokenKind::LParen)) {
    error_at(
      first.range, "Expected entity, inserted, flow statement or code block",
      "unexpected '" + std::string(first.text) + "'");
    return nullptr;
  }

  if (!parse_definition(entity, ctx)) {
    return nullptr;
  }

  entity->range_ = first.range.merge(tree_[idx_ - 1].range);
  return entity;
}

bool Parser::parse_definition(EntityForm * entity, ItemContext /*ctx*/)
{
  if (!at(TokenKind::LParen)) {
    error_at(cur().range, "Expected '(' for definition");
    return false;
  }

  const size_t open = idx_;
  const auto components = split_list(open, "component");
  idx_ = after_group(open);
  if (!components) {
    return false;
  }
  entity->components = *components;

  std::vector<Extension *> extensions;
  while (at(TokenKind::Dot) && cur(1).kind != TokenKind::LBracket) {
    Extension * ext = parse_extension();
    if (ext == nullptr) {
      return false;
    }
    extensions.push_back(ext);
  }
  entity->extensions = ast_.copy_to_arena(extensions);

  std::vector<ChildGroup *> groups;
  while (at(TokenKind::Dot)) {
    if (cur(1).kind != TokenKind::LBracket) {
      diags_
        .report(
          DiagCategory::SyntaxError, cur().range.merge(cur(1).range),
          "Extensions cannot be chained after children group", "extension after a group")
        .with_help("move this extension before the first '.[ ]' group");
      return false;
    }
    advance();
    groups.push_back(parse_child_group());
  }
  entity->groups = ast_.copy_to_arena(groups);

  return true;
}

Extension * Parser::parse_extension()
{
  const Token & dot = advance();

  if (at(TokenKind::Identifier)) {
    const Token & name = advance();
    if (!at(TokenKind::LParen)) {
      error_at(name.range, "Expected '(' after method name '" + std::string(name.text) + "'");
      return nullptr;
    }
    const size_t open = idx_;
    const auto args = split_list(open, "argument");
    idx_ = after_group(open);
    if (!args) {
      return nullptr;
    }
    return ast_.create<MethodCallExt>(
      ast_.intern(name.text), name.range, *args, dot.range.merge(tree_[idx_ - 1].range));
  }

  if (at(TokenKind::LParen)) {
    const size_t open = idx_;
    const auto args = split_list(open, "argument");
    idx_ = after_group(open);
    if (!args) {
      return nullptr;
    }
    return ast_.create<MethodCallExt>(
      std::string_view{}, SourceRange{}, *args, dot.range.merge(tree_[idx_ - 1].range));
  }

  if (at(TokenKind::LBrace)) {
    const size_t open = idx_;
    OpaqueExpr * body = group_payload(open);
    idx_ = after_group(open);
    return ast_.create<CodeBlockExt>(body, dot.range.merge(tree_[idx_ - 1].range));
  }

  error_at(dot.range, "Expected method call, '(' or '{' after '.'");
  return nullptr;
}

ChildGroup * Parser::parse_child_group()
{
  const size_t open = idx_;
  const size_t close = tree_.partner[open];
  advance();

  // Each entity is lowered into its own block, so loops outside it cannot
  // be continued from inside its children.
  const int saved_loop_depth = loop_depth_;
  loop_depth_ = 0;
  const gsl::span<Item *> items = parse_items_until(close, ItemContext::Group);
  loop_depth_ = saved_loop_depth;

  idx_ = close + 1;
  return ast_.create<ChildGroup>(items, tree_[open].range.merge(tree_[close].range));
}

InjectedCodeBlock * Parser::parse_code_block()
{
  const size_t open = idx_;
  OpaqueExpr * body = group_payload(open);
  idx_ = after_group(open);
  return ast_.create<InjectedCodeBlock>(
    body, tree_[open].range.merge(tree_[tree_.partner[open]].range));
}

// ============================================================================
// Flow
// ============================================================================

Item * Parser::parse_flow(ItemContext ctx)
{
  if (at_kw("if")) {
    return parse_if(ctx);
  }

  const Token & kw = advance();

  if (kw.text == "break" || kw.text == "continue") {
    if (loop_depth_ == 0) {
      error_at(kw.range, "'" + std::string(kw.text) + "' outside of a loop");
      return nullptr;
    }
    return ast_.create<FlowJump>(kw.text == "break" ? JumpKind::Break : JumpKind::Continue, kw.range);
  }

  const bool is_for = kw.text == "for";
  OpaqueExpr * head = parse_paren_payload(is_for ? "for header" : "while condition");
  if (head == nullptr) {
    return nullptr;
  }

  ++loop_depth_;
  const auto body = parse_flow_body(ctx, kw.text);
  --loop_depth_;
  if (!body) {
    return nullptr;
  }

  const SourceRange range = kw.range.merge(tree_[idx_ - 1].range);
  if (is_for) {
    return ast_.create<ForFlow>(head, *body, range);
  }
  return ast_.create<WhileFlow>(head, *body, range);
}

IfFlow * Parser::parse_if(ItemContext ctx)
{
  const Token & kw = advance();

  OpaqueExpr * cond = parse_paren_payload("if condition");
  if (cond == nullptr) {
    return nullptr;
  }
  const auto then_items = parse_flow_body(ctx, "if");
  if (!then_items) {
    return nullptr;
  }

  auto * node = ast_.create<IfFlow>(kw.range);
  node->condition = cond;
  node->then_items = *then_items;

  if (at_kw("else")) {
    advance();
    if (at_kw("if")) {
      node->else_if = parse_if(ctx);
      if (node->else_if == nullptr) {
        return nullptr;
      }
    } else {
      const auto else_items = parse_flow_body(ctx, "else");
      if (!else_items) {
        return nullptr;
      }
      node->else_items = *else_items;
      node->has_else = true;
    }
  }

  node->range_ = kw.range.merge(tree_[idx_ - 1].range);
  return node;
}

std::optional<gsl::span<Item *>> Parser::parse_flow_body(ItemContext ctx, std::string_view what)
{
  if (!at(TokenKind::LBrace)) {
    error_at(cur().range, "Expected '{' to open the '" + std::string(what) + "' body");
    return std::nullopt;
  }

  const size_t open = idx_;
  const size_t close = tree_.partner[open];
  advance();
  const gsl::span<Item *> items = parse_items_until(close, ctx);
  idx_ = close + 1;
  return items;
}

OpaqueExpr * Parser::parse_paren_payload(std::string_view what)
{
  if (!at(TokenKind::LParen)) {
    error_at(cur().range, "Expected '(' for the " + std::string(what));
    return nullptr;
  }

  const size_t open = idx_;
  OpaqueExpr * payload = group_payload(open);
  idx_ = after_group(open);
  if (payload->empty()) {
    error_at(tree_[open].range.merge(tree_[idx_ - 1].range), "empty " + std::string(what));
    return nullptr;
  }
  return payload;
}

// ============================================================================
// Opaque payloads
// ============================================================================

OpaqueExpr * Parser::make_opaque(size_t begin, size_t end)
{
  std::vector<Token> tokens(tree_.tokens.begin() + begin, tree_.tokens.begin() + end);

  SourceRange range;
  std::string_view text;
  if (begin < end) {
    range = tree_[begin].range.merge(tree_[end - 1].range);
    text = source_.get_slice(range);
  } else {
    const uint32_t pos = begin > 0 ? tree_[begin - 1].end() : tree_[begin].begin();
    range = SourceRange(pos, pos);
  }

  return ast_.create<OpaqueExpr>(
    text, ast_.copy_to_arena_const(tokens), collect_captures(begin, end), range);
}

OpaqueExpr * Parser::group_payload(size_t open_idx)
{
  return make_opaque(open_idx + 1, tree_.partner[open_idx]);
}

std::optional<gsl::span<OpaqueExpr *>> Parser::split_list(size_t open_idx, std::string_view element)
{
  const size_t close = tree_.partner[open_idx];

  std::vector<OpaqueExpr *> out;
  size_t segment = open_idx + 1;
  size_t i = segment;
  while (i < close) {
    const Token & t = tree_[i];
    if (t.kind == TokenKind::Comma) {
      if (i == segment) {
        diags_
          .report(
            DiagCategory::SyntaxError, t.range,
            "malformed " + std::string(element) + " list: empty " + std::string(element),
            "unexpected ','")
          .with_help("remove the extra ','");
        return std::nullopt;
      }
      out.push_back(make_opaque(segment, i));
      segment = ++i;
      continue;
    }
    i = is_open_delim(t.kind) ? after_group(i) : i + 1;
  }

  // A trailing comma leaves an empty final segment, which is allowed.
  if (segment < close) {
    out.push_back(make_opaque(segment, close));
  }
  return ast_.copy_to_arena(out);
}

gsl::span<NameRef *> Parser::collect_captures(size_t begin, size_t end)
{
  std::vector<NameRef *> refs;
  for (size_t i = begin; i < end; ++i) {
    const Token & t = tree_[i];
    if (t.kind != TokenKind::Identifier) {
      continue;
    }

    // Literal macro call `name!(...)`: neither the name nor its payload.
    if (i + 2 < end && tree_[i + 1].kind == TokenKind::Bang &&
        tree_[i + 2].kind == TokenKind::LParen) {
      i = tree_.partner[i + 2];
      continue;
    }

    if (i > begin) {
      const TokenKind prev = tree_[i - 1].kind;
      if (prev == TokenKind::Dot || prev == TokenKind::Arrow || prev == TokenKind::ColonColon) {
        continue;
      }
    }
    if (i + 1 < end && tree_[i + 1].kind == TokenKind::ColonColon) {
      continue;
    }
    if (is_cpp_keyword(t.text)) {
      continue;
    }

    refs.push_back(ast_.create<NameRef>(ast_.intern(t.text), RefRole::Capture, t.range));
  }
  return ast_.copy_to_arena(refs);
}

// ============================================================================
// Front end
// ============================================================================

SpawnProgram * parse_source(const SourceFile & source, AstContext & ast, DiagnosticBag & diags)
{
  Lexer lexer(source.content());
  TokenTree tree = build_token_tree(lexer.lex_all(), diags);
  Parser parser(ast, source, diags, std::move(tree));
  return parser.parse_program();
}

}  // namespace spawn_dsl::syntax
