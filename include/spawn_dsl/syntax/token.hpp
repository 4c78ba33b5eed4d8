// spawn_dsl/syntax/token.hpp - Token kinds produced by the lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "spawn_dsl/basic/source_manager.hpp"

namespace spawn_dsl::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  Identifier,
  Number,         // digits with optional fraction/exponent and an alphanumeric suffix
  StringLiteral,  // text keeps the quotes; payloads are forwarded verbatim
  CharLiteral,

  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  ColonColon,
  Semicolon,
  Dot,
  Arrow,  // ->

  At,
  Hash,
  Bang,
  Question,
  Tilde,

  Plus,
  Minus,
  Star,
  Slash,
  Percent,

  Amp,
  Pipe,
  Caret,

  AndAnd,
  OrOr,

  Eq,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,

  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
  PlusPlus,
  MinusMinus,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;  // exact source slice
  bool leading_space = false;  // whitespace or a comment precedes the token

  /// For Number tokens: the alphabetic suffix (`px` in `10px`), may be empty.
  std::string_view suffix;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }
  [[nodiscard]] bool is_ident(std::string_view name) const noexcept
  {
    return kind == TokenKind::Identifier && text == name;
  }
};

[[nodiscard]] constexpr bool is_open_delim(TokenKind k) noexcept
{
  return k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace;
}

[[nodiscard]] constexpr bool is_close_delim(TokenKind k) noexcept
{
  return k == TokenKind::RParen || k == TokenKind::RBracket || k == TokenKind::RBrace;
}

[[nodiscard]] constexpr TokenKind closing_delim(TokenKind open) noexcept
{
  switch (open) {
    case TokenKind::LParen:
      return TokenKind::RParen;
    case TokenKind::LBracket:
      return TokenKind::RBracket;
    case TokenKind::LBrace:
      return TokenKind::RBrace;
    default:
      return TokenKind::Unknown;
  }
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Number:
      return "number";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::CharLiteral:
      return "char";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::ColonColon:
      return "::";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::At:
      return "@";
    case TokenKind::Hash:
      return "#";
    case TokenKind::Bang:
      return "!";
    case TokenKind::Question:
      return "?";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Caret:
      return "^";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::SlashEq:
      return "/=";
    case TokenKind::PlusPlus:
      return "++";
    case TokenKind::MinusMinus:
      return "--";
  }
  return "<unknown>";
}

}  // namespace spawn_dsl::syntax
