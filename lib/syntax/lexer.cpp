// spawn_dsl/syntax/lexer.cpp - Tokenizer implementation
#include "spawn_dsl/syntax/lexer.hpp"

#include <cctype>

namespace spawn_dsl::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(unsigned char c) { return std::isdigit(c) != 0; }

struct Punct
{
  std::string_view spelling;
  TokenKind kind;
};

// Longest spellings first.
constexpr Punct k_multi_char_puncts[] = {
  {"::", TokenKind::ColonColon}, {"->", TokenKind::Arrow},      {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},       {"==", TokenKind::EqEq},       {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},         {">=", TokenKind::Ge},         {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},    {"*=", TokenKind::StarEq},     {"/=", TokenKind::SlashEq},
  {"++", TokenKind::PlusPlus},   {"--", TokenKind::MinusMinus},
};

TokenKind single_char_kind(char c)
{
  switch (c) {
    case '(':
      return TokenKind::LParen;
    case ')':
      return TokenKind::RParen;
    case '{':
      return TokenKind::LBrace;
    case '}':
      return TokenKind::RBrace;
    case '[':
      return TokenKind::LBracket;
    case ']':
      return TokenKind::RBracket;
    case ',':
      return TokenKind::Comma;
    case ':':
      return TokenKind::Colon;
    case ';':
      return TokenKind::Semicolon;
    case '.':
      return TokenKind::Dot;
    case '@':
      return TokenKind::At;
    case '#':
      return TokenKind::Hash;
    case '!':
      return TokenKind::Bang;
    case '?':
      return TokenKind::Question;
    case '~':
      return TokenKind::Tilde;
    case '+':
      return TokenKind::Plus;
    case '-':
      return TokenKind::Minus;
    case '*':
      return TokenKind::Star;
    case '/':
      return TokenKind::Slash;
    case '%':
      return TokenKind::Percent;
    case '&':
      return TokenKind::Amp;
    case '|':
      return TokenKind::Pipe;
    case '^':
      return TokenKind::Caret;
    case '=':
      return TokenKind::Eq;
    case '<':
      return TokenKind::Lt;
    case '>':
      return TokenKind::Gt;
    default:
      return TokenKind::Unknown;
  }
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::skip_trivia()
{
  const size_t start = pos_;
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance();
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance();
      }
      continue;
    }
    if (starts_with("/*")) {
      // Unterminated block comments run to end of input.
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance();
      }
      if (!eof()) {
        advance(2);
      }
      continue;
    }
    break;
  }
  return pos_ != start;
}

Token Lexer::make(TokenKind kind, uint32_t start) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(start, static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  return t;
}

Token Lexer::lex_identifier()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance();
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  return make(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'b' || peek(1) == 'B')) {
    advance(2);
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance();
    }
    return make(TokenKind::Number, start);
  }

  while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
    advance();
  }

  if (peek() == '.' && is_digit(static_cast<unsigned char>(peek(1)))) {
    advance();
    while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
      advance();
    }
  }

  // Exponent only when digits follow; `1em` is a number with suffix `em`.
  if (peek() == 'e' || peek() == 'E') {
    const bool signed_exp = (peek(1) == '+' || peek(1) == '-');
    const char first = signed_exp ? peek(2) : peek(1);
    if (is_digit(static_cast<unsigned char>(first))) {
      advance(signed_exp ? 2 : 1);
      while (!eof() && is_digit(static_cast<unsigned char>(peek()))) {
        advance();
      }
    }
  }

  const size_t suffix_start = pos_;
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }

  Token t = make(TokenKind::Number, start);
  t.suffix = src_.substr(suffix_start, pos_ - suffix_start);
  return t;
}

Token Lexer::lex_quoted(char quote, TokenKind kind)
{
  const auto start = static_cast<uint32_t>(pos_);
  advance();

  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      advance();
      return make(kind, start);
    }
    if (c == '\n') {
      break;
    }
    if (c == '\\') {
      advance();
      if (eof()) {
        break;
      }
    }
    advance();
  }

  // Unterminated literal; the token tree reports it.
  return make(TokenKind::Unknown, start);
}

Token Lexer::next_token()
{
  const bool spaced = skip_trivia();

  Token t;
  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    t.kind = TokenKind::Eof;
    t.range = SourceRange(at, at);
  } else {
    const auto c = static_cast<unsigned char>(peek());
    if (is_ident_start(c)) {
      t = lex_identifier();
    } else if (is_digit(c)) {
      t = lex_number();
    } else if (c == '"') {
      t = lex_quoted('"', TokenKind::StringLiteral);
    } else if (c == '\'') {
      t = lex_quoted('\'', TokenKind::CharLiteral);
    } else {
      const auto start = static_cast<uint32_t>(pos_);
      TokenKind kind = TokenKind::Unknown;
      for (const auto & p : k_multi_char_puncts) {
        if (starts_with(p.spelling)) {
          kind = p.kind;
          advance(p.spelling.size());
          break;
        }
      }
      if (kind == TokenKind::Unknown) {
        kind = single_char_kind(peek());
        advance();
      }
      t = make(kind, start);
    }
  }

  t.leading_space = spaced;
  return t;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    out.push_back(next_token());
    if (out.back().kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace spawn_dsl::syntax
