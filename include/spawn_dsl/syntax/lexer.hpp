// spawn_dsl/syntax/lexer.hpp - Tokenizer for .spawn sources
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "spawn_dsl/syntax/token.hpp"

namespace spawn_dsl::syntax
{

/**
 * Splits source text into tokens.
 *
 * Comments are dropped; whether whitespace or a comment preceded a token is
 * kept in Token::leading_space so later passes can enforce "no space before
 * the unit" rules. The last token is always Eof.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skips whitespace and comments; returns true if anything was skipped.
  bool skip_trivia();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_quoted(char quote, TokenKind kind);

  [[nodiscard]] Token make(TokenKind kind, uint32_t start) const noexcept;

  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace spawn_dsl::syntax
