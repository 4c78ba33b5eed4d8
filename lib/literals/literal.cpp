// spawn_dsl/literals/literal.cpp - Shared literal helpers
#include "spawn_dsl/literals/literal.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fmt/format.h>

#include "spawn_dsl/syntax/lexer.hpp"

namespace spawn_dsl::literals
{

std::vector<syntax::Token> lex_literal(std::string_view text)
{
  syntax::Lexer lexer(text);
  std::vector<syntax::Token> tokens = lexer.lex_all();
  if (!tokens.empty() && tokens.back().kind == syntax::TokenKind::Eof) {
    tokens.pop_back();
  }
  return tokens;
}

std::string float_literal(float value)
{
  std::string out = fmt::format("{}", value);
  if (out.find_first_of(".e") == std::string::npos) {
    out += ".0";
  }
  out += 'f';
  return out;
}

bool parse_decimal(const syntax::Token & tok, float & out)
{
  if (tok.kind != syntax::TokenKind::Number) {
    return false;
  }

  const std::string_view digits = tok.text.substr(0, tok.text.size() - tok.suffix.size());
  if (digits.size() > 1 && digits[0] == '0' &&
      (digits[1] == 'x' || digits[1] == 'X' || digits[1] == 'b' || digits[1] == 'B')) {
    return false;
  }

  const std::string buf(digits);
  char * end = nullptr;
  errno = 0;
  const float value = std::strtof(buf.c_str(), &end);
  if (end != buf.c_str() + buf.size() || errno == ERANGE || !std::isfinite(value)) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace spawn_dsl::literals
