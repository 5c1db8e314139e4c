#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/Errors.hpp"

namespace sgw::surql {

/// Token categories produced by the Lexer.
enum class TokenKind {
  Ident,        // bare word; keywords are idents matched case-insensitively
  Number,       // 12, 3.5, 1e9
  Duration,     // 5m, 1h30m
  String,       // 'text' or "text", unescaped
  RawIdent,     // ⟨text⟩ or `text`, unescaped
  Param,        // $name (text excludes the '$')
  Punct,        // operators and delimiters
  End,
};

/// Class abbreviation: tk
struct Token {
  TokenKind kind = TokenKind::End;
  std::string sText;
  std::size_t uOffset = 0;
  bool bSpaceBefore = false;  // whitespace or a comment precedes the token
};

/// Splits SurrealQL text into tokens. Comments (--, //, #, /* */) are skipped.
/// Throws common::ParseError on malformed input (unterminated string, stray
/// character).
/// Class abbreviation: lx
class Lexer {
 public:
  explicit Lexer(std::string sInput);

  /// Tokenize the full input. The last token is always End.
  std::vector<Token> tokenize();

 private:
  void skipTrivia();
  Token lexNumberOrDuration();
  Token lexWord();
  Token lexString(char cQuote);
  Token lexRaw(const std::string& sClose, std::size_t uOpenLen);
  Token lexParam();
  Token lexPunct();

  common::ParseError error(std::size_t uOffset, const std::string& sReason) const;

  std::string _sInput;
  std::size_t _uPos = 0;
  bool _bSpaceBefore = false;
};

}  // namespace sgw::surql
