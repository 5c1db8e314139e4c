#include "surql/Lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace sgw::surql {

namespace {

const std::string kAngleOpen = "\xE2\x9F\xA8";   // ⟨
const std::string kAngleClose = "\xE2\x9F\xA9";  // ⟩

// Longest operators first so that prefix matching picks the longest.
const std::array<const char*, 13> kMultiPunct = {
    "<->", "->", "<-", "::", "==", "!=", "<=", ">=", "&&", "||", "+=", "-=", "!~",
};

const std::string kSinglePunct = "()[]{},:;.=<>+-*/!?~";

bool isWordStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

/// True if sText is a sequence of <digits><unit> groups (1h30m, 500ms).
/// Two-letter units are listed first so "ms" is not read as "m" + "s".
bool isDuration(const std::string& sText) {
  static const std::array<const char*, 9> kUnits = {"ns", "us", "ms", "s", "m",
                                                    "h",  "d",  "w",  "y"};
  std::size_t uPos = 0;
  if (sText.empty()) return false;
  while (uPos < sText.size()) {
    const std::size_t uStart = uPos;
    while (uPos < sText.size() && isDigit(sText[uPos])) ++uPos;
    if (uPos == uStart) return false;

    bool bMatched = false;
    for (const char* pUnit : kUnits) {
      const std::string sUnit(pUnit);
      if (sText.compare(uPos, sUnit.size(), sUnit) == 0) {
        uPos += sUnit.size();
        bMatched = true;
        break;
      }
    }
    if (!bMatched) return false;
  }
  return true;
}

void appendUtf8(std::string& sOut, unsigned int uCodePoint) {
  if (uCodePoint < 0x80) {
    sOut.push_back(static_cast<char>(uCodePoint));
  } else if (uCodePoint < 0x800) {
    sOut.push_back(static_cast<char>(0xC0 | (uCodePoint >> 6)));
    sOut.push_back(static_cast<char>(0x80 | (uCodePoint & 0x3F)));
  } else {
    sOut.push_back(static_cast<char>(0xE0 | (uCodePoint >> 12)));
    sOut.push_back(static_cast<char>(0x80 | ((uCodePoint >> 6) & 0x3F)));
    sOut.push_back(static_cast<char>(0x80 | (uCodePoint & 0x3F)));
  }
}

}  // namespace

Lexer::Lexer(std::string sInput) : _sInput(std::move(sInput)) {}

common::ParseError Lexer::error(std::size_t uOffset, const std::string& sReason) const {
  return common::ParseError(_sInput, uOffset, sReason);
}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> vTokens;
  _uPos = 0;

  while (true) {
    skipTrivia();
    if (_uPos >= _sInput.size()) {
      vTokens.push_back(Token{TokenKind::End, "", _sInput.size(), _bSpaceBefore});
      break;
    }

    const char c = _sInput[_uPos];
    Token tk;
    if (isDigit(c)) {
      tk = lexNumberOrDuration();
    } else if (isWordStart(c)) {
      tk = lexWord();
    } else if (c == '\'' || c == '"') {
      tk = lexString(c);
    } else if (c == '`') {
      tk = lexRaw("`", 1);
    } else if (_sInput.compare(_uPos, kAngleOpen.size(), kAngleOpen) == 0) {
      tk = lexRaw(kAngleClose, kAngleOpen.size());
    } else if (c == '$') {
      tk = lexParam();
    } else {
      tk = lexPunct();
    }
    vTokens.push_back(std::move(tk));
  }

  return vTokens;
}

void Lexer::skipTrivia() {
  _bSpaceBefore = false;
  while (_uPos < _sInput.size()) {
    const char c = _sInput[_uPos];
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      ++_uPos;
      _bSpaceBefore = true;
      continue;
    }

    const bool bLineComment = c == '#' || _sInput.compare(_uPos, 2, "--") == 0 ||
                              _sInput.compare(_uPos, 2, "//") == 0;
    if (bLineComment) {
      while (_uPos < _sInput.size() && _sInput[_uPos] != '\n') ++_uPos;
      _bSpaceBefore = true;
      continue;
    }

    if (_sInput.compare(_uPos, 2, "/*") == 0) {
      const auto uEnd = _sInput.find("*/", _uPos + 2);
      if (uEnd == std::string::npos) {
        throw error(_uPos, "unterminated block comment");
      }
      _uPos = uEnd + 2;
      _bSpaceBefore = true;
      continue;
    }
    break;
  }
}

Token Lexer::lexNumberOrDuration() {
  const std::size_t uStart = _uPos;
  while (_uPos < _sInput.size() && isWordChar(_sInput[_uPos])) ++_uPos;
  std::string sWord = _sInput.substr(uStart, _uPos - uStart);

  bool bAllDigits = true;
  for (char c : sWord) {
    if (!isDigit(c)) bAllDigits = false;
  }

  if (!bAllDigits) {
    if (isDuration(sWord)) {
      return Token{TokenKind::Duration, std::move(sWord), uStart, _bSpaceBefore};
    }
    // 1e9 / 2E-3
    const auto uE = sWord.find_first_of("eE");
    if (uE == std::string::npos || uE == 0) {
      throw error(uStart, "invalid number '" + sWord + "'");
    }
    _uPos = uStart + uE;
  }

  // Fraction: digits '.' digits
  if (_uPos + 1 < _sInput.size() && _sInput[_uPos] == '.' && isDigit(_sInput[_uPos + 1])) {
    ++_uPos;
    while (_uPos < _sInput.size() && isDigit(_sInput[_uPos])) ++_uPos;
  }

  // Exponent
  if (_uPos < _sInput.size() && (_sInput[_uPos] == 'e' || _sInput[_uPos] == 'E')) {
    std::size_t uExp = _uPos + 1;
    if (uExp < _sInput.size() && (_sInput[uExp] == '+' || _sInput[uExp] == '-')) ++uExp;
    if (uExp >= _sInput.size() || !isDigit(_sInput[uExp])) {
      throw error(_uPos, "malformed exponent");
    }
    _uPos = uExp;
    while (_uPos < _sInput.size() && isDigit(_sInput[_uPos])) ++_uPos;
  }

  if (_uPos < _sInput.size() && isWordStart(_sInput[_uPos])) {
    throw error(uStart, "invalid number '" + _sInput.substr(uStart, _uPos - uStart + 1) + "'");
  }

  return Token{TokenKind::Number, _sInput.substr(uStart, _uPos - uStart), uStart,
               _bSpaceBefore};
}

Token Lexer::lexWord() {
  const std::size_t uStart = _uPos;
  while (_uPos < _sInput.size() && isWordChar(_sInput[_uPos])) ++_uPos;
  return Token{TokenKind::Ident, _sInput.substr(uStart, _uPos - uStart), uStart,
               _bSpaceBefore};
}

Token Lexer::lexString(char cQuote) {
  const std::size_t uStart = _uPos;
  ++_uPos;  // opening quote
  std::string sValue;

  while (_uPos < _sInput.size()) {
    const char c = _sInput[_uPos];
    if (c == cQuote) {
      ++_uPos;
      return Token{TokenKind::String, std::move(sValue), uStart, _bSpaceBefore};
    }
    if (c != '\\') {
      sValue.push_back(c);
      ++_uPos;
      continue;
    }

    // Escape sequence
    if (_uPos + 1 >= _sInput.size()) break;
    const char cEsc = _sInput[_uPos + 1];
    _uPos += 2;
    switch (cEsc) {
      case '\\': sValue.push_back('\\'); break;
      case '\'': sValue.push_back('\''); break;
      case '"': sValue.push_back('"'); break;
      case '/': sValue.push_back('/'); break;
      case 'n': sValue.push_back('\n'); break;
      case 't': sValue.push_back('\t'); break;
      case 'r': sValue.push_back('\r'); break;
      case 'b': sValue.push_back('\b'); break;
      case 'f': sValue.push_back('\f'); break;
      case 'u': {
        if (_uPos + 4 > _sInput.size()) {
          throw error(_uPos - 2, "truncated unicode escape");
        }
        unsigned int uCodePoint = 0;
        for (std::size_t i = 0; i < 4; ++i) {
          const char cHex = _sInput[_uPos + i];
          if (std::isxdigit(static_cast<unsigned char>(cHex)) == 0) {
            throw error(_uPos + i, "invalid unicode escape");
          }
          uCodePoint = uCodePoint * 16 +
                       static_cast<unsigned int>(
                           isDigit(cHex) ? cHex - '0'
                                         : std::tolower(static_cast<unsigned char>(cHex)) -
                                               'a' + 10);
        }
        _uPos += 4;
        appendUtf8(sValue, uCodePoint);
        break;
      }
      default:
        throw error(_uPos - 2, std::string("unknown escape sequence '\\") + cEsc + "'");
    }
  }

  throw error(uStart, "unterminated string literal");
}

Token Lexer::lexRaw(const std::string& sClose, std::size_t uOpenLen) {
  const std::size_t uStart = _uPos;
  _uPos += uOpenLen;

  std::string sValue;
  while (true) {
    if (_uPos >= _sInput.size()) {
      throw error(uStart, "unterminated escaped identifier");
    }
    if (_sInput.compare(_uPos, sClose.size(), sClose) == 0) {
      _uPos += sClose.size();
      break;
    }
    // \<close> and \\ are the only escapes; any other backslash is literal.
    if (_sInput[_uPos] == '\\') {
      if (_sInput.compare(_uPos + 1, sClose.size(), sClose) == 0) {
        sValue += sClose;
        _uPos += 1 + sClose.size();
        continue;
      }
      if (_uPos + 1 < _sInput.size() && _sInput[_uPos + 1] == '\\') {
        sValue.push_back('\\');
        _uPos += 2;
        continue;
      }
    }
    sValue.push_back(_sInput[_uPos++]);
  }
  return Token{TokenKind::RawIdent, std::move(sValue), uStart, _bSpaceBefore};
}

Token Lexer::lexParam() {
  const std::size_t uStart = _uPos;
  ++_uPos;  // '$'
  const std::size_t uNameStart = _uPos;
  while (_uPos < _sInput.size() && isWordChar(_sInput[_uPos])) ++_uPos;
  if (_uPos == uNameStart) {
    throw error(uStart, "expected a parameter name after '$'");
  }
  return Token{TokenKind::Param, _sInput.substr(uNameStart, _uPos - uNameStart), uStart,
               _bSpaceBefore};
}

Token Lexer::lexPunct() {
  const std::size_t uStart = _uPos;
  for (const char* pOp : kMultiPunct) {
    const std::string sOp(pOp);
    if (_sInput.compare(_uPos, sOp.size(), sOp) == 0) {
      _uPos += sOp.size();
      return Token{TokenKind::Punct, sOp, uStart, _bSpaceBefore};
    }
  }

  const char c = _sInput[_uPos];
  if (kSinglePunct.find(c) == std::string::npos) {
    throw error(uStart, std::string("unexpected character '") + c + "'");
  }
  ++_uPos;
  return Token{TokenKind::Punct, std::string(1, c), uStart, _bSpaceBefore};
}

}  // namespace sgw::surql
