#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "surql/Ast.hpp"
#include "surql/Lexer.hpp"

namespace sgw::surql {

/// Recursive-descent parser for the SurrealQL subset the gateway submits:
/// CREATE, UPDATE, DELETE, SELECT, INSERT, RELATE, LET, RETURN and the
/// BEGIN/COMMIT/CANCEL transaction markers.
/// Throws common::ParseError carrying the statement text and byte offset.
/// Class abbreviation: ps
class Parser {
 public:
  explicit Parser(std::string sInput);

  /// Parse exactly one statement. A single trailing ';' is accepted; any
  /// further statement is an error.
  StatementPtr parseSingle();

 private:
  // ── Statements ──
  StatementPtr parseStatement();
  StatementPtr parseCreate();
  StatementPtr parseUpdate();
  StatementPtr parseDelete();
  StatementPtr parseSelect();
  StatementPtr parseInsert();
  StatementPtr parseRelate();
  StatementPtr parseLet();
  StatementPtr parseReturn();
  StatementPtr parseTransactionMarker(TransactionStatement::Kind kind);

  std::vector<ExprPtr> parseTargets();
  DataClause parseData(bool bAllowMerge);
  OutputClause parseOutput();
  ExprPtr parseWhere();
  std::string parseFieldPath();

  // ── Expressions ──
  ExprPtr parseValue();  // expression or bare statement (LET/RETURN right-hand side)
  ExprPtr parseExpression(int iMinPrecedence = 1);
  ExprPtr parseUnary();
  ExprPtr parsePrimary(bool bAllowGraph);
  ExprPtr parseIdentStart(bool bAllowGraph);
  void parseRecordKey(RecordId& riId);
  ExprPtr parseGraphSteps(ExprPtr upFrom);
  ExprPtr parseObject();
  ExprPtr parseArray();
  std::vector<ExprPtr> parseCallArgs();

  /// Recognize a binary operator at the cursor without consuming it.
  /// Returns its precedence (0 when none) and fills the canonical spelling and
  /// the number of tokens it spans.
  int peekBinaryOperator(std::string& sOp, std::size_t& uTokens) const;

  // ── Token helpers ──
  const Token& peek(std::size_t uAhead = 0) const;
  const Token& advance();
  bool isKeyword(const Token& tk, const char* pKeyword) const;
  bool isPunct(const Token& tk, const char* pPunct) const;
  bool acceptKeyword(const char* pKeyword);
  bool acceptPunct(const char* pPunct);
  void expectKeyword(const char* pKeyword);
  void expectPunct(const char* pPunct);
  bool atStatementKeyword() const;
  std::string describe(const Token& tk) const;
  common::ParseError error(const Token& tk, const std::string& sReason) const;

  std::string _sInput;
  std::vector<Token> _vTokens;
  std::size_t _uPos = 0;
  int _iDepth = 0;
};

/// Parse one statement and return it. Convenience over Parser::parseSingle().
StatementPtr parse(const std::string& sStatement);

}  // namespace sgw::surql
