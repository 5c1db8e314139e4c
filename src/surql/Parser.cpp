#include "surql/Parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace sgw::surql {

namespace {

constexpr int kMaxDepth = 128;

std::string toUpper(std::string sText) {
  std::transform(sText.begin(), sText.end(), sText.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return sText;
}

// Words that start or delimit clauses and can never be a bare field name.
const std::array<const char*, 25> kReserved = {
    "SELECT", "FROM",   "WHERE", "CREATE", "UPDATE", "DELETE",      "INSERT",
    "INTO",   "RELATE", "LET",   "RETURN", "CONTENT", "MERGE",      "SET",
    "ORDER",  "BY",     "LIMIT", "START",  "AND",     "OR",         "BEGIN",
    "COMMIT", "CANCEL", "AS",    "TRANSACTION",
};

const std::array<const char*, 8> kStatementKeywords = {
    "SELECT", "CREATE", "UPDATE", "DELETE", "INSERT", "RELATE", "LET", "RETURN",
};

// Keyword comparison operators, all at comparison precedence.
const std::array<const char*, 10> kWordOperators = {
    "CONTAINS",   "CONTAINSNOT", "CONTAINSALL", "CONTAINSANY", "CONTAINSNONE",
    "INSIDE",     "NOTINSIDE",   "ALLINSIDE",   "ANYINSIDE",   "NONEINSIDE",
};

const std::array<const char*, 3> kGenerators = {"uuid", "ulid", "rand"};

bool isReserved(const std::string& sUpper) {
  return std::find(kReserved.begin(), kReserved.end(), sUpper) != kReserved.end();
}

bool isAllDigits(const std::string& sText) {
  return !sText.empty() && std::all_of(sText.begin(), sText.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

/// Tracks expression nesting so hostile input cannot exhaust the stack.
class DepthGuard {
 public:
  explicit DepthGuard(int& iDepth) : _iDepth(iDepth) { ++_iDepth; }
  ~DepthGuard() { --_iDepth; }

  DepthGuard(const DepthGuard&) = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;

 private:
  int& _iDepth;
};

}  // namespace

Parser::Parser(std::string sInput) : _sInput(std::move(sInput)) {
  Lexer lx(_sInput);
  _vTokens = lx.tokenize();
}

StatementPtr parse(const std::string& sStatement) {
  Parser ps(sStatement);
  return ps.parseSingle();
}

StatementPtr Parser::parseSingle() {
  if (peek().kind == TokenKind::End) {
    throw error(peek(), "empty statement");
  }

  auto upStmt = parseStatement();
  acceptPunct(";");

  if (peek().kind != TokenKind::End) {
    throw error(peek(), "expected a single statement, found " + describe(peek()));
  }
  return upStmt;
}

// ── Token helpers ────────────────────────────────────────────────────────

const Token& Parser::peek(std::size_t uAhead) const {
  const std::size_t uIdx = std::min(_uPos + uAhead, _vTokens.size() - 1);
  return _vTokens[uIdx];
}

const Token& Parser::advance() {
  const Token& tk = _vTokens[_uPos];
  if (_uPos + 1 < _vTokens.size()) ++_uPos;
  return tk;
}

bool Parser::isKeyword(const Token& tk, const char* pKeyword) const {
  return tk.kind == TokenKind::Ident && toUpper(tk.sText) == pKeyword;
}

bool Parser::isPunct(const Token& tk, const char* pPunct) const {
  return tk.kind == TokenKind::Punct && tk.sText == pPunct;
}

bool Parser::acceptKeyword(const char* pKeyword) {
  if (!isKeyword(peek(), pKeyword)) return false;
  advance();
  return true;
}

bool Parser::acceptPunct(const char* pPunct) {
  if (!isPunct(peek(), pPunct)) return false;
  advance();
  return true;
}

void Parser::expectKeyword(const char* pKeyword) {
  if (!acceptKeyword(pKeyword)) {
    throw error(peek(), std::string("expected ") + pKeyword + ", found " + describe(peek()));
  }
}

void Parser::expectPunct(const char* pPunct) {
  if (!acceptPunct(pPunct)) {
    throw error(peek(), std::string("expected '") + pPunct + "', found " + describe(peek()));
  }
}

bool Parser::atStatementKeyword() const {
  const Token& tk = peek();
  if (tk.kind != TokenKind::Ident) return false;
  const std::string sUpper = toUpper(tk.sText);
  return std::find(kStatementKeywords.begin(), kStatementKeywords.end(), sUpper) !=
         kStatementKeywords.end();
}

std::string Parser::describe(const Token& tk) const {
  switch (tk.kind) {
    case TokenKind::End: return "end of input";
    case TokenKind::String: return "string literal";
    case TokenKind::Param: return "'$" + tk.sText + "'";
    default: break;
  }
  return "'" + tk.sText + "'";
}

common::ParseError Parser::error(const Token& tk, const std::string& sReason) const {
  return common::ParseError(_sInput, tk.uOffset, sReason);
}

// ── Statements ───────────────────────────────────────────────────────────

StatementPtr Parser::parseStatement() {
  const Token& tk = peek();
  if (tk.kind != TokenKind::Ident) {
    throw error(tk, "expected a statement, found " + describe(tk));
  }

  const std::string sKeyword = toUpper(tk.sText);
  if (sKeyword == "CREATE") return parseCreate();
  if (sKeyword == "UPDATE") return parseUpdate();
  if (sKeyword == "DELETE") return parseDelete();
  if (sKeyword == "SELECT") return parseSelect();
  if (sKeyword == "INSERT") return parseInsert();
  if (sKeyword == "RELATE") return parseRelate();
  if (sKeyword == "LET") return parseLet();
  if (sKeyword == "RETURN") return parseReturn();
  if (sKeyword == "BEGIN") return parseTransactionMarker(TransactionStatement::Kind::Begin);
  if (sKeyword == "COMMIT") return parseTransactionMarker(TransactionStatement::Kind::Commit);
  if (sKeyword == "CANCEL") return parseTransactionMarker(TransactionStatement::Kind::Cancel);

  throw error(tk, "expected a statement, found " + describe(tk));
}

StatementPtr Parser::parseTransactionMarker(TransactionStatement::Kind kind) {
  advance();
  acceptKeyword("TRANSACTION");
  return std::make_unique<TransactionStatement>(kind);
}

StatementPtr Parser::parseCreate() {
  expectKeyword("CREATE");
  auto upStmt = std::make_unique<CreateStatement>();
  upStmt->vTargets = parseTargets();
  upStmt->data = parseData(false);
  upStmt->output = parseOutput();
  return upStmt;
}

StatementPtr Parser::parseUpdate() {
  expectKeyword("UPDATE");
  auto upStmt = std::make_unique<UpdateStatement>();
  upStmt->vTargets = parseTargets();
  upStmt->data = parseData(true);
  upStmt->upWhere = parseWhere();
  upStmt->output = parseOutput();
  return upStmt;
}

StatementPtr Parser::parseDelete() {
  expectKeyword("DELETE");
  acceptKeyword("FROM");
  auto upStmt = std::make_unique<DeleteStatement>();
  upStmt->vTargets = parseTargets();
  upStmt->upWhere = parseWhere();
  upStmt->output = parseOutput();
  return upStmt;
}

StatementPtr Parser::parseSelect() {
  expectKeyword("SELECT");
  auto upStmt = std::make_unique<SelectStatement>();
  upStmt->bValue = acceptKeyword("VALUE");

  do {
    SelectStatement::Field fld;
    if (isPunct(peek(), "*")) {
      advance();
      fld.upExpr = std::make_unique<Idiom>(std::vector<std::string>{"*"});
    } else {
      fld.upExpr = parseExpression();
      if (acceptKeyword("AS")) {
        const Token& tkAlias = advance();
        if (tkAlias.kind != TokenKind::Ident && tkAlias.kind != TokenKind::RawIdent) {
          throw error(tkAlias, "expected an alias after AS, found " + describe(tkAlias));
        }
        fld.sAlias = tkAlias.sText;
      }
    }
    upStmt->vFields.push_back(std::move(fld));
  } while (acceptPunct(","));

  expectKeyword("FROM");
  upStmt->vFrom = parseTargets();
  upStmt->upWhere = parseWhere();

  if (acceptKeyword("ORDER")) {
    acceptKeyword("BY");
    do {
      SelectStatement::Order ord;
      ord.sPath = parseFieldPath();
      if (acceptKeyword("DESC")) {
        ord.bDescending = true;
      } else {
        acceptKeyword("ASC");
      }
      upStmt->vOrder.push_back(std::move(ord));
    } while (acceptPunct(","));
  }

  if (acceptKeyword("LIMIT")) {
    acceptKeyword("BY");
    upStmt->upLimit = parsePrimary(false);
  }

  if (acceptKeyword("START")) {
    acceptKeyword("AT");
    upStmt->upStart = parsePrimary(false);
  }

  return upStmt;
}

StatementPtr Parser::parseInsert() {
  expectKeyword("INSERT");
  expectKeyword("INTO");
  auto upStmt = std::make_unique<InsertStatement>();

  const Token& tkTable = advance();
  if (tkTable.kind != TokenKind::Ident && tkTable.kind != TokenKind::RawIdent) {
    throw error(tkTable, "expected a table name, found " + describe(tkTable));
  }
  upStmt->sTable = tkTable.sText;

  const Token& tkData = peek();
  if (!isPunct(tkData, "{") && !isPunct(tkData, "[") && tkData.kind != TokenKind::Param) {
    throw error(tkData, "expected an object, array or parameter, found " + describe(tkData));
  }
  upStmt->upData = parsePrimary(false);
  return upStmt;
}

StatementPtr Parser::parseRelate() {
  expectKeyword("RELATE");
  auto upStmt = std::make_unique<RelateStatement>();
  upStmt->upFrom = parsePrimary(false);
  expectPunct("->");

  const Token& tkEdge = advance();
  if (tkEdge.kind != TokenKind::Ident && tkEdge.kind != TokenKind::RawIdent) {
    throw error(tkEdge, "expected an edge table, found " + describe(tkEdge));
  }
  upStmt->sEdge = tkEdge.sText;

  expectPunct("->");
  upStmt->upTo = parsePrimary(false);
  upStmt->data = parseData(false);
  upStmt->output = parseOutput();
  return upStmt;
}

StatementPtr Parser::parseLet() {
  expectKeyword("LET");
  const Token& tkName = advance();
  if (tkName.kind != TokenKind::Param) {
    throw error(tkName, "expected a $parameter after LET, found " + describe(tkName));
  }
  auto upStmt = std::make_unique<LetStatement>();
  upStmt->sName = tkName.sText;
  expectPunct("=");
  upStmt->upValue = parseValue();
  return upStmt;
}

StatementPtr Parser::parseReturn() {
  expectKeyword("RETURN");
  auto upStmt = std::make_unique<ReturnStatement>();
  upStmt->upValue = parseValue();
  return upStmt;
}

std::vector<ExprPtr> Parser::parseTargets() {
  std::vector<ExprPtr> vTargets;
  do {
    vTargets.push_back(parseExpression());
  } while (acceptPunct(","));
  return vTargets;
}

DataClause Parser::parseData(bool bAllowMerge) {
  DataClause dc;
  if (acceptKeyword("CONTENT")) {
    dc.kind = DataClause::Kind::Content;
    dc.upValue = parsePrimary(false);
    return dc;
  }

  if (bAllowMerge && acceptKeyword("MERGE")) {
    dc.kind = DataClause::Kind::Merge;
    dc.upValue = parsePrimary(false);
    return dc;
  }

  if (acceptKeyword("SET")) {
    dc.kind = DataClause::Kind::Set;
    do {
      Assignment asg;
      asg.sField = parseFieldPath();
      const Token& tkOp = advance();
      if (!isPunct(tkOp, "=") && !isPunct(tkOp, "+=") && !isPunct(tkOp, "-=")) {
        throw error(tkOp, "expected '=', '+=' or '-=', found " + describe(tkOp));
      }
      asg.sOp = tkOp.sText;
      asg.upValue = parseExpression();
      dc.vAssignments.push_back(std::move(asg));
    } while (acceptPunct(","));
  }
  return dc;
}

OutputClause Parser::parseOutput() {
  OutputClause oc;
  if (!acceptKeyword("RETURN")) return oc;

  if (acceptKeyword("NONE")) {
    oc.kind = OutputClause::Kind::None;
  } else if (acceptKeyword("BEFORE")) {
    oc.kind = OutputClause::Kind::Before;
  } else if (acceptKeyword("AFTER")) {
    oc.kind = OutputClause::Kind::After;
  } else if (acceptKeyword("DIFF")) {
    oc.kind = OutputClause::Kind::Diff;
  } else {
    oc.kind = OutputClause::Kind::Fields;
    do {
      oc.vFields.push_back(parseExpression());
    } while (acceptPunct(","));
  }
  return oc;
}

ExprPtr Parser::parseWhere() {
  if (!acceptKeyword("WHERE")) return nullptr;
  return parseExpression();
}

std::string Parser::parseFieldPath() {
  std::vector<std::string> vParts;
  do {
    const Token& tk = advance();
    if (tk.kind != TokenKind::Ident && tk.kind != TokenKind::RawIdent) {
      throw error(tk, "expected a field name, found " + describe(tk));
    }
    if (tk.kind == TokenKind::Ident && isReserved(toUpper(tk.sText))) {
      throw error(tk, "unexpected keyword '" + tk.sText + "'");
    }
    vParts.push_back(tk.sText);
  } while (acceptPunct("."));
  return Idiom(std::move(vParts)).toSql();
}

// ── Expressions ──────────────────────────────────────────────────────────

ExprPtr Parser::parseValue() {
  if (atStatementKeyword()) {
    DepthGuard dg(_iDepth);
    if (_iDepth > kMaxDepth) throw error(peek(), "statement nested too deeply");
    return std::make_unique<Subquery>(parseStatement());
  }
  return parseExpression();
}

int Parser::peekBinaryOperator(std::string& sOp, std::size_t& uTokens) const {
  const Token& tk = peek();
  uTokens = 1;

  if (tk.kind == TokenKind::Punct) {
    const std::string& s = tk.sText;
    if (s == "||") { sOp = "OR"; return 1; }
    if (s == "&&") { sOp = "AND"; return 2; }
    if (s == "=" || s == "==" || s == "!=" || s == "<" || s == "<=" || s == ">" ||
        s == ">=" || s == "~" || s == "!~") {
      sOp = s;
      return 3;
    }
    if (s == "+" || s == "-") { sOp = s; return 4; }
    if (s == "*" || s == "/") { sOp = s; return 5; }
    return 0;
  }

  if (tk.kind != TokenKind::Ident) return 0;

  const std::string sUpper = toUpper(tk.sText);
  if (sUpper == "OR") { sOp = "OR"; return 1; }
  if (sUpper == "AND") { sOp = "AND"; return 2; }
  if (sUpper == "IN") { sOp = "IN"; return 3; }
  if (sUpper == "IS") {
    if (isKeyword(peek(1), "NOT")) {
      sOp = "!=";
      uTokens = 2;
    } else {
      sOp = "=";
    }
    return 3;
  }
  if (sUpper == "NOT" && isKeyword(peek(1), "IN")) {
    sOp = "NOT IN";
    uTokens = 2;
    return 3;
  }
  if (std::find(kWordOperators.begin(), kWordOperators.end(), sUpper) !=
      kWordOperators.end()) {
    sOp = sUpper;
    return 3;
  }
  return 0;
}

ExprPtr Parser::parseExpression(int iMinPrecedence) {
  DepthGuard dg(_iDepth);
  if (_iDepth > kMaxDepth) throw error(peek(), "expression nested too deeply");

  auto upLhs = parseUnary();
  while (true) {
    std::string sOp;
    std::size_t uTokens = 0;
    const int iPrec = peekBinaryOperator(sOp, uTokens);
    if (iPrec == 0 || iPrec < iMinPrecedence) break;

    for (std::size_t i = 0; i < uTokens; ++i) advance();
    auto upRhs = parseExpression(iPrec + 1);
    upLhs = std::make_unique<Binary>(sOp, std::move(upLhs), std::move(upRhs));
  }
  return upLhs;
}

ExprPtr Parser::parseUnary() {
  DepthGuard dg(_iDepth);
  if (_iDepth > kMaxDepth) throw error(peek(), "expression nested too deeply");

  if (acceptPunct("!") || acceptKeyword("NOT")) {
    return std::make_unique<Unary>("!", parseUnary());
  }
  if (acceptPunct("-")) {
    return std::make_unique<Unary>("-", parseUnary());
  }
  return parsePrimary(true);
}

ExprPtr Parser::parsePrimary(bool bAllowGraph) {
  const Token& tk = peek();
  ExprPtr upExpr;

  switch (tk.kind) {
    case TokenKind::String:
      upExpr = std::make_unique<Literal>(Literal::Kind::String, advance().sText);
      break;
    case TokenKind::Number:
      upExpr = std::make_unique<Literal>(Literal::Kind::Number, advance().sText);
      break;
    case TokenKind::Duration:
      upExpr = std::make_unique<Literal>(Literal::Kind::Duration, advance().sText);
      break;
    case TokenKind::Param:
      upExpr = std::make_unique<Param>(advance().sText);
      break;
    case TokenKind::Ident:
    case TokenKind::RawIdent:
      return parseIdentStart(bAllowGraph);
    case TokenKind::Punct:
      if (isPunct(tk, "{")) {
        upExpr = parseObject();
      } else if (isPunct(tk, "[")) {
        upExpr = parseArray();
      } else if (isPunct(tk, "(")) {
        advance();
        if (atStatementKeyword()) {
          upExpr = std::make_unique<Subquery>(parseStatement());
        } else {
          upExpr = std::make_unique<Parenthesized>(parseExpression());
        }
        expectPunct(")");
      } else if (bAllowGraph && (isPunct(tk, "->") || isPunct(tk, "<-") || isPunct(tk, "<->"))) {
        return parseGraphSteps(nullptr);
      } else {
        throw error(tk, "expected a value, found " + describe(tk));
      }
      break;
    case TokenKind::End:
      throw error(tk, "expected a value, found end of input");
  }

  if (bAllowGraph) return parseGraphSteps(std::move(upExpr));
  return upExpr;
}

ExprPtr Parser::parseIdentStart(bool bAllowGraph) {
  const Token& tk = advance();
  const std::string sUpper = toUpper(tk.sText);

  if (tk.kind == TokenKind::Ident) {
    if (sUpper == "TRUE" || sUpper == "FALSE") {
      return std::make_unique<Literal>(Literal::Kind::Bool, sUpper == "TRUE" ? "true" : "false");
    }
    if (sUpper == "NONE") return std::make_unique<Literal>(Literal::Kind::None, "");
    if (sUpper == "NULL") return std::make_unique<Literal>(Literal::Kind::Null, "");
    if (isReserved(sUpper)) {
      throw error(tk, "unexpected keyword '" + tk.sText + "'");
    }

    // ns::fn(...)
    if (isPunct(peek(), "::")) {
      auto upCall = std::make_unique<FunctionCall>();
      upCall->sName = tk.sText;
      while (acceptPunct("::")) {
        const Token& tkPart = advance();
        if (tkPart.kind != TokenKind::Ident) {
          throw error(tkPart, "expected a function name, found " + describe(tkPart));
        }
        upCall->sName += "::" + tkPart.sText;
      }
      upCall->vArgs = parseCallArgs();
      ExprPtr upExpr = std::move(upCall);
      if (bAllowGraph) return parseGraphSteps(std::move(upExpr));
      return upExpr;
    }

    // fn(...) written without a namespace
    if (isPunct(peek(), "(") && !peek().bSpaceBefore) {
      auto upCall = std::make_unique<FunctionCall>();
      upCall->sName = tk.sText;
      upCall->vArgs = parseCallArgs();
      ExprPtr upExpr = std::move(upCall);
      if (bAllowGraph) return parseGraphSteps(std::move(upExpr));
      return upExpr;
    }
  }

  // table:key (no whitespace on either side of ':')
  if (isPunct(peek(), ":") && !peek().bSpaceBefore && !peek(1).bSpaceBefore) {
    advance();
    auto upId = std::make_unique<RecordId>();
    upId->sTable = tk.sText;
    parseRecordKey(*upId);
    ExprPtr upExpr = std::move(upId);
    if (bAllowGraph) return parseGraphSteps(std::move(upExpr));
    return upExpr;
  }

  // field or field.path
  std::vector<std::string> vParts{tk.sText};
  while (isPunct(peek(), ".")) {
    advance();
    const Token& tkPart = advance();
    if (isPunct(tkPart, "*")) {
      vParts.push_back("*");
    } else if (tkPart.kind == TokenKind::Ident || tkPart.kind == TokenKind::RawIdent) {
      vParts.push_back(tkPart.sText);
    } else {
      throw error(tkPart, "expected a field name after '.', found " + describe(tkPart));
    }
  }
  ExprPtr upExpr = std::make_unique<Idiom>(std::move(vParts));
  if (bAllowGraph) return parseGraphSteps(std::move(upExpr));
  return upExpr;
}

void Parser::parseRecordKey(RecordId& riId) {
  const Token& tk = peek();

  if (tk.kind == TokenKind::Number) {
    if (!isAllDigits(tk.sText)) {
      throw error(tk, "record keys must be integers, found " + describe(tk));
    }
    riId.keyKind = RecordId::KeyKind::Number;
    riId.sKey = advance().sText;
    return;
  }

  if (tk.kind == TokenKind::RawIdent) {
    riId.keyKind = RecordId::KeyKind::Ident;
    riId.sKey = advance().sText;
    return;
  }

  if (tk.kind == TokenKind::Ident) {
    advance();
    if (isPunct(peek(), "(") && !peek().bSpaceBefore) {
      if (std::find(kGenerators.begin(), kGenerators.end(), tk.sText) == kGenerators.end()) {
        throw error(tk, "unknown record id generator '" + tk.sText + "()'");
      }
      advance();
      expectPunct(")");
      riId.keyKind = RecordId::KeyKind::Generator;
      riId.sKey = tk.sText;
      return;
    }
    riId.keyKind = RecordId::KeyKind::Ident;
    riId.sKey = tk.sText;
    return;
  }

  if (isPunct(tk, "[")) {
    riId.keyKind = RecordId::KeyKind::Complex;
    riId.upComplexKey = parseArray();
    return;
  }

  if (isPunct(tk, "{")) {
    riId.keyKind = RecordId::KeyKind::Complex;
    riId.upComplexKey = parseObject();
    return;
  }

  throw error(tk, "expected a record key, found " + describe(tk));
}

ExprPtr Parser::parseGraphSteps(ExprPtr upFrom) {
  if (!isPunct(peek(), "->") && !isPunct(peek(), "<-") && !isPunct(peek(), "<->")) {
    return upFrom;
  }

  auto upGraph = std::make_unique<Graph>();
  upGraph->upFrom = std::move(upFrom);
  while (isPunct(peek(), "->") || isPunct(peek(), "<-") || isPunct(peek(), "<->")) {
    std::string sArrow = advance().sText;
    const Token& tkTarget = advance();
    if (isPunct(tkTarget, "?")) {
      upGraph->vSteps.emplace_back(std::move(sArrow), "?");
    } else if (tkTarget.kind == TokenKind::Ident || tkTarget.kind == TokenKind::RawIdent) {
      upGraph->vSteps.emplace_back(std::move(sArrow), tkTarget.sText);
    } else {
      throw error(tkTarget, "expected a table after '" + sArrow + "', found " +
                                describe(tkTarget));
    }
  }
  return upGraph;
}

ExprPtr Parser::parseObject() {
  DepthGuard dg(_iDepth);
  if (_iDepth > kMaxDepth) throw error(peek(), "object nested too deeply");

  expectPunct("{");
  auto upObj = std::make_unique<Object>();
  while (!isPunct(peek(), "}")) {
    const Token& tkKey = advance();
    if (tkKey.kind != TokenKind::Ident && tkKey.kind != TokenKind::RawIdent &&
        tkKey.kind != TokenKind::String && tkKey.kind != TokenKind::Number) {
      throw error(tkKey, "expected an object key, found " + describe(tkKey));
    }
    std::string sKey = tkKey.sText;
    expectPunct(":");
    upObj->vEntries.emplace_back(std::move(sKey), parseExpression());
    if (!acceptPunct(",")) break;
  }
  expectPunct("}");
  return upObj;
}

ExprPtr Parser::parseArray() {
  DepthGuard dg(_iDepth);
  if (_iDepth > kMaxDepth) throw error(peek(), "array nested too deeply");

  expectPunct("[");
  auto upArr = std::make_unique<Array>();
  while (!isPunct(peek(), "]")) {
    upArr->vItems.push_back(parseExpression());
    if (!acceptPunct(",")) break;
  }
  expectPunct("]");
  return upArr;
}

std::vector<ExprPtr> Parser::parseCallArgs() {
  expectPunct("(");
  std::vector<ExprPtr> vArgs;
  while (!isPunct(peek(), ")")) {
    vArgs.push_back(parseExpression());
    if (!acceptPunct(",")) break;
  }
  expectPunct(")");
  return vArgs;
}

}  // namespace sgw::surql
