#include "surql/Ast.hpp"

#include <cctype>

namespace sgw::surql {

namespace {

bool isPlainIdent(const std::string& sName) {
  if (sName.empty()) return false;
  const auto c0 = static_cast<unsigned char>(sName[0]);
  if (std::isalpha(c0) == 0 && sName[0] != '_') return false;
  for (char c : sName) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') return false;
  }
  return true;
}

/// Record keys may also start with a digit, as long as they are not all digits
/// (an all-digit key is a number, and must stay escaped when it was text).
bool isPlainKey(const std::string& sKey) {
  if (sKey.empty()) return false;
  bool bAllDigits = true;
  for (char c : sKey) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && c != '_') return false;
    if (std::isdigit(uc) == 0) bAllDigits = false;
  }
  return !bAllDigits;
}

std::string escapeWith(const std::string& sText, char cQuote) {
  std::string sOut;
  sOut.reserve(sText.size() + 2);
  sOut.push_back(cQuote);
  for (char c : sText) {
    switch (c) {
      case '\\': sOut += "\\\\"; break;
      case '\n': sOut += "\\n"; break;
      case '\r': sOut += "\\r"; break;
      case '\t': sOut += "\\t"; break;
      default:
        if (c == cQuote) sOut.push_back('\\');
        sOut.push_back(c);
    }
  }
  sOut.push_back(cQuote);
  return sOut;
}

/// Body of a raw identifier. Only the backslash and the closing delimiter are
/// escaped; Lexer::lexRaw decodes exactly those two.
std::string escapeRaw(const std::string& sText, const std::string& sClose) {
  std::string sOut;
  sOut.reserve(sText.size());
  std::size_t i = 0;
  while (i < sText.size()) {
    if (sText[i] == '\\') {
      sOut += "\\\\";
      ++i;
    } else if (sText.compare(i, sClose.size(), sClose) == 0) {
      sOut += "\\" + sClose;
      i += sClose.size();
    } else {
      sOut.push_back(sText[i++]);
    }
  }
  return sOut;
}

std::string joinExprs(const std::vector<ExprPtr>& vExprs) {
  std::string sOut;
  for (std::size_t i = 0; i < vExprs.size(); ++i) {
    if (i > 0) sOut += ", ";
    sOut += vExprs[i]->toSql();
  }
  return sOut;
}

std::string whereSql(const ExprPtr& upWhere) {
  return upWhere ? " WHERE " + upWhere->toSql() : std::string{};
}

}  // namespace

std::string quoteString(const std::string& sText) {
  const bool bHasSingle = sText.find('\'') != std::string::npos;
  const bool bHasDouble = sText.find('"') != std::string::npos;
  return escapeWith(sText, bHasSingle && !bHasDouble ? '"' : '\'');
}

std::string quoteIdent(const std::string& sName) {
  if (isPlainIdent(sName)) return sName;
  return "`" + escapeRaw(sName, "`") + "`";
}

// ── Expressions ──────────────────────────────────────────────────────────

std::string Literal::toSql() const {
  switch (kind) {
    case Kind::String: return quoteString(sText);
    case Kind::None: return "NONE";
    case Kind::Null: return "NULL";
    case Kind::Number:
    case Kind::Duration:
    case Kind::Bool:
      break;
  }
  return sText;
}

std::string Param::toSql() const { return "$" + sName; }

std::string Idiom::toSql() const {
  std::string sOut;
  for (std::size_t i = 0; i < vParts.size(); ++i) {
    if (i > 0) sOut += ".";
    sOut += vParts[i] == "*" ? vParts[i] : quoteIdent(vParts[i]);
  }
  return sOut;
}

std::string RecordId::toSql() const {
  std::string sOut = quoteIdent(sTable) + ":";
  switch (keyKind) {
    case KeyKind::Ident:
      if (isPlainKey(sKey)) {
        sOut += sKey;
      } else {
        sOut += "\xE2\x9F\xA8" + escapeRaw(sKey, "\xE2\x9F\xA9") + "\xE2\x9F\xA9";  // ⟨key⟩
      }
      break;
    case KeyKind::Number:
      sOut += sKey;
      break;
    case KeyKind::Generator:
      sOut += sKey + "()";
      break;
    case KeyKind::Complex:
      sOut += upComplexKey->toSql();
      break;
  }
  return sOut;
}

std::string Object::toSql() const {
  if (vEntries.empty()) return "{}";
  std::string sOut = "{ ";
  for (std::size_t i = 0; i < vEntries.size(); ++i) {
    if (i > 0) sOut += ", ";
    const auto& [sKey, upValue] = vEntries[i];
    sOut += isPlainIdent(sKey) ? sKey : quoteString(sKey);
    sOut += ": " + upValue->toSql();
  }
  return sOut + " }";
}

std::string Array::toSql() const { return "[" + joinExprs(vItems) + "]"; }

std::string FunctionCall::toSql() const { return sName + "(" + joinExprs(vArgs) + ")"; }

std::string Unary::toSql() const {
  const std::string sOperand = upOperand->toSql();
  // "- -1" must not collapse into "--", which opens a line comment.
  if (!sOperand.empty() && sOperand[0] == '-') return sOp + " " + sOperand;
  return sOp + sOperand;
}

std::string Binary::toSql() const {
  return upLhs->toSql() + " " + sOp + " " + upRhs->toSql();
}

std::string Graph::toSql() const {
  std::string sOut = upFrom ? upFrom->toSql() : std::string{};
  for (const auto& [sArrow, sTable] : vSteps) {
    sOut += sArrow + (sTable == "?" ? sTable : quoteIdent(sTable));
  }
  return sOut;
}

std::string Parenthesized::toSql() const { return "(" + upInner->toSql() + ")"; }

Subquery::Subquery(std::unique_ptr<Statement> upStmt) : upStatement(std::move(upStmt)) {}
Subquery::~Subquery() = default;

std::string Subquery::toSql() const { return "(" + upStatement->toSql() + ")"; }

// ── Clauses ──────────────────────────────────────────────────────────────

std::string DataClause::toSql() const {
  switch (kind) {
    case Kind::None: return {};
    case Kind::Content: return " CONTENT " + upValue->toSql();
    case Kind::Merge: return " MERGE " + upValue->toSql();
    case Kind::Set: break;
  }

  std::string sOut = " SET ";
  for (std::size_t i = 0; i < vAssignments.size(); ++i) {
    if (i > 0) sOut += ", ";
    const auto& asg = vAssignments[i];
    sOut += asg.sField + " " + asg.sOp + " " + asg.upValue->toSql();
  }
  return sOut;
}

std::string OutputClause::toSql() const {
  switch (kind) {
    case Kind::Default: return {};
    case Kind::None: return " RETURN NONE";
    case Kind::Before: return " RETURN BEFORE";
    case Kind::After: return " RETURN AFTER";
    case Kind::Diff: return " RETURN DIFF";
    case Kind::Fields: break;
  }
  return " RETURN " + joinExprs(vFields);
}

// ── Statements ───────────────────────────────────────────────────────────

std::string CreateStatement::toSql() const {
  return "CREATE " + joinExprs(vTargets) + data.toSql() + output.toSql();
}

std::string UpdateStatement::toSql() const {
  return "UPDATE " + joinExprs(vTargets) + data.toSql() + whereSql(upWhere) + output.toSql();
}

std::string DeleteStatement::toSql() const {
  return "DELETE " + joinExprs(vTargets) + whereSql(upWhere) + output.toSql();
}

std::string SelectStatement::toSql() const {
  std::string sOut = bValue ? "SELECT VALUE " : "SELECT ";
  for (std::size_t i = 0; i < vFields.size(); ++i) {
    if (i > 0) sOut += ", ";
    sOut += vFields[i].upExpr->toSql();
    if (!vFields[i].sAlias.empty()) sOut += " AS " + quoteIdent(vFields[i].sAlias);
  }
  sOut += " FROM " + joinExprs(vFrom) + whereSql(upWhere);

  if (!vOrder.empty()) {
    sOut += " ORDER BY ";
    for (std::size_t i = 0; i < vOrder.size(); ++i) {
      if (i > 0) sOut += ", ";
      sOut += vOrder[i].sPath;
      if (vOrder[i].bDescending) sOut += " DESC";
    }
  }
  if (upLimit) sOut += " LIMIT " + upLimit->toSql();
  if (upStart) sOut += " START " + upStart->toSql();
  return sOut;
}

std::string InsertStatement::toSql() const {
  return "INSERT INTO " + quoteIdent(sTable) + " " + upData->toSql();
}

std::string RelateStatement::toSql() const {
  return "RELATE " + upFrom->toSql() + "->" + quoteIdent(sEdge) + "->" + upTo->toSql() +
         data.toSql() + output.toSql();
}

std::string LetStatement::toSql() const { return "LET $" + sName + " = " + upValue->toSql(); }

std::string ReturnStatement::toSql() const { return "RETURN " + upValue->toSql(); }

std::string TransactionStatement::toSql() const {
  switch (kind) {
    case Kind::Begin: return "BEGIN TRANSACTION";
    case Kind::Commit: return "COMMIT TRANSACTION";
    case Kind::Cancel: break;
  }
  return "CANCEL TRANSACTION";
}

}  // namespace sgw::surql
