#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sgw::surql {

/// Render text as a SurrealQL string literal. Single quotes are used unless
/// the text holds a single quote and no double quote.
std::string quoteString(const std::string& sText);

/// Render a table or field name, escaping it with backticks when it is not a
/// plain identifier.
std::string quoteIdent(const std::string& sName);

// ── Expressions ──────────────────────────────────────────────────────────

/// Base of every expression node. toSql() prints the canonical form.
struct Expr {
  virtual ~Expr() = default;
  virtual std::string toSql() const = 0;
};

using ExprPtr = std::unique_ptr<Expr>;

/// String, number, duration, boolean, NONE or NULL.
struct Literal : Expr {
  enum class Kind { String, Number, Duration, Bool, None, Null };

  Literal(Kind k, std::string sValue) : kind(k), sText(std::move(sValue)) {}
  std::string toSql() const override;

  Kind kind;
  std::string sText;  // unescaped for strings, "true"/"false" for booleans
};

/// $name
struct Param : Expr {
  explicit Param(std::string sParamName) : sName(std::move(sParamName)) {}
  std::string toSql() const override;

  std::string sName;
};

/// A table name or a dotted field path: name, address.city, *.
struct Idiom : Expr {
  explicit Idiom(std::vector<std::string> vPathParts) : vParts(std::move(vPathParts)) {}
  std::string toSql() const override;

  std::vector<std::string> vParts;
};

/// table:key, where key is an identifier, an integer, escaped text, a
/// generator call (uuid(), ulid(), rand()) or an array/object.
struct RecordId : Expr {
  enum class KeyKind { Ident, Number, Generator, Complex };

  std::string toSql() const override;

  std::string sTable;
  KeyKind keyKind = KeyKind::Ident;
  std::string sKey;       // Ident / Number / Generator name
  ExprPtr upComplexKey;   // Complex
};

/// { key: value, ... }
struct Object : Expr {
  std::string toSql() const override;

  std::vector<std::pair<std::string, ExprPtr>> vEntries;
};

/// [a, b, c]
struct Array : Expr {
  std::string toSql() const override;

  std::vector<ExprPtr> vItems;
};

/// ns::name(args) or name(args)
struct FunctionCall : Expr {
  std::string toSql() const override;

  std::string sName;
  std::vector<ExprPtr> vArgs;
};

/// NOT x, !x, -x
struct Unary : Expr {
  Unary(std::string sOperator, ExprPtr upExpr)
      : sOp(std::move(sOperator)), upOperand(std::move(upExpr)) {}
  std::string toSql() const override;

  std::string sOp;
  ExprPtr upOperand;
};

/// lhs OP rhs
struct Binary : Expr {
  Binary(std::string sOperator, ExprPtr upLeft, ExprPtr upRight)
      : sOp(std::move(sOperator)), upLhs(std::move(upLeft)), upRhs(std::move(upRight)) {}
  std::string toSql() const override;

  std::string sOp;
  ExprPtr upLhs;
  ExprPtr upRhs;
};

/// Graph traversal: $from->edge->table, ->edge->table, <-edge<-table.
struct Graph : Expr {
  std::string toSql() const override;

  ExprPtr upFrom;  // may be null when the traversal starts the expression
  std::vector<std::pair<std::string, std::string>> vSteps;  // (arrow, table or "?")
};

/// ( expr )
struct Parenthesized : Expr {
  explicit Parenthesized(ExprPtr upExpr) : upInner(std::move(upExpr)) {}
  std::string toSql() const override;

  ExprPtr upInner;
};

struct Statement;

/// A statement used as a value: (SELECT ...).
struct Subquery : Expr {
  explicit Subquery(std::unique_ptr<Statement> upStmt);
  ~Subquery() override;
  std::string toSql() const override;

  std::unique_ptr<Statement> upStatement;
};

// ── Statements ───────────────────────────────────────────────────────────

/// Base of every statement node. toSql() prints the canonical form, without
/// the terminating ';'.
struct Statement {
  virtual ~Statement() = default;
  virtual std::string toSql() const = 0;

  /// BEGIN / COMMIT / CANCEL. These delimit a transaction instead of doing
  /// work inside one.
  virtual bool isTransactionControl() const { return false; }
};

using StatementPtr = std::unique_ptr<Statement>;

/// field = value, field += value, field -= value
struct Assignment {
  std::string sField;
  std::string sOp;
  ExprPtr upValue;
};

/// CONTENT / MERGE / SET clause of a write statement.
struct DataClause {
  enum class Kind { None, Content, Merge, Set };

  std::string toSql() const;  // leading space included when present

  Kind kind = Kind::None;
  ExprPtr upValue;
  std::vector<Assignment> vAssignments;
};

/// RETURN clause of a write statement.
struct OutputClause {
  enum class Kind { Default, None, Before, After, Diff, Fields };

  std::string toSql() const;  // leading space included when present

  Kind kind = Kind::Default;
  std::vector<ExprPtr> vFields;
};

struct CreateStatement : Statement {
  std::string toSql() const override;

  std::vector<ExprPtr> vTargets;
  DataClause data;
  OutputClause output;
};

struct UpdateStatement : Statement {
  std::string toSql() const override;

  std::vector<ExprPtr> vTargets;
  DataClause data;
  ExprPtr upWhere;
  OutputClause output;
};

struct DeleteStatement : Statement {
  std::string toSql() const override;

  std::vector<ExprPtr> vTargets;
  ExprPtr upWhere;
  OutputClause output;
};

struct SelectStatement : Statement {
  struct Field {
    ExprPtr upExpr;
    std::string sAlias;
  };
  struct Order {
    std::string sPath;
    bool bDescending = false;
  };

  std::string toSql() const override;

  bool bValue = false;  // SELECT VALUE
  std::vector<Field> vFields;
  std::vector<ExprPtr> vFrom;
  ExprPtr upWhere;
  std::vector<Order> vOrder;
  ExprPtr upLimit;
  ExprPtr upStart;
};

struct InsertStatement : Statement {
  std::string toSql() const override;

  std::string sTable;
  ExprPtr upData;
};

struct RelateStatement : Statement {
  std::string toSql() const override;

  ExprPtr upFrom;
  std::string sEdge;
  ExprPtr upTo;
  DataClause data;
  OutputClause output;
};

struct LetStatement : Statement {
  std::string toSql() const override;

  std::string sName;
  ExprPtr upValue;
};

struct ReturnStatement : Statement {
  std::string toSql() const override;

  ExprPtr upValue;
};

/// BEGIN TRANSACTION / COMMIT TRANSACTION / CANCEL TRANSACTION
struct TransactionStatement : Statement {
  enum class Kind { Begin, Commit, Cancel };

  explicit TransactionStatement(Kind k) : kind(k) {}
  std::string toSql() const override;
  bool isTransactionControl() const override { return true; }

  Kind kind;
};

}  // namespace sgw::surql
