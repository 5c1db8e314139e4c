#include "dal/StatementBatch.hpp"

#include "FakeSession.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "surql/Lexer.hpp"

#include <gtest/gtest.h>

using sgw::common::ExecutionError;
using sgw::common::IndeterminateOutcomeError;
using sgw::common::ParseError;
using sgw::common::TxPhase;
using sgw::dal::StatementBatch;
using sgw::test::FakeSession;

class StatementBatchTest : public ::testing::Test {
 protected:
  StatementBatch _sbBatch{sgw::common::Logger::null()};
  FakeSession _fsSession;
};

TEST_F(StatementBatchTest, StartsEmpty) {
  EXPECT_TRUE(_sbBatch.empty());
  EXPECT_EQ(_sbBatch.size(), 0u);
}

TEST_F(StatementBatchTest, AddStoresCanonicalForm) {
  _sbBatch.add("create person:uuid() content {name:'A'};");
  ASSERT_EQ(_sbBatch.size(), 1u);
  EXPECT_EQ(_sbBatch.statements()[0], "CREATE person:uuid() CONTENT { name: 'A' }");
}

TEST_F(StatementBatchTest, RenderedScriptKeepsEveryTerminator) {
  _sbBatch.add("RETURN - -1");
  _sbBatch.add("RETURN - ->knows");
  _sbBatch.add("CREATE person:`we\xE2\x9F\xA9ird`");
  _sbBatch.add("CREATE person:a");

  sgw::surql::Lexer lx(_sbBatch.render());
  int iTerminators = 0;
  for (const auto& tk : lx.tokenize()) {
    if (tk.kind == sgw::surql::TokenKind::Punct && tk.sText == ";") ++iTerminators;
  }
  EXPECT_EQ(iTerminators, 6);
  EXPECT_EQ(_sbBatch.statements()[0], "RETURN - -1");
}

TEST_F(StatementBatchTest, RenderWrapsStatementsInTransaction) {
  _sbBatch.add("CREATE person:uuid() CONTENT { name: 'A' }");
  _sbBatch.add("CREATE person:uuid() CONTENT { name: 'B' }");

  EXPECT_EQ(_sbBatch.render(),
            "BEGIN TRANSACTION;\n"
            "CREATE person:uuid() CONTENT { name: 'A' };\n"
            "CREATE person:uuid() CONTENT { name: 'B' };\n"
            "COMMIT TRANSACTION;");
}

TEST_F(StatementBatchTest, RenderIsRepeatable) {
  _sbBatch.add("SELECT * FROM person");
  const std::string sFirst = _sbBatch.render();
  EXPECT_EQ(_sbBatch.render(), sFirst);
  EXPECT_EQ(_sbBatch.size(), 1u);
}

TEST_F(StatementBatchTest, RenderOfEmptyBatchHasOnlyMarkers) {
  EXPECT_EQ(_sbBatch.render(), "BEGIN TRANSACTION;\nCOMMIT TRANSACTION;");
}

TEST_F(StatementBatchTest, RejectedStatementLeavesListUnchanged) {
  _sbBatch.add("SELECT * FROM person");
  try {
    _sbBatch.add("not a valid statement !!");
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e._sStatement, "not a valid statement !!");
  }
  ASSERT_EQ(_sbBatch.size(), 1u);
  EXPECT_EQ(_sbBatch.statements()[0], "SELECT * FROM person");
}

TEST_F(StatementBatchTest, RejectsTransactionMarkers) {
  EXPECT_THROW(_sbBatch.add("BEGIN TRANSACTION"), ParseError);
  EXPECT_THROW(_sbBatch.add("COMMIT TRANSACTION;"), ParseError);
  EXPECT_THROW(_sbBatch.add("CANCEL"), ParseError);
  EXPECT_TRUE(_sbBatch.empty());
}

TEST_F(StatementBatchTest, RejectsMultipleStatementsInOneAdd) {
  EXPECT_THROW(_sbBatch.add("CREATE person:a; CREATE person:b"), ParseError);
  EXPECT_TRUE(_sbBatch.empty());
}

TEST_F(StatementBatchTest, ExecuteSubmitsRenderedScriptAndClears) {
  _sbBatch.add("CREATE person:uuid() CONTENT { name: 'A' }");
  _sbBatch.add("CREATE person:uuid() CONTENT { name: 'B' }");
  const std::string sExpected = _sbBatch.render();

  auto rs = _sbBatch.execute(_fsSession);

  ASSERT_EQ(_fsSession.vScripts.size(), 1u);
  EXPECT_EQ(_fsSession.vScripts[0], sExpected);
  EXPECT_EQ(rs.size(), 2u);
  EXPECT_TRUE(_sbBatch.empty());
}

TEST_F(StatementBatchTest, ExecuteOfEmptyBatchMakesNoRoundTrip) {
  auto rs = _sbBatch.execute(_fsSession);
  EXPECT_TRUE(rs.empty());
  EXPECT_TRUE(_fsSession.vScripts.empty());
}

TEST_F(StatementBatchTest, FailedSlotKeepsStatements) {
  _sbBatch.add("CREATE person:a");
  _sbBatch.add("CREATE person:b");
  _fsSession.replyWith(FakeSession::slots(
      {FakeSession::errSlot("The query was not executed due to a failed transaction"),
       FakeSession::errSlot("Database record `person:b` already exists")}));

  try {
    _sbBatch.execute(_fsSession);
    FAIL() << "expected ExecutionError";
  } catch (const ExecutionError& e) {
    EXPECT_EQ(e._iSlot, 1);
  }
  EXPECT_EQ(_sbBatch.size(), 2u);
}

TEST_F(StatementBatchTest, TransportFailureKeepsStatements) {
  _sbBatch.add("CREATE person:a");
  _fsSession.throwOnNext(ExecutionError("connection refused"));

  EXPECT_THROW(_sbBatch.execute(_fsSession), ExecutionError);
  EXPECT_EQ(_sbBatch.size(), 1u);
}

TEST_F(StatementBatchTest, InterruptedExecuteIsIndeterminate) {
  _sbBatch.add("CREATE person:a");
  _fsSession.throwOnNext(IndeterminateOutcomeError(TxPhase::Query, "connection lost"));

  try {
    _sbBatch.execute(_fsSession);
    FAIL() << "expected IndeterminateOutcomeError";
  } catch (const IndeterminateOutcomeError& e) {
    EXPECT_EQ(e._phase, TxPhase::Execute);
  }
  EXPECT_EQ(_sbBatch.size(), 1u);
}

TEST_F(StatementBatchTest, ClearEmptiesUnconditionally) {
  _sbBatch.add("CREATE person:a");
  _sbBatch.add("CREATE person:b");
  _sbBatch.clear();
  EXPECT_TRUE(_sbBatch.empty());
  _sbBatch.clear();
  EXPECT_TRUE(_sbBatch.empty());
}

TEST_F(StatementBatchTest, ReExecuteAfterSuccessIsNoOp) {
  _sbBatch.add("CREATE person:uuid() CONTENT { name: 'A' }");
  _sbBatch.execute(_fsSession);
  auto rs = _sbBatch.execute(_fsSession);
  EXPECT_TRUE(rs.empty());
  EXPECT_EQ(_fsSession.vScripts.size(), 1u);
}
