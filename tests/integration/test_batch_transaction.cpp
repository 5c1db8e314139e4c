#include "dal/PersonRepository.hpp"
#include "dal/StatementBatch.hpp"
#include "dal/Transaction.hpp"
#include "dal/WebSocketSession.hpp"

#include "IntegrationEnv.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <memory>

using sgw::dal::PersonRepository;
using sgw::dal::SessionSettings;
using sgw::dal::StatementBatch;
using sgw::dal::Transaction;
using sgw::dal::TxState;
using sgw::dal::WebSocketSession;

class BatchTransactionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    SessionSettings ss;
    if (!sgw::test::integrationSettings(ss)) {
      GTEST_SKIP() << "SGW_TEST_DB_URL not set, skipping integration test";
    }
    _spLog = sgw::common::Logger::init("warn");
    _upSession = std::make_unique<WebSocketSession>(ss, _spLog);
    _upSession->connect();
    _upSession->query("DELETE person").check();
  }

  std::size_t countPeople() {
    auto rs = _upSession->query("SELECT * FROM person");
    rs.check();
    return rs.at(0).jResult.size();
  }

  std::shared_ptr<spdlog::logger> _spLog;
  std::unique_ptr<WebSocketSession> _upSession;
};

TEST_F(BatchTransactionTest, ThreeCreatesThenEmptyReExecute) {
  StatementBatch sbBatch(_spLog);
  sbBatch.add("CREATE person:uuid() CONTENT { name: 'A' }");
  sbBatch.add("CREATE person:uuid() CONTENT { name: 'B' }");
  sbBatch.add("CREATE person:uuid() CONTENT { name: 'C' }");

  auto rs = sbBatch.execute(*_upSession);
  EXPECT_EQ(rs.size(), 3u);
  EXPECT_TRUE(rs.ok());
  EXPECT_TRUE(sbBatch.empty());
  EXPECT_EQ(countPeople(), 3u);

  auto rsAgain = sbBatch.execute(*_upSession);
  EXPECT_TRUE(rsAgain.empty());
  EXPECT_EQ(countPeople(), 3u);
}

TEST_F(BatchTransactionTest, StatementsRunInInsertionOrder) {
  StatementBatch sbBatch(_spLog);
  sbBatch.add("CREATE person:ordered CONTENT { name: 'first' }");
  sbBatch.add("UPDATE person:ordered SET name = 'second'");
  sbBatch.execute(*_upSession);

  auto rs = _upSession->query("SELECT * FROM person:ordered");
  rs.check();
  ASSERT_EQ(rs.at(0).jResult.size(), 1u);
  EXPECT_EQ(rs.at(0).jResult[0]["name"].get<std::string>(), "second");
}

TEST_F(BatchTransactionTest, FailingStatementAbortsWholeBatch) {
  StatementBatch sbBatch(_spLog);
  sbBatch.add("CREATE person:dup CONTENT { name: 'one' }");
  sbBatch.add("CREATE person:other CONTENT { name: 'two' }");
  sbBatch.add("CREATE person:dup CONTENT { name: 'three' }");

  EXPECT_THROW(sbBatch.execute(*_upSession), sgw::common::ExecutionError);
  EXPECT_EQ(sbBatch.size(), 3u);
  EXPECT_EQ(countPeople(), 0u);
}

TEST_F(BatchTransactionTest, RollbackLeavesNoTrace) {
  auto tx = Transaction::begin(*_upSession, _spLog);
  tx.query("CREATE person:ghost CONTENT { name: 'boo' }").check();
  tx.rollback();
  EXPECT_EQ(tx.state(), TxState::RolledBack);

  auto rs = _upSession->query("SELECT * FROM person:ghost");
  rs.check();
  EXPECT_TRUE(rs.at(0).jResult.empty());
}

TEST_F(BatchTransactionTest, CommitPersists) {
  auto tx = Transaction::begin(*_upSession, _spLog);
  tx.query("CREATE person:kept CONTENT { name: 'here' }").check();
  tx.commit();
  EXPECT_EQ(countPeople(), 1u);
}

TEST_F(BatchTransactionTest, RepositoryRoundTrip) {
  PersonRepository prRepo(*_upSession, _spLog);

  auto pn = prRepo.create("john", "John");
  EXPECT_EQ(pn.sName, "John");
  EXPECT_THROW(prRepo.create("john", "Again"), sgw::common::ConflictError);

  EXPECT_EQ(prRepo.update("john", "Mark").sName, "Mark");
  ASSERT_TRUE(prRepo.findById("john").has_value());

  auto vCreated = prRepo.batchCreate({"A", "B"});
  EXPECT_EQ(vCreated.size(), 2u);
  EXPECT_EQ(prRepo.list().size(), 3u);

  EXPECT_EQ(prRepo.remove("john").sName, "Mark");
  EXPECT_FALSE(prRepo.findById("john").has_value());

  EXPECT_EQ(prRepo.deleteAll().size(), 2u);
  EXPECT_TRUE(prRepo.list().empty());
}
