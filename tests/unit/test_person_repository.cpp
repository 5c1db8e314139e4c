#include "dal/PersonRepository.hpp"

#include "FakeSession.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <gtest/gtest.h>

using sgw::common::ConflictError;
using sgw::common::ExecutionError;
using sgw::common::NotFoundError;
using sgw::common::ValidationError;
using sgw::dal::PersonRepository;
using sgw::test::FakeSession;

class PersonRepositoryTest : public ::testing::Test {
 protected:
  FakeSession _fsSession;
  PersonRepository _prRepo{_fsSession, sgw::common::Logger::null()};
};

TEST_F(PersonRepositoryTest, CreateBindsTableKeyAndContent) {
  _fsSession.replyWith(FakeSession::ok({nlohmann::json::array(
      {{{"id", "person:tobie"}, {"name", "Tobie"}}})}));

  auto pn = _prRepo.create("tobie", "Tobie");
  EXPECT_EQ(pn.sId, "person:tobie");
  EXPECT_EQ(pn.sName, "Tobie");

  ASSERT_EQ(_fsSession.vScripts.size(), 1u);
  EXPECT_EQ(_fsSession.vScripts[0], "CREATE type::thing($tb, $id) CONTENT $content");
  EXPECT_EQ(_fsSession.vVars[0]["tb"], "person");
  EXPECT_EQ(_fsSession.vVars[0]["id"], "tobie");
  EXPECT_EQ(_fsSession.vVars[0]["content"]["name"], "Tobie");
}

TEST_F(PersonRepositoryTest, CreateOfExistingRecordIsConflict) {
  _fsSession.replyWith(
      FakeSession::slots({FakeSession::errSlot("Database record `person:tobie` already exists")}));
  EXPECT_THROW(_prRepo.create("tobie", "Tobie"), ConflictError);
}

TEST_F(PersonRepositoryTest, EmptyKeyIsRejectedWithoutRoundTrip) {
  EXPECT_THROW(_prRepo.create("", "x"), ValidationError);
  EXPECT_THROW(_prRepo.findById(""), ValidationError);
  EXPECT_TRUE(_fsSession.vScripts.empty());
}

TEST_F(PersonRepositoryTest, FindByIdReturnsNulloptWhenAbsent) {
  _fsSession.replyWith(FakeSession::ok({nlohmann::json::array()}));
  EXPECT_FALSE(_prRepo.findById("ghost").has_value());
}

TEST_F(PersonRepositoryTest, FindByIdReturnsRecord) {
  _fsSession.replyWith(
      FakeSession::ok({nlohmann::json::array({{{"id", "person:1"}, {"name", "John"}}})}));
  auto oPerson = _prRepo.findById("1");
  ASSERT_TRUE(oPerson.has_value());
  EXPECT_EQ(oPerson->sName, "John");
  EXPECT_EQ(_fsSession.vScripts[0], "SELECT * FROM type::thing($tb, $id)");
}

TEST_F(PersonRepositoryTest, RemoveOfMissingRecordIsNotFound) {
  _fsSession.replyWith(FakeSession::ok({nlohmann::json::array()}));
  EXPECT_THROW(_prRepo.remove("ghost"), NotFoundError);
}

TEST_F(PersonRepositoryTest, ListConvertsRows) {
  _fsSession.replyWith(FakeSession::ok({nlohmann::json::array(
      {{{"id", "person:a"}, {"name", "A"}}, {{"id", "person:b"}, {"name", "B"}}})}));
  auto vPeople = _prRepo.list();
  ASSERT_EQ(vPeople.size(), 2u);
  EXPECT_EQ(vPeople[1].sId, "person:b");
}

TEST_F(PersonRepositoryTest, EngineErrorPropagates) {
  _fsSession.replyWith(FakeSession::slots({FakeSession::errSlot("table is locked")}));
  EXPECT_THROW(_prRepo.list(), ExecutionError);
}

TEST_F(PersonRepositoryTest, BatchCreateSubmitsOneCompositeScript) {
  _fsSession.replyWith(FakeSession::ok({
      nlohmann::json::array({{{"id", "person:x1"}, {"name", "A"}}}),
      nlohmann::json::array({{{"id", "person:x2"}, {"name", "O'Brien"}}}),
  }));

  auto vCreated = _prRepo.batchCreate({"A", "O'Brien"});

  ASSERT_EQ(_fsSession.vScripts.size(), 1u);
  EXPECT_EQ(_fsSession.vScripts[0],
            "BEGIN TRANSACTION;\n"
            "CREATE person:uuid() CONTENT { name: 'A' };\n"
            "CREATE person:uuid() CONTENT { name: \"O'Brien\" };\n"
            "COMMIT TRANSACTION;");
  ASSERT_EQ(vCreated.size(), 2u);
  EXPECT_EQ(vCreated[1].sName, "O'Brien");
}

TEST_F(PersonRepositoryTest, BatchCreateQuotesHostileNames) {
  _prRepo.batchCreate({"x' }; DELETE person; --"});
  ASSERT_EQ(_fsSession.vScripts.size(), 1u);
  EXPECT_NE(_fsSession.vScripts[0].find("{ name: \"x' }; DELETE person; --\" }"),
            std::string::npos);
}

TEST_F(PersonRepositoryTest, BatchCreateOfNothingMakesNoRoundTrip) {
  EXPECT_TRUE(_prRepo.batchCreate({}).empty());
  EXPECT_TRUE(_fsSession.vScripts.empty());
}

TEST_F(PersonRepositoryTest, DeleteAllRunsInsideTransaction) {
  _fsSession.replyWith(FakeSession::ok({}));
  _fsSession.replyWith(
      FakeSession::ok({nlohmann::json::array({{{"id", "person:a"}, {"name", "A"}}})}));
  _fsSession.replyWith(FakeSession::ok({}));

  auto vDeleted = _prRepo.deleteAll();

  ASSERT_EQ(_fsSession.vScripts.size(), 3u);
  EXPECT_EQ(_fsSession.vScripts[0], "BEGIN TRANSACTION;");
  EXPECT_EQ(_fsSession.vScripts[1], "DELETE person RETURN BEFORE");
  EXPECT_EQ(_fsSession.vScripts[2], "COMMIT TRANSACTION;");
  ASSERT_EQ(vDeleted.size(), 1u);
  EXPECT_EQ(vDeleted[0].sId, "person:a");
}

TEST_F(PersonRepositoryTest, DeleteAllRollsBackOnEngineError) {
  _fsSession.replyWith(FakeSession::ok({}));
  _fsSession.replyWith(FakeSession::slots({FakeSession::errSlot("permission denied")}));

  EXPECT_THROW(_prRepo.deleteAll(), ExecutionError);
  ASSERT_EQ(_fsSession.vScripts.size(), 3u);
  EXPECT_EQ(_fsSession.vScripts[2], "CANCEL TRANSACTION;");
}

TEST_F(PersonRepositoryTest, FromRowRejectsRowWithoutId) {
  EXPECT_THROW(PersonRepository::fromRow({{"name", "x"}}), ExecutionError);
  EXPECT_THROW(PersonRepository::fromRow(nlohmann::json::array()), ExecutionError);
}
