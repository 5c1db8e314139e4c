#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace sgw::common;

TEST(ErrorsTest, AppErrorCarriesStatusAndCode) {
  AppError err(500, "internal_error", "Something went wrong");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ValidationErrorIs400) {
  ValidationError err("validation_error", "name is required");
  EXPECT_EQ(err._iHttpStatus, 400);
  EXPECT_EQ(err._sErrorCode, "validation_error");
}

TEST(ErrorsTest, NotFoundErrorIs404) {
  NotFoundError err("person_not_found", "person:x does not exist");
  EXPECT_EQ(err._iHttpStatus, 404);
  EXPECT_EQ(err._sErrorCode, "person_not_found");
}

TEST(ErrorsTest, ConflictErrorIs409) {
  ConflictError err("person_exists", "person:x already exists");
  EXPECT_EQ(err._iHttpStatus, 409);
  EXPECT_EQ(err._sErrorCode, "person_exists");
}

TEST(ErrorsTest, ParseErrorCarriesStatementAndOffset) {
  ParseError err("SELEC * FROM person", 0, "expected a statement, found 'SELEC'");
  EXPECT_EQ(err._iHttpStatus, 400);
  EXPECT_EQ(err._sErrorCode, "parse_error");
  EXPECT_EQ(err._sStatement, "SELEC * FROM person");
  EXPECT_EQ(err._uOffset, 0u);
  EXPECT_STREQ(err.what(),
               "Cannot parse statement at offset 0: expected a statement, found 'SELEC'");
}

TEST(ErrorsTest, ExecutionErrorIs502WithSlot) {
  ExecutionError err("Statement 1 failed: boom", 1, "boom");
  EXPECT_EQ(err._iHttpStatus, 502);
  EXPECT_EQ(err._sErrorCode, "execution_failed");
  EXPECT_EQ(err._iSlot, 1);
  EXPECT_EQ(err._sEngineMessage, "boom");
}

TEST(ErrorsTest, ExecutionErrorDefaultsToTransportLevel) {
  ExecutionError err("connection refused");
  EXPECT_EQ(err._iSlot, -1);
  EXPECT_TRUE(err._sEngineMessage.empty());
}

TEST(ErrorsTest, TxErrorIsAnExecutionErrorWithPhase) {
  TxError err(TxPhase::Commit, "commit failed");
  EXPECT_EQ(err._iHttpStatus, 502);
  EXPECT_EQ(err._sErrorCode, "transaction_failed");
  EXPECT_EQ(err._phase, TxPhase::Commit);

  const ExecutionError& exBase = err;
  EXPECT_EQ(exBase._iSlot, -1);
}

TEST(ErrorsTest, IndeterminateOutcomeIs504AndCatchableAsTxError) {
  try {
    throw IndeterminateOutcomeError(TxPhase::Rollback, "connection lost");
  } catch (const TxError& e) {
    EXPECT_EQ(e._iHttpStatus, 504);
    EXPECT_EQ(e._sErrorCode, "indeterminate_outcome");
    EXPECT_EQ(e._phase, TxPhase::Rollback);
    return;
  }
  FAIL() << "IndeterminateOutcomeError not caught as TxError";
}

TEST(ErrorsTest, StateViolationIs500) {
  StateViolation err("Cannot commit a transaction that is committed");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "transaction_state_violation");
}

TEST(ErrorsTest, AllErrorsDeriveFromAppError) {
  EXPECT_THROW(throw ParseError("x", 0, "bad"), AppError);
  EXPECT_THROW(throw ExecutionError("x"), AppError);
  EXPECT_THROW(throw TxError(TxPhase::Begin, "x"), AppError);
  EXPECT_THROW(throw StateViolation("x"), AppError);
  EXPECT_THROW(throw ConflictError("c", "x"), AppError);
}
