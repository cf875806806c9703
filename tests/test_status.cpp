// File: tests/test_status.cpp
#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "solar/core/status.hpp"

namespace solar {
namespace {

Status fails_at(int step, int failing_step) {
  if (step == failing_step) return Status::io_error("step " + std::to_string(step));
  return Status::ok_status();
}

Status run_steps(int failing_step, int* reached) {
  for (int i = 0; i < 3; ++i) {
    *reached = i;
    SOLAR_RETURN_IF_ERROR(fails_at(i, failing_step));
  }
  return Status::ok_status();
}

TEST(Status, DefaultIsOk) {
  const Status s;
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(s.code(), Status::Code::kOk);
  EXPECT_TRUE(s.message().empty());
}

TEST(Status, FactoriesCarryCodeAndMessage) {
  const Status s = Status::failed_precondition("not started");
  EXPECT_FALSE(s.ok());
  EXPECT_EQ(s.code(), Status::Code::kFailedPrecondition);
  EXPECT_EQ(s.message(), "not started");
  EXPECT_STREQ(to_string(Status::Code::kUnsupported), "unsupported");
  EXPECT_STREQ(to_string(Status::Code::kInvalidArgument), "invalid_argument");
}

TEST(Status, ReturnIfErrorStopsAtFirstFailure) {
  int reached = -1;
  const Status s = run_steps(1, &reached);
  EXPECT_EQ(s.code(), Status::Code::kIoError);
  EXPECT_EQ(reached, 1);

  EXPECT_TRUE(run_steps(-1, &reached).ok());
  EXPECT_EQ(reached, 2);
}

TEST(Result, HoldsValueOrStatus) {
  auto ok = Result<std::string>::ok("hello");
  ASSERT_TRUE(ok.ok());
  EXPECT_EQ(*ok, "hello");
  EXPECT_EQ(ok->size(), 5u);
  EXPECT_EQ(ok.take_value(), "hello");

  auto bad = Result<int>::err(Status::not_found("missing"));
  EXPECT_FALSE(bad.ok());
  EXPECT_EQ(bad.status().code(), Status::Code::kNotFound);
  EXPECT_THROW((void)bad.value(), std::bad_optional_access);
}

}  // namespace
}  // namespace solar
