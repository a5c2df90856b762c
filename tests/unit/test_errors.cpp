#include "common/Errors.hpp"

#include <gtest/gtest.h>

using namespace kes::common;

TEST(ErrorsTest, AppErrorCarriesCode) {
  AppError err("internal_error", "Something went wrong");
  EXPECT_EQ(err._sErrorCode, "internal_error");
  EXPECT_STREQ(err.what(), "Something went wrong");
}

TEST(ErrorsTest, ConfigErrorIsAppError) {
  ConfigError err("invalid_interval", "KES_POLLER_INTERVAL_MS must be >= 1");
  EXPECT_EQ(err._sErrorCode, "invalid_interval");
}

TEST(ErrorsTest, FetchErrorCarriesUpstreamStatus) {
  FetchError err(500, "upstream_status", "GET /apis/x returned HTTP 500");
  EXPECT_EQ(err._iHttpStatus, 500);
  EXPECT_EQ(err._sErrorCode, "upstream_status");
}

TEST(ErrorsTest, TransportErrorHasNoStatus) {
  TransportError err("transport_failed", "Connection refused");
  EXPECT_EQ(err._iHttpStatus, 0);
}

TEST(ErrorsTest, AuthorizationErrorKeepsStatus) {
  AuthorizationError err(403, "unauthorized", "forbidden");
  EXPECT_EQ(err._iHttpStatus, 403);
  EXPECT_EQ(err._sErrorCode, "unauthorized");
}

TEST(ErrorsTest, MalformedResponseErrorFollowsSuccessfulStatus) {
  MalformedResponseError err("invalid_json", "Response is not valid JSON");
  EXPECT_EQ(err._iHttpStatus, 200);
}

TEST(ErrorsTest, PolymorphicCatchAsFetchError) {
  // All fetch failures should be catchable as FetchError&
  try {
    throw TransportError("t", "transport fail");
  } catch (const FetchError& err) {
    EXPECT_EQ(err._iHttpStatus, 0);
    EXPECT_STREQ(err.what(), "transport fail");
  }

  try {
    throw AuthorizationError(401, "a", "auth fail");
  } catch (const FetchError& err) {
    EXPECT_EQ(err._iHttpStatus, 401);
  }

  try {
    throw MalformedResponseError("m", "bad body");
  } catch (const AppError& err) {
    EXPECT_EQ(err._sErrorCode, "m");
  }
}

TEST(ErrorsTest, CatchableAsStdRuntimeError) {
  try {
    throw ConfigError("c", "bad config");
  } catch (const std::runtime_error& err) {
    EXPECT_STREQ(err.what(), "bad config");
  }
}
