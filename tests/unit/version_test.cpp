#include <gtest/gtest.h>

#include <string>

#include "tourney/core/result.hpp"
#include "tourney/foundation/engine_error.hpp"
#include "tourney/version.hpp"

using tourney::foundation::EngineError;
using tourney::foundation::ErrorCode;

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(tourney::Version::major, 0);
    EXPECT_EQ(tourney::Version::minor, 3);
    EXPECT_EQ(tourney::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(tourney::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = tourney::Result<int, EngineError>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = tourney::Result<int, EngineError>::err(
        EngineError(ErrorCode::MatchNotFound, "match 9 is not part of this tournament"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MatchNotFound);
    EXPECT_EQ(result.error().message(), "match 9 is not part of this tournament");
}

TEST(ResultTest, ValueOrAndBool) {
    auto ok = tourney::Result<int, EngineError>::ok(10);
    auto err = tourney::Result<int, EngineError>::err(EngineError(ErrorCode::InvalidArgument));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST(ResultTest, MovesValueOut) {
    auto result = tourney::Result<std::string, int>::ok("Spring Open");
    std::string name = std::move(result).value();
    EXPECT_EQ(name, "Spring Open");

    auto failed = tourney::Result<std::string, int>::err(3);
    EXPECT_EQ(failed.error(), 3);
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = tourney::Result<void, EngineError>::ok();
    EXPECT_TRUE(ok.hasValue());

    auto err = tourney::Result<void, EngineError>::err(
        EngineError(ErrorCode::ConfigLoadFailed, "cannot read engine.yaml"));
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error().code(), ErrorCode::ConfigLoadFailed);
}
