#include <gtest/gtest.h>
#include "core/status.hpp"
#include <memory>
#include <string>

using namespace optiscan;

// ============================================================================
// Result<T, E>
// ============================================================================

TEST(StatusTest, OkCreation) {
    auto result = Result<double>::Ok(2.5);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_DOUBLE_EQ(result.value(), 2.5);
}

TEST(StatusTest, ErrCreationCarriesKind) {
    auto result = Result<double>::Err(Error::data_unavailable("no bars for SPY"));
    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().is(ErrorKind::DataUnavailable));
    EXPECT_EQ(result.error().message, "no bars for SPY");
}

TEST(StatusTest, ValueThrowsOnError) {
    auto result = Result<int>::Err(Error::transient("timeout"));
    EXPECT_THROW((void)result.value(), std::runtime_error);
}

TEST(StatusTest, ErrorThrowsOnOk) {
    auto result = Result<int>::Ok(42);
    EXPECT_THROW((void)result.error(), std::runtime_error);
}

TEST(StatusTest, MapTransformsValue) {
    auto volume = Result<long>::Ok(500);
    auto ratio = volume.map([](long v) { return static_cast<double>(v) / 100.0; });

    ASSERT_TRUE(ratio.is_ok());
    EXPECT_DOUBLE_EQ(ratio.value(), 5.0);
}

TEST(StatusTest, MapPreservesError) {
    auto volume = Result<long>::Err(Error::parse("bad json"));
    auto ratio = volume.map([](long v) { return static_cast<double>(v); });

    ASSERT_TRUE(ratio.is_err());
    EXPECT_TRUE(ratio.error().is(ErrorKind::Parse));
}

TEST(StatusTest, AndThenChainsOperations) {
    auto entry_check = [](double price) -> Result<double> {
        if (price <= 0.0) {
            return Result<double>::Err(Error::data_unavailable("no entry price"));
        }
        return Result<double>::Ok(100.0 / price);
    };

    auto chained = Result<double>::Ok(2.0).and_then(entry_check);
    ASSERT_TRUE(chained.is_ok());
    EXPECT_DOUBLE_EQ(chained.value(), 50.0);

    auto rejected = Result<double>::Ok(0.0).and_then(entry_check);
    ASSERT_TRUE(rejected.is_err());
    EXPECT_EQ(rejected.error().message, "no entry price");
}

TEST(StatusTest, AndThenSkipsOnError) {
    bool called = false;
    auto result = Result<int>::Err(Error::storage("disk full"));
    auto chained = result.and_then([&called](int x) {
        called = true;
        return Result<int>::Ok(x);
    });

    EXPECT_FALSE(called);
    EXPECT_TRUE(chained.error().is(ErrorKind::Storage));
}

TEST(StatusTest, ValueOrReturnsDefaultOnError) {
    EXPECT_EQ(Result<int>::Ok(42).value_or(0), 42);
    EXPECT_EQ(Result<int>::Err(Error::transient("x")).value_or(99), 99);
}

TEST(StatusTest, MapErrorTransformsError) {
    auto result = Result<std::string, int>::Err(503);
    auto mapped = result.map_error([](int status) {
        return Error::transient("HTTP " + std::to_string(status));
    });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error().describe(), "transient_fetch: HTTP 503");
}

TEST(StatusTest, WorksWithMoveOnlyTypes) {
    auto result = Result<std::unique_ptr<int>>::Ok(std::make_unique<int>(42));

    ASSERT_TRUE(result.is_ok());
    auto ptr = std::move(result).take_value();
    EXPECT_EQ(*ptr, 42);
}

TEST(StatusTest, SameValueAndErrorTypeUsesIndex) {
    auto ok = Result<int, int>::Ok(1);
    auto err = Result<int, int>::Err(1);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_TRUE(err.is_err());
}

// ============================================================================
// Error / Status
// ============================================================================

TEST(StatusTest, ErrorKindNames) {
    EXPECT_EQ(to_string(ErrorKind::DataUnavailable), "data_unavailable");
    EXPECT_EQ(to_string(ErrorKind::TransientFetch), "transient_fetch");
    EXPECT_EQ(to_string(ErrorKind::ScoringUnavailable), "scoring_unavailable");
    EXPECT_EQ(to_string(ErrorKind::Configuration), "configuration");
}

TEST(StatusTest, StatusOkAndErr) {
    EXPECT_TRUE(ok_status().is_ok());

    Status failed = Status::Err(Error::configuration("watchlist empty"));
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().describe(), "configuration: watchlist empty");
}
