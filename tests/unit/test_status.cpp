#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/status.hpp"
#include <memory>
#include <stdexcept>
#include <string>

using namespace booksync;

// Test Result<T, E> monad

TEST(StatusTest, OkCreation) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(StatusTest, ErrCreation) {
    auto result = Result<int, std::string>::Err("something failed");
    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "something failed");
}

TEST(StatusTest, ValueThrowsOnError) {
    auto result = Result<int, std::string>::Err("error");
    EXPECT_THROW((void)result.value(), std::logic_error);
}

TEST(StatusTest, ErrorThrowsOnOk) {
    auto result = Result<int, std::string>::Ok(42);
    EXPECT_THROW((void)result.error(), std::logic_error);
}

TEST(StatusTest, ValueOr) {
    EXPECT_EQ((Result<int, std::string>::Ok(1).value_or(7)), 1);
    EXPECT_EQ((Result<int, std::string>::Err("x").value_or(7)), 7);
}

TEST(StatusTest, SameValueAndErrorType) {
    auto ok = Result<std::string, std::string>::Ok("body");
    auto err = Result<std::string, std::string>::Err("timeout");
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "body");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "timeout");
}

TEST(StatusTest, TakeValueMovesOut) {
    auto result = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(5));
    auto ptr = std::move(result).take_value();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 5);
}

TEST(StatusTest, MapErrorWrapsMessage) {
    auto result = Result<int, std::string>::Err("connection refused");
    auto mapped = result.map_error([](const std::string& msg) { return Error::network(msg); });
    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error().kind, ErrorKind::Network);
    EXPECT_EQ(mapped.error().message, "connection refused");
}

TEST(StatusTest, MapErrorKeepsValue) {
    auto result = Result<int, std::string>::Ok(3);
    auto mapped = result.map_error([](const std::string& msg) { return Error::protocol(msg); });
    ASSERT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 3);
}

// Error taxonomy

TEST(ErrorTest, DescribePrefixesKind) {
    EXPECT_EQ(Error::network("timed out").describe(), "NetworkError: timed out");
    EXPECT_EQ(Error::protocol("bad json").describe(), "ProtocolError: bad json");
}

TEST(ErrorTest, KindNames) {
    EXPECT_EQ(to_string(ErrorKind::Connection), "ConnectionError");
    EXPECT_EQ(to_string(ErrorKind::InvariantViolation), "InvariantViolation");
}
