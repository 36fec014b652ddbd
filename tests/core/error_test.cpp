#include "psync/core/error.hpp"
#include "psync/core/result.hpp"

#include <gtest/gtest.h>

#include <cerrno>

using psync::ErrorKind;
using psync::classify_error_code;

namespace {

std::error_code errno_code(int value) {
    return std::error_code(value, std::generic_category());
}

} // namespace

TEST(ErrorClassification, BusyAndInterruptedAreTransient) {
    EXPECT_EQ(classify_error_code(errno_code(EBUSY)), ErrorKind::TransientIO);
    EXPECT_EQ(classify_error_code(errno_code(EAGAIN)), ErrorKind::TransientIO);
    EXPECT_EQ(classify_error_code(errno_code(EINTR)), ErrorKind::TransientIO);
    EXPECT_EQ(classify_error_code(errno_code(ETIMEDOUT)), ErrorKind::TransientIO);
    EXPECT_EQ(classify_error_code(errno_code(EMFILE)), ErrorKind::TransientIO);
}

TEST(ErrorClassification, AccessAndPathErrorsArePermanent) {
    EXPECT_EQ(classify_error_code(errno_code(EACCES)), ErrorKind::PermanentIO);
    EXPECT_EQ(classify_error_code(errno_code(EPERM)), ErrorKind::PermanentIO);
    EXPECT_EQ(classify_error_code(errno_code(ENOENT)), ErrorKind::PermanentIO);
    EXPECT_EQ(classify_error_code(errno_code(ENOSPC)), ErrorKind::PermanentIO);
    EXPECT_EQ(classify_error_code(errno_code(EROFS)), ErrorKind::PermanentIO);
}

TEST(ErrorClassification, SystemCategoryIsClassifiedToo) {
    EXPECT_EQ(classify_error_code(std::error_code(EBUSY, std::system_category())), ErrorKind::TransientIO);
}

TEST(ErrorClassification, EmptyCodeIsPermanent) {
    EXPECT_EQ(classify_error_code(std::error_code{}), ErrorKind::PermanentIO);
}

TEST(Error, IoErrorCarriesKindAndCode) {
    const auto error = psync::io_error("open failed", errno_code(EBUSY));
    EXPECT_EQ(error.kind, ErrorKind::TransientIO);
    EXPECT_TRUE(error.retryable());
    EXPECT_NE(error.describe().find("open failed: "), std::string::npos);
}

TEST(Error, DescribeWithoutCodeIsMessage) {
    psync::Error error{ErrorKind::ConfigurationError, "bad flags"};
    EXPECT_EQ(error.describe(), "bad flags");
    EXPECT_FALSE(error.retryable());
}

TEST(Result, OkAndErrConstruction) {
    auto ok = psync::Ok(5);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 5);

    auto err = psync::Err<int>(ErrorKind::PermanentIO, "nope");
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error().kind, ErrorKind::PermanentIO);
    EXPECT_EQ(err.value_or(9), 9);

    auto void_ok = psync::Ok();
    EXPECT_TRUE(void_ok.is_ok());
}
