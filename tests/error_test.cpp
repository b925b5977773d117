#include <gtest/gtest.h>

#include <cerrno>
#include <csignal>
#include <fmt/core.h>

#include "infra/error_handler/error.hpp"
#include "infra/error_handler/log_reporter.hpp"
#include "infra/interrupt.hpp"

using pcopy::infra::ErrorCode;

TEST(ErrorTest, ErrnoMapping)
{
    EXPECT_EQ(pcopy::infra::code_from_errno(ENOENT), ErrorCode::NotFound);
    EXPECT_EQ(pcopy::infra::code_from_errno(EACCES), ErrorCode::PermissionDenied);
    EXPECT_EQ(pcopy::infra::code_from_errno(EPERM), ErrorCode::PermissionDenied);
    EXPECT_EQ(pcopy::infra::code_from_errno(EEXIST), ErrorCode::DestinationConflict);
    EXPECT_EQ(pcopy::infra::code_from_errno(EISDIR), ErrorCode::DestinationConflict);
    EXPECT_EQ(pcopy::infra::code_from_errno(ENOTDIR), ErrorCode::DestinationConflict);
    EXPECT_EQ(pcopy::infra::code_from_errno(ENOSPC), ErrorCode::IOFailure);
    EXPECT_EQ(pcopy::infra::code_from_errno(EPIPE), ErrorCode::IOFailure);
}

TEST(ErrorTest, FromErrnoKeepsPathAndErrno)
{
    auto err = pcopy::infra::from_errno(ENOENT, "Cannot open source", "/tmp/missing");
    EXPECT_EQ(err.code, ErrorCode::NotFound);
    EXPECT_EQ(err.sys_errno, ENOENT);
    EXPECT_EQ(err.path, "/tmp/missing");
    EXPECT_NE(err.message.find("Cannot open source"), std::string::npos);
    EXPECT_FALSE(err.is_fatal());
    EXPECT_GT(err.line, 0);
}

TEST(ErrorTest, FatalFlagAndExitCodes)
{
    auto err = pcopy::infra::make_error(ErrorCode::InvalidPath, "bad").as_fatal();
    EXPECT_TRUE(err.is_fatal());
    EXPECT_EQ(err.to_exit_code(), 1);

    auto interrupted = pcopy::infra::make_error(ErrorCode::Interrupted, "stop");
    EXPECT_EQ(interrupted.to_exit_code(), 130);
}

TEST(ErrorTest, ErrorCodeIsFormattable)
{
    EXPECT_EQ(fmt::format("{}", ErrorCode::DestinationConflict), "DestinationConflict");
    EXPECT_EQ(fmt::format("{}", ErrorCode::EnumerationError), "EnumerationError");
}

TEST(ErrorTest, SigintSetsInterruptFlag)
{
    pcopy::infra::install_signal_handler();
    pcopy::infra::reset_interrupted();
    ASSERT_FALSE(pcopy::infra::is_interrupted());

    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_TRUE(pcopy::infra::is_interrupted());

    pcopy::infra::reset_interrupted();
    EXPECT_FALSE(pcopy::infra::is_interrupted());
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

TEST(ErrorTest, LogReporterCountsFailures)
{
    pcopy::infra::LogReporter reporter;
    const auto err = pcopy::infra::make_error(ErrorCode::PermissionDenied, "denied", "/tmp/x");
    reporter.report(pcopy::core::to_failure(err));
    reporter.report(pcopy::core::to_failure(err));
    EXPECT_EQ(reporter.reported(), 2u);
}
