#include "tsvu/split/open-file-budget.h"
#include "tsvu/split/split-errors.h"
#include <gtest/gtest.h>
#include <limits>
#include <string>
#include <sys/resource.h>

using namespace tsvu::split;

TEST(OpenFileBudget, DefaultCeiling)
{
    EXPECT_EQ(resolve_max_open_files(std::nullopt, 1u << 20), 4092u);
    EXPECT_EQ(
        resolve_max_open_files(
            std::nullopt, std::numeric_limits<std::uint32_t>::max()),
        4092u);
}

TEST(OpenFileBudget, SoftLimitCaps)
{
    EXPECT_EQ(resolve_max_open_files(std::nullopt, 256), 252u);
    EXPECT_EQ(resolve_max_open_files(std::nullopt, 5), 1u);
}

TEST(OpenFileBudget, RequestedValue)
{
    EXPECT_EQ(resolve_max_open_files(5u, 1024), 1u);
    EXPECT_EQ(resolve_max_open_files(100u, 1024), 96u);
    EXPECT_EQ(resolve_max_open_files(1024u, 1024), 1020u);
    // A request above the internal ceiling is honoured
    EXPECT_EQ(resolve_max_open_files(10000u, 65536), 9996u);
}

TEST(OpenFileBudget, RequestTooSmall)
{
    try
    {
        resolve_max_open_files(4u, 1024);
        FAIL() << "Expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_EQ(
            std::string(e.what()), "'--max-open-files' must be at least 5.");
    }
    EXPECT_THROW(resolve_max_open_files(0u, 1024), ConfigurationError);
}

TEST(OpenFileBudget, RequestAboveSystemLimit)
{
    try
    {
        resolve_max_open_files(2048u, 1024);
        FAIL() << "Expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_NE(
            std::string(e.what()).find("greater than current system limit"),
            std::string::npos);
    }
}

TEST(OpenFileBudget, SystemLimitTooSmall)
{
    try
    {
        resolve_max_open_files(std::nullopt, 4);
        FAIL() << "Expected ConfigurationError";
    }
    catch (const ConfigurationError& e)
    {
        EXPECT_NE(
            std::string(e.what()).find("System open file limit too small"),
            std::string::npos);
    }
}

TEST(OpenFileBudget, ReadsProcessSoftLimit)
{
    struct rlimit limits;
    ASSERT_EQ(getrlimit(RLIMIT_NOFILE, &limits), 0);

    std::uint32_t soft = current_open_files_soft_limit();
    if (limits.rlim_cur == RLIM_INFINITY ||
        limits.rlim_cur > std::numeric_limits<std::uint32_t>::max())
    {
        EXPECT_EQ(soft, std::numeric_limits<std::uint32_t>::max());
    }
    else
    {
        EXPECT_EQ(soft, limits.rlim_cur);
    }
}
