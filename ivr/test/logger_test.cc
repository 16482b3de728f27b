#include "logger.h"

#include <gtest/gtest.h>

#include <sstream>

TEST(LoggerTest, Markers)
{
    std::ostringstream out;
    std::ostringstream err;
    ivr::Logger logger(out, err, ivr::Logger::Level::Debug);

    logger.debug("one");
    logger.info("two");
    logger.warning("three");
    logger.error("four");

    EXPECT_EQ("--- one\n*** two\n", out.str());
    EXPECT_EQ("!!! three\n!!! four\n", err.str());
}

TEST(LoggerTest, LevelFilters)
{
    std::ostringstream out;
    std::ostringstream err;
    ivr::Logger logger(out, err);

    EXPECT_EQ(ivr::Logger::Level::Info, logger.level());
    EXPECT_FALSE(logger.isEnabled(ivr::Logger::Level::Debug));
    logger.debug("hidden");
    EXPECT_TRUE(out.str().empty());

    logger.setLevel(ivr::Logger::Level::Error);
    logger.warning("hidden");
    logger.error("shown");
    EXPECT_EQ("!!! shown\n", err.str());
}

TEST(LoggerTest, LevelNames)
{
    EXPECT_STREQ("debug", ivr::toString(ivr::Logger::Level::Debug));
    EXPECT_STREQ("warning", ivr::toString(ivr::Logger::Level::Warning));
}
