#include "utils.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace namefact;

TEST(LoggerTest, RoutesByLevel) {
    std::ostringstream out;
    std::ostringstream err;
    Logger logger(LogLevel::INFO, out, err, true);

    logger.debug("hidden");
    logger.info("named 3 molecules");
    logger.warning("ambiguous numbering");
    logger.error("cannot write output");

    EXPECT_EQ(out.str(), "[INFO] named 3 molecules\n");
    EXPECT_EQ(err.str(), "[WARNING] ambiguous numbering\n[ERROR] cannot write output\n");
}

TEST(LoggerTest, MinLevelCanBeRaised) {
    std::ostringstream out;
    std::ostringstream err;
    Logger logger(LogLevel::DEBUG, out, err, false);
    logger.setMinLevel(LogLevel::ERROR);
    logger.warning("dropped");
    logger.fatal("stop");
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str(), "[FATAL] stop\n");
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Warn"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    try {
        parseLogLevel("loud");
        FAIL() << "expected NamingException";
    } catch (const NamingException& e) {
        EXPECT_EQ(e.getCode(), ErrorCode::CONFIG_ERROR);
    }
}

TEST(ErrorCodeTest, StructuralErrorCarriesItsCode) {
    StructuralError error("bond 3 references missing atom 9");
    EXPECT_EQ(error.getCode(), ErrorCode::STRUCTURAL_ERROR);
    EXPECT_STREQ(errorCodeToString(error.getCode()), "STRUCTURAL_ERROR");
    EXPECT_STREQ(errorCodeToString(ErrorCode::NOT_IMPLEMENTED), "NOT_IMPLEMENTED");
}

TEST(UtilTest, TrimAndJoin) {
    EXPECT_EQ(util::trim("  CCO\t\r\n"), "CCO");
    EXPECT_EQ(util::trim(" \t "), "");
    EXPECT_EQ(util::join({"1", "2", "4"}, ","), "1,2,4");
    EXPECT_EQ(util::join({}, ","), "");
}

TEST(ProgressBarTest, CountsNamedAndFailed) {
    ProgressBar bar(4, "Naming", 10);
    EXPECT_DOUBLE_EQ(bar.getProgress(), 0.0);
    bar.update(2, 1);
    bar.update(3);
    EXPECT_DOUBLE_EQ(bar.getProgress(), 1.0);
    EXPECT_EQ(bar.getFailures(), 1u);
}
