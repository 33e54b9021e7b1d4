// Logging library tests: level names, config strings and output routing

#include <gtest/gtest.h>
#include <stdio.h>
#include <string.h>
#include <string>
#include "../lib/log.h"

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_init(NULL);
    }

    void TearDown() override {
        log_set_level(log_default_category, LOG_LEVEL_INFO);
        log_set_output(log_default_category, stderr);
        log_enable_timestamps(0);
        log_enable_colors(0);
        log_default_category->enabled = 1;
    }

    // Run `fn` with the default category writing to a temp file, return what it wrote
    template <typename Fn>
    static std::string capture(Fn fn) {
        FILE* tmp = tmpfile();
        if (!tmp) return std::string();
        log_set_output(log_default_category, tmp);
        fn();
        fflush(tmp);
        rewind(tmp);
        std::string out;
        char buf[256];
        size_t n;
        while ((n = fread(buf, 1, sizeof(buf), tmp)) > 0) out.append(buf, n);
        fclose(tmp);
        log_set_output(log_default_category, stderr);
        return out;
    }
};

// ==============================================================================
// Levels
// ==============================================================================

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_to_string(LOG_LEVEL_WARN), "WARN");
    EXPECT_STREQ(log_level_to_string(7), "UNKNOWN");
}

TEST_F(LogTest, LevelFromString) {
    EXPECT_EQ(log_level_from_string("debug"), LOG_LEVEL_DEBUG);
    EXPECT_EQ(log_level_from_string("INFO"), LOG_LEVEL_INFO);
    EXPECT_EQ(log_level_from_string("warning"), LOG_LEVEL_WARN);
    EXPECT_EQ(log_level_from_string("error"), LOG_LEVEL_ERROR);
    EXPECT_EQ(log_level_from_string("verbose"), -1);
    EXPECT_EQ(log_level_from_string(NULL), -1);
}

TEST_F(LogTest, DefaultLevelIsInfo) {
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_DEBUG));
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_INFO));
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_ERROR));
}

// ==============================================================================
// Configuration
// ==============================================================================

TEST_F(LogTest, InlineConfigString) {
    EXPECT_EQ(log_init("level=debug;timestamps=off"), LOG_OK);
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_DEBUG));
}

TEST_F(LogTest, ConfigStringWithCommentsAndSpaces) {
    EXPECT_EQ(log_parse_config_string("# comment\n  level = error  \n\n"), LOG_OK);
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_WARN));
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_ERROR));
}

TEST_F(LogTest, UnknownKeyRejected) {
    EXPECT_EQ(log_parse_config_string("volume=11"), LOG_WRONG_FORMAT);
}

TEST_F(LogTest, BadLevelRejected) {
    EXPECT_EQ(log_parse_config_string("level=loud"), LOG_WRONG_FORMAT);
    EXPECT_TRUE(log_level_enabled(log_default_category, LOG_LEVEL_INFO));
}

TEST_F(LogTest, EntryWithoutValueRejected) {
    EXPECT_EQ(log_parse_config_string("level"), LOG_WRONG_FORMAT);
}

TEST_F(LogTest, MissingConfigFileFails) {
    EXPECT_EQ(log_parse_config_file("/nonexistent/prose/log.conf"), LOG_INIT_FAIL);
    EXPECT_EQ(log_init("/nonexistent/prose/log.conf"), LOG_INIT_FAIL);
}

TEST_F(LogTest, DisabledCategoryIsSilent) {
    EXPECT_EQ(log_parse_config_string("enabled=off"), LOG_OK);
    EXPECT_FALSE(log_level_enabled(log_default_category, LOG_LEVEL_FATAL));
}

// ==============================================================================
// Output
// ==============================================================================

TEST_F(LogTest, MessageFormat) {
    std::string out = capture([]() { log_info("hello %d", 3); });
    EXPECT_EQ(out, "[INFO] hello 3\n");
}

TEST_F(LogTest, FilteredMessagesNotWritten) {
    std::string out = capture([]() {
        log_debug("hidden");
        log_warn("shown");
    });
    EXPECT_EQ(out, "[WARN] shown\n");
}

TEST_F(LogTest, CategoryFunctions) {
    std::string out = capture([]() { clog_error(log_default_category, "bad %s", "input"); });
    EXPECT_EQ(out, "[ERROR] bad input\n");
}

TEST_F(LogTest, CategoryFunctionsRespectLevel) {
    log_set_level(log_default_category, LOG_LEVEL_DEBUG);
    std::string out = capture([]() {
        clog_warn(log_default_category, "w%d", 1);
        clog_info(log_default_category, "i%d", 2);
        clog_debug(log_default_category, "d%d", 3);
    });
    EXPECT_EQ(out, "[WARN] w1\n[INFO] i2\n[DEBUG] d3\n");

    log_set_level(log_default_category, LOG_LEVEL_WARN);
    out = capture([]() {
        clog_info(log_default_category, "hidden");
        clog_debug(log_default_category, "hidden");
    });
    EXPECT_EQ(out, "");
}

TEST_F(LogTest, NullCategoryIsSilent) {
    EXPECT_EQ(clog_warn(NULL, "nowhere"), LOG_OK);
    EXPECT_FALSE(log_level_enabled(NULL, LOG_LEVEL_FATAL));
}
