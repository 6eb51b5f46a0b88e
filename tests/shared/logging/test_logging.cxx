#ifdef ROUTEKIT_USE_LOGGING_IMPL

#include <gtest/gtest.h>

#include <routekit.hxx>

using namespace shared;

TEST(LoggingTest, InitAndShutdown) {
    c_logging logger;

    EXPECT_NO_THROW({
        logger.init(e_log_level::debug, true, true, 1024, c_logging::e_overflow_strategy::discard_oldest);

        logger.stop_async();
    });
}

TEST(LoggingTest, LevelFiltering) {
    c_logging logger;

    EXPECT_FALSE(logger.enabled(e_log_level::critical));

    logger.init(e_log_level::warning, false, false);

    EXPECT_FALSE(logger.enabled(e_log_level::info));
    EXPECT_TRUE(logger.enabled(e_log_level::warning));
    EXPECT_TRUE(logger.enabled(e_log_level::error));
}

TEST(LoggingTest, SyncLogWritesToOutput) {
    auto output = std::tmpfile();

    ASSERT_NE(output, nullptr);

    c_logging logger;

    logger.init(e_log_level::debug, true, false);
    logger.set_output(output);

    logger.log(e_log_level::info, "[Dispatch] {} {} {:.3f}ms", "GET", "/users/7", 1.5);
    logger.log(e_log_level::debug, "second line");

    std::rewind(output);

    char line[256]{};

    ASSERT_NE(std::fgets(line, sizeof(line), output), nullptr);

    EXPECT_NE(std::string{line}.find("[Dispatch] GET /users/7 1.500ms"), std::string::npos);
    EXPECT_NE(std::string{line}.find("INFO"), std::string::npos);

    std::fclose(output);
}

TEST(LoggingTest, AsyncLogDoesNotThrow) {
    c_logging logger;

    logger.init(e_log_level::debug, true, true, 1024, c_logging::e_overflow_strategy::discard_newest);

    EXPECT_NO_THROW({ logger.log(e_log_level::info, "Async log test: {}", 456); });

    logger.stop_async();
}

TEST(LoggingTest, LogBufferPushPop) {
    log_buffer_t buffer(2);

    EXPECT_TRUE(buffer.push({e_log_level::info, "msg1", std::chrono::system_clock::now()}));
    EXPECT_TRUE(buffer.push({e_log_level::warning, "msg2", std::chrono::system_clock::now()}));

    EXPECT_FALSE(buffer.push({e_log_level::error, "msg3", std::chrono::system_clock::now()}));

    EXPECT_EQ(buffer.size(), 2);

    log_message_t out1, out2;

    EXPECT_TRUE(buffer.pop(out1));
    EXPECT_TRUE(buffer.pop(out2));

    EXPECT_EQ(out1.m_message, "msg1");
    EXPECT_EQ(out2.m_message, "msg2");

    EXPECT_TRUE(buffer.empty());
    EXPECT_FALSE(buffer.pop(out1));
}

TEST(LoggingTest, LogBufferTake) {
    log_buffer_t buffer(5);

    for (int i = 0; i < 3; ++i)
        EXPECT_TRUE(buffer.push({e_log_level::info, "msg" + std::to_string(i), std::chrono::system_clock::now()}));

    auto batch = buffer.take(2);

    ASSERT_EQ(batch.size(), 2);
    EXPECT_EQ(batch[0].m_message, "msg0");
    EXPECT_EQ(batch[1].m_message, "msg1");

    auto rest = buffer.take(5);

    ASSERT_EQ(rest.size(), 1);
    EXPECT_EQ(rest[0].m_message, "msg2");

    EXPECT_TRUE(buffer.empty());
}

TEST(LoggingTest, LogLevelToString) {
    c_logging logger;

    EXPECT_STREQ(logger.lvl_to_str(e_log_level::debug), "DEBUG");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::info), "INFO");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::warning), "WARNING");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::error), "ERROR");
    EXPECT_STREQ(logger.lvl_to_str(e_log_level::critical), "CRITICAL");
}

#endif // ROUTEKIT_USE_LOGGING_IMPL
