#include "../agents/rag/include/log.hpp"
#include "../agents/rag/include/util.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

TEST(Util, SplitParagraphsOnBlankLines) {
    auto p = split_paragraphs("  first line\nstill first \n\n \t\nsecond\n\n\n\nthird  ");
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0], "first line\nstill first");
    EXPECT_EQ(p[1], "second");
    EXPECT_EQ(p[2], "third");
    EXPECT_TRUE(split_paragraphs("\n \n").empty());
}

TEST(Util, WordCountIgnoresWhitespaceRuns) {
    EXPECT_EQ(word_count(""), 0);
    EXPECT_EQ(word_count("  one\ttwo\n\nthree "), 3);
}

TEST(Util, Sha1File) {
    auto p = std::filesystem::temp_directory_path() / "paperqa_sha1.txt";
    {
        std::ofstream f(p, std::ios::binary);
        f << "abc";
    }
    EXPECT_EQ(sha1_file(p), "a9993e364706816aba3e25717850c26c9cd0d89d");
    std::filesystem::remove(p);
    EXPECT_THROW(sha1_file(p), std::runtime_error);
}

TEST(Util, SettingParsers) {
    EXPECT_EQ(parse_int_setting("K", "42"), 42);
    EXPECT_THROW(parse_int_setting("K", "42x"), std::invalid_argument);
    EXPECT_FLOAT_EQ(parse_float_setting("K", "0.25"), 0.25f);
    EXPECT_TRUE(parse_bool_setting("K", "Yes"));
    EXPECT_FALSE(parse_bool_setting("K", "0"));
    EXPECT_THROW(parse_bool_setting("K", "2"), std::invalid_argument);
}

TEST(Log, LevelThresholdAndSink) {
    std::vector<std::string> seen;
    set_log_sink([&](LogLevel, const std::string& tag, const std::string& msg) { seen.push_back(tag + ":" + msg); });
    auto before = log_level();
    set_log_level(LogLevel::Warn);
    log_info("t", "hidden");
    log_warn("t", "shown");
    log_error("t", "also shown");
    set_log_level(before);
    set_log_sink({});
    EXPECT_EQ(seen, (std::vector<std::string>{"t:shown", "t:also shown"}));
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::Warn);
    EXPECT_THROW(parse_log_level("loud"), std::invalid_argument);
}

TEST(Log, SinkMayLogWithoutDeadlock) {
    std::vector<std::string> seen;
    int depth = 0;
    set_log_sink([&](LogLevel, const std::string& tag, const std::string& msg) {
        seen.push_back(tag + ":" + msg);
        if (depth++ == 0) log_warn("sink", "nested");
    });
    std::atomic<bool> done{false};
    std::thread t([&] {
        log_warn("t", "outer");
        done = true;
    });
    for (int i = 0; i < 200 && !done; ++i) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (!done) t.detach();
    ASSERT_TRUE(done.load());
    t.join();
    set_log_sink({});
    EXPECT_EQ(seen, (std::vector<std::string>{"t:outer", "sink:nested"}));
}
