#include <gtest/gtest.h>
#include "core/logging.hh"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace dutch {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MemorySink>();
        Logger::instance().add_sink(sink_);
    }

    void TearDown() override {
        Logger& logger = Logger::instance();
        logger.remove_sink(sink_);
        logger.clear_component_levels();
        logger.set_level(LogLevel::INFO);
    }

    std::shared_ptr<MemorySink> sink_;
};

TEST_F(LoggingTest, LogLevelNames) {
    EXPECT_EQ(log_level_name(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(log_level_name(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(log_level_name(LogLevel::INFO), "INFO");
    EXPECT_EQ(log_level_name(LogLevel::WARN), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(log_level_name(LogLevel::OFF), "OFF");
}

TEST_F(LoggingTest, LogLevelColors) {
    EXPECT_FALSE(log_level_color(LogLevel::TRACE).empty());
    EXPECT_FALSE(log_level_color(LogLevel::DEBUG).empty());
    EXPECT_FALSE(log_level_color(LogLevel::INFO).empty());
    EXPECT_FALSE(log_level_color(LogLevel::WARN).empty());
    EXPECT_FALSE(log_level_color(LogLevel::ERROR).empty());
    EXPECT_TRUE(log_level_color(LogLevel::OFF).empty());
}

TEST_F(LoggingTest, LoggerSingleton) {
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST_F(LoggingTest, LoggerIsEnabled) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::INFO);

    EXPECT_FALSE(logger.is_enabled(LogLevel::TRACE));
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG));
    EXPECT_TRUE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARN));
    EXPECT_TRUE(logger.is_enabled(LogLevel::ERROR));
}

TEST_F(LoggingTest, MessagesReachSinks) {
    ComponentLogger logger("test");

    logger.info("plain info message");
    logger.warn() << "stream warning " << 42;

    EXPECT_TRUE(sink_->contains("plain info message"));
    EXPECT_TRUE(sink_->contains("stream warning 42"));

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].component, "test");
    EXPECT_EQ(entries[1].level, LogLevel::WARN);
}

TEST_F(LoggingTest, BelowLevelIsDropped) {
    Logger::instance().set_level(LogLevel::WARN);
    ComponentLogger logger("test");

    logger.info("should not appear");
    logger.debug() << "nor this";
    EXPECT_TRUE(sink_->entries().empty());
}

TEST_F(LoggingTest, ComponentLoggerLevelCheck) {
    Logger::instance().set_level(LogLevel::WARN);

    ComponentLogger logger("test");

    EXPECT_FALSE(logger.is_trace_enabled());
    EXPECT_FALSE(logger.is_debug_enabled());
    EXPECT_FALSE(logger.is_info_enabled());

    Logger::instance().set_level(LogLevel::DEBUG);

    EXPECT_FALSE(logger.is_trace_enabled());
    EXPECT_TRUE(logger.is_debug_enabled());
    EXPECT_TRUE(logger.is_info_enabled());
}

TEST_F(LoggingTest, ComponentLevelOverride) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);

    logger.set_component_level("test.debug", LogLevel::DEBUG);

    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG, "other"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "test.debug"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARN, "other"));
}

TEST_F(LoggingTest, ParentComponentLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);

    logger.set_component_level("auction", LogLevel::DEBUG);

    // Children inherit
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "auction.processor"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "auction.pricing"));

    // Siblings use the global level
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG, "ledger.bank"));
}

TEST_F(LoggingTest, DefaultLoggers) {
    EXPECT_EQ(log::processor.component(), "auction.processor");
    EXPECT_EQ(log::pricing.component(), "auction.pricing");
    EXPECT_EQ(log::bank.component(), "ledger.bank");

    // Default is INFO
    EXPECT_FALSE(log::core.is_trace_enabled());
    EXPECT_FALSE(log::crypto.is_trace_enabled());
    EXPECT_FALSE(log::auction.is_debug_enabled());
    EXPECT_TRUE(log::ledger.is_info_enabled());
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::WARN;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = "auction";
    entry.message = "vault mismatch";
    entry.file = "processor.cc";
    entry.line = 42;

    std::string plain = format_log_entry(entry, false, false, true);
    EXPECT_NE(plain.find("[ WARN]"), std::string::npos);
    EXPECT_NE(plain.find("[auction]"), std::string::npos);
    EXPECT_NE(plain.find("vault mismatch"), std::string::npos);
    EXPECT_NE(plain.find("(processor.cc:42)"), std::string::npos);
    EXPECT_EQ(plain.find("\033["), std::string::npos);

    std::string colored = format_log_entry(entry, true, false, false);
    EXPECT_NE(colored.find("\033["), std::string::npos);
    EXPECT_EQ(colored.find("processor.cc"), std::string::npos);
}

TEST_F(LoggingTest, LogConfigDefaults) {
    LogConfig config;

    EXPECT_EQ(config.default_level, LogLevel::INFO);
    EXPECT_TRUE(config.component_levels.empty());
    EXPECT_TRUE(config.console_enabled);
    EXPECT_TRUE(config.console_colors);
    EXPECT_FALSE(config.console_thread_id);
    EXPECT_FALSE(config.console_source_location);
    EXPECT_FALSE(config.file_enabled);
    EXPECT_EQ(config.file_path, "dutch_auction.log");
}

TEST_F(LoggingTest, FileSinkWritesAndRotates) {
    auto path = std::filesystem::temp_directory_path() / "dutch_logging_test.log";
    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + ".1");

    {
        FileSink sink(path.string());
        ASSERT_TRUE(sink.is_open());
        sink.set_max_file_size(64);
        sink.set_max_files(2);

        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.component = "test";
        entry.message = std::string(80, 'x');
        sink.write(entry);
        sink.write(entry);
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_TRUE(std::filesystem::exists(path.string() + ".1"));

    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + ".1");
}

TEST_F(LoggingTest, InitLoggingInstallsConfiguredSinks) {
    auto path = std::filesystem::temp_directory_path() / "dutch_init_logging_test.log";
    std::filesystem::remove(path);

    LogConfig config;
    config.default_level = LogLevel::WARN;
    config.component_levels = {{"ledger.bank", LogLevel::DEBUG}};
    config.console_enabled = false;
    config.file_enabled = true;
    config.file_path = path.string();
    init_logging(config);

    Logger& logger = Logger::instance();
    EXPECT_EQ(logger.level(), LogLevel::WARN);
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "ledger.bank"));
    EXPECT_FALSE(logger.is_enabled(LogLevel::INFO, "auction.processor"));

    DUTCH_LOG_DEBUG(log::bank) << "snapshot restored";
    DUTCH_LOG_INFO(log::processor) << "dispatch suppressed";
    DUTCH_LOG_WARN(log::processor) << "vault mismatch";
    shutdown_logging();

    // Previously installed sinks are replaced
    EXPECT_FALSE(sink_->contains("snapshot restored"));
    logger.clear_sinks();

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    const std::string text = contents.str();
    EXPECT_NE(text.find("snapshot restored"), std::string::npos);
    EXPECT_NE(text.find("vault mismatch"), std::string::npos);
    EXPECT_EQ(text.find("dispatch suppressed"), std::string::npos);

    in.close();
    std::filesystem::remove(path);
}

TEST_F(LoggingTest, InitLoggingSkipsUnopenableFile) {
    LogConfig config;
    config.console_enabled = false;
    config.file_enabled = true;
    config.file_path = (std::filesystem::temp_directory_path() / "dutch_missing_dir" / "x" / "out.log").string();
    init_logging(config);

    // No sink installed; logging is still safe
    EXPECT_FALSE(std::filesystem::exists(config.file_path));
    DUTCH_LOG_WARN(log::core) << "nowhere to go";
    Logger::instance().clear_sinks();
}

TEST_F(LoggingTest, LogMacros) {
    Logger::instance().set_level(LogLevel::TRACE);
    ComponentLogger logger("test");

    DUTCH_LOG_TRACE(logger) << "Trace via macro";
    DUTCH_LOG_DEBUG(logger) << "Debug via macro";
    DUTCH_LOG_INFO(logger) << "Info via macro";
    DUTCH_LOG_WARN(logger) << "Warn via macro";
    DUTCH_LOG_ERROR(logger) << "Error via macro";

    EXPECT_EQ(sink_->entries().size(), 5u);
    EXPECT_TRUE(sink_->contains("Error via macro"));
}

TEST_F(LoggingTest, ThreadSafety) {
    std::atomic<int> completed{0};

    auto log_func = [&completed]() {
        ComponentLogger thread_logger("thread");
        for (int i = 0; i < 100; ++i) {
            thread_logger.info() << "Thread message " << i;
        }
        completed++;
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back(log_func);
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(completed.load(), 4);
    EXPECT_EQ(sink_->entries().size(), 400u);
}

}  // namespace
}  // namespace dutch
