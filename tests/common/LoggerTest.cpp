#include <gtest/gtest.h>
#include <sociograph/common/Logger.h>
#include <sociograph/core/Graph.h>

#include <memory>
#include <vector>

using namespace sociograph;

namespace {

struct RecordedLine {
    LogLevel level;
    std::string message;
};

class RecordingBackend : public ILoggerBackend {
public:
    explicit RecordingBackend(std::shared_ptr<std::vector<RecordedLine>> sink)
        : sink_(std::move(sink)) {}

    void log(LogLevel level, const std::string& message,
             const std::source_location& /*loc*/) override {
        if (level >= minLevel_) {
            sink_->push_back({level, message});
        }
    }

    void setLevel(LogLevel level) override { minLevel_ = level; }
    void flush() override {}

private:
    std::shared_ptr<std::vector<RecordedLine>> sink_;
    LogLevel minLevel_ = LogLevel::Trace;
};

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        lines_ = std::make_shared<std::vector<RecordedLine>>();
        Logger::setBackend(std::make_unique<RecordingBackend>(lines_));
        Logger::clearCapturedLogs();
        Logger::enableCapture(true);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
        Logger::setBackend(nullptr);
    }

    std::shared_ptr<std::vector<RecordedLine>> lines_;
};

}  // namespace

TEST_F(LoggerTest, MacrosReachInjectedBackend) {
    LOG_INFO("hello {}", 42);
    LOG_ERROR("boom");

    ASSERT_EQ(lines_->size(), 2u);
    EXPECT_EQ((*lines_)[0].level, LogLevel::Info);
    EXPECT_NE((*lines_)[0].message.find("hello 42"), std::string::npos);
    EXPECT_EQ((*lines_)[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, MessagesCarryCallingFunction) {
    LOG_WARN("from test body");

    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_NE(lines_->front().message.find("() - from test body"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelFiltersBackend) {
    Logger::setLevel(LogLevel::Warn);
    LOG_DEBUG("hidden");
    LOG_WARN("shown");

    ASSERT_EQ(lines_->size(), 1u);
    EXPECT_EQ(lines_->front().level, LogLevel::Warn);
}

TEST_F(LoggerTest, CaptureFiltersByPattern) {
    LOG_INFO("alpha one");
    LOG_INFO("beta two");
    LOG_WARN("alpha three");

    auto all = Logger::getCapturedLogs();
    EXPECT_EQ(all.size(), 3u);

    auto alpha = Logger::getCapturedLogs("alpha");
    ASSERT_EQ(alpha.size(), 2u);
    EXPECT_NE(alpha[1].find("[warn] "), std::string::npos);

    auto newest = Logger::getCapturedLogs("", 1);
    ASSERT_EQ(newest.size(), 1u);
    EXPECT_NE(newest[0].find("alpha three"), std::string::npos);
}

TEST_F(LoggerTest, CaptureCanBeDisabledAndCleared) {
    LOG_INFO("kept");
    Logger::enableCapture(false);
    EXPECT_FALSE(Logger::isCaptureEnabled());
    LOG_INFO("dropped");

    EXPECT_EQ(Logger::getCapturedLogs().size(), 1u);
    Logger::clearCapturedLogs();
    EXPECT_TRUE(Logger::getCapturedLogs().empty());
}

TEST_F(LoggerTest, GraphRejectionsAreLoggedAsWarnings) {
    Graph graph;
    NodeId id = graph.addNode();
    graph.addEdge(id, id);

    auto warnings = Logger::getCapturedLogs("self-loop");
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("[warn] "), std::string::npos);
}

TEST_F(LoggerTest, ResettingBackendFallsBackToDefault) {
    Logger::setBackend(nullptr);
    LOG_WARN("after reset");

    EXPECT_TRUE(lines_->empty());
    EXPECT_EQ(Logger::getCapturedLogs("after reset").size(), 1u);
}
