// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/appender.hpp"
#include "logroll/file_appender.hpp"
#include "locked_writer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace logroll {
namespace {

using testing::MemorySink;
using testing::RecordingEncoder;
using testing::count_matching;
using testing::memory_stream;
using testing::record_with;

// ============================================================================
// State transitions
// ============================================================================

TEST(AppenderStateTest, Transitions) {
    using S = AppenderState;
    using T = AppenderTransition;

    EXPECT_EQ(next_state(S::Idle, T::Start), S::Started);
    EXPECT_EQ(next_state(S::Idle, T::IoFailure), S::Idle);
    EXPECT_EQ(next_state(S::Started, T::IoFailure), S::Failed);
    EXPECT_EQ(next_state(S::Started, T::Start), S::Started);
    EXPECT_EQ(next_state(S::Failed, T::Start), S::Failed);
    EXPECT_EQ(next_state(S::Failed, T::IoFailure), S::Failed);

    for (auto s : {S::Idle, S::Started, S::Stopped, S::Failed}) {
        EXPECT_EQ(next_state(s, T::Stop), S::Stopped);
    }
    EXPECT_EQ(next_state(S::Stopped, T::Start), S::Stopped);
}

TEST(AppenderStateTest, TransitionsAreConstexpr) {
    static_assert(next_state(AppenderState::Idle, AppenderTransition::Start) == AppenderState::Started);
    static_assert(appender_state_name(AppenderState::Failed) == "FAILED");
    SUCCEED();
}

// ============================================================================
// OutputStreamAppender
// ============================================================================

class OutputStreamAppenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MemorySink>();
        encoder_ = std::make_shared<RecordingEncoder>();
    }

    std::size_t errors() const {
        return context_.status_manager().count(StatusLevel::Error);
    }

    void configure(OutputStreamAppender& appender) {
        appender.set_encoder(encoder_);
        appender.set_output_stream(memory_stream(sink_));
    }

    Context context_;
    std::shared_ptr<MemorySink> sink_;
    std::shared_ptr<RecordingEncoder> encoder_;
};

TEST_F(OutputStreamAppenderTest, StartWithoutEncoderOrStreamReportsTwoErrors) {
    OutputStreamAppender appender(context_, "A");
    appender.start();

    EXPECT_EQ(errors(), 2u);
    EXPECT_EQ(appender.state(), AppenderState::Idle);
    EXPECT_FALSE(appender.is_started());
    EXPECT_TRUE(testing::contains_match(context_, StatusLevel::Error, "No encoder set for the appender named \"A\""));
    EXPECT_TRUE(testing::contains_match(context_, StatusLevel::Error, "No output stream set for the appender named \"A\""));
}

TEST_F(OutputStreamAppenderTest, StartWithoutStreamReportsOneError) {
    OutputStreamAppender appender(context_, "A");
    appender.set_encoder(encoder_);
    appender.start();

    EXPECT_EQ(errors(), 1u);
    EXPECT_EQ(appender.state(), AppenderState::Idle);
}

TEST_F(OutputStreamAppenderTest, StreamBeforeEncoderWarnsAndStillWritesHeaderOnStart) {
    OutputStreamAppender appender(context_, "A");
    appender.set_output_stream(memory_stream(sink_));
    EXPECT_TRUE(testing::contains_match(context_, StatusLevel::Warn, "Encoder has not been set"));

    appender.set_encoder(encoder_);
    appender.start();
    ASSERT_TRUE(appender.is_started());
    EXPECT_EQ(sink_->contents(), "H\n");
}

TEST_F(OutputStreamAppenderTest, AppendWritesEncodedRecord) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();
    ASSERT_TRUE(appender.is_started());

    appender.append(record_with("one"));
    appender.append(record_with("two"));

    EXPECT_EQ(sink_->contents(), "H\none\ntwo\n");
    EXPECT_EQ(errors(), 0u);
}

TEST_F(OutputStreamAppenderTest, AppendBeforeStartIsDroppedWithLimitedWarnings) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);

    for (int i = 0; i < 10; ++i) {
        appender.append(record_with("dropped"));
    }
    EXPECT_EQ(encoder_->encode_calls, 0);
    EXPECT_EQ(count_matching(context_, StatusLevel::Warn, "non started appender"), 3u);
}

TEST_F(OutputStreamAppenderTest, WriteFailureDemotesToFailedOnce) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();
    ASSERT_TRUE(appender.is_started());

    sink_->fail_writes = true;
    appender.append(record_with("lost"));

    EXPECT_EQ(appender.state(), AppenderState::Failed);
    EXPECT_FALSE(appender.is_started());
    EXPECT_EQ(errors(), 1u);
    EXPECT_TRUE(testing::contains_match(context_, StatusLevel::Error, "IO failure in appender"));

    const int writes_after_failure = sink_->writes();
    appender.append(record_with("silent"));
    appender.append(record_with("silent"));
    EXPECT_EQ(sink_->writes(), writes_after_failure);
    EXPECT_EQ(encoder_->encode_calls, 1);
    EXPECT_EQ(errors(), 1u);
}

TEST_F(OutputStreamAppenderTest, EncoderFailureDemotesToFailed) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();

    encoder_->fail_encode = true;
    appender.append(record_with("x"));

    EXPECT_EQ(appender.state(), AppenderState::Failed);
    EXPECT_EQ(errors(), 1u);
}

TEST_F(OutputStreamAppenderTest, ConcurrentFailuresReportOnce) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();
    sink_->fail_writes = true;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                appender.append(record_with("x"));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(appender.state(), AppenderState::Failed);
    EXPECT_EQ(count_matching(context_, StatusLevel::Error, "IO failure"), 1u);
}

TEST_F(OutputStreamAppenderTest, FailedAppenderCannotRestart) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();
    sink_->fail_writes = true;
    appender.append(record_with("x"));
    ASSERT_EQ(appender.state(), AppenderState::Failed);

    appender.start();
    EXPECT_EQ(appender.state(), AppenderState::Failed);

    appender.stop();
    EXPECT_EQ(appender.state(), AppenderState::Stopped);
}

TEST_F(OutputStreamAppenderTest, StopIsIdempotentAndWritesFooterOnce) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();
    appender.append(record_with("m"));

    appender.stop();
    appender.stop();
    appender.stop();

    EXPECT_EQ(appender.state(), AppenderState::Stopped);
    EXPECT_EQ(sink_->contents(), "H\nm\nF\n");
    EXPECT_EQ(encoder_->header_calls, 1);
    EXPECT_EQ(encoder_->footer_calls, 1);

    appender.append(record_with("after stop"));
    EXPECT_EQ(sink_->contents(), "H\nm\nF\n");
}

TEST_F(OutputStreamAppenderTest, ReplacingStreamWritesFooterToOldAndHeaderToNew) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();

    auto second = std::make_shared<MemorySink>();
    appender.set_output_stream(memory_stream(second));
    appender.append(record_with("m"));

    EXPECT_EQ(sink_->contents(), "H\nF\n");
    EXPECT_EQ(second->contents(), "H\nm\n");
}

// ============================================================================
// Deferred processing hook
// ============================================================================

TEST_F(OutputStreamAppenderTest, PrepareHookRunsOnceBeforeEncoding) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();

    int calls = 0;
    std::string owned;
    Event event{record_with("borrowed"), {}};
    event.prepare_for_deferred_processing = [&](Record& record) {
        ++calls;
        EXPECT_EQ(encoder_->encode_calls, 0);
        owned = "owned";
        record.message = owned;
    };

    appender.append(event);
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(event.prepare_for_deferred_processing);
    EXPECT_EQ(sink_->contents(), "H\nowned\n");

    appender.append(event);
    EXPECT_EQ(calls, 1);
}

TEST_F(OutputStreamAppenderTest, EventWithoutHookIsEncodedDirectly) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.start();

    Event event{record_with("plain"), {}};
    appender.append(event);
    EXPECT_EQ(sink_->contents(), "H\nplain\n");
}

TEST_F(OutputStreamAppenderTest, ConcurrentAppendsProduceWholeLines) {
    OutputStreamAppender appender(context_, "A");
    configure(appender);
    appender.set_immediate_flush(false);
    appender.start();

    constexpr int kThreads = 6;
    constexpr int kEvents = 300;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&appender, t] {
            const std::string message(40, static_cast<char>('a' + t));
            for (int i = 0; i < kEvents; ++i) {
                appender.append(record_with(message));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    appender.stop();

    auto contents = sink_->contents();
    ASSERT_TRUE(contents.starts_with("H\n"));
    ASSERT_TRUE(contents.ends_with("F\n"));
    auto body = contents.substr(2, contents.size() - 4);
    ASSERT_EQ(body.size(), static_cast<std::size_t>(kThreads * kEvents * 41));
    for (std::size_t pos = 0; pos < body.size(); pos += 41) {
        auto line = body.substr(pos, 41);
        EXPECT_EQ(line.find_first_not_of(line[0]), 40u) << "torn line at " << pos;
        EXPECT_EQ(line.back(), '\n');
    }
}

// ============================================================================
// FileAppender
// ============================================================================

class FileAppenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = testing::unique_temp_dir("logroll_file_appender");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
    Context context_;
};

TEST_F(FileAppenderTest, MissingFileIsReported) {
    FileAppender appender(context_, "FA");
    appender.set_encoder(std::make_shared<RecordingEncoder>());
    appender.start();

    EXPECT_FALSE(appender.is_started());
    EXPECT_TRUE(testing::contains_match(context_, StatusLevel::Error, "\"File\" property not set"));
}

TEST_F(FileAppenderTest, CreatesParentDirectoriesAndWrites) {
    auto file = dir_ / "nested" / "deeper" / "app.log";
    FileAppender appender(context_, "FA");
    appender.set_file(file);
    appender.set_encoder(std::make_shared<RecordingEncoder>());
    appender.start();
    ASSERT_TRUE(appender.is_started());

    appender.append(record_with("hello"));
    appender.stop();

    EXPECT_EQ(testing::read_file(file), "H\nhello\nF\n");
}

TEST_F(FileAppenderTest, RestartOnFreshInstanceAppendsHeaderAndFooterOnce) {
    auto file = dir_ / "app.log";
    for (const char* message : {"first", "second"}) {
        FileAppender appender(context_, "FA");
        appender.set_file(file);
        appender.set_encoder(std::make_shared<RecordingEncoder>());
        appender.start();
        ASSERT_TRUE(appender.is_started());
        appender.append(record_with(message));
        appender.stop();
        appender.stop();
    }

    EXPECT_EQ(testing::read_file(file), "H\nfirst\nF\nH\nsecond\nF\n");
    EXPECT_EQ(context_.status_manager().count(StatusLevel::Error), 0u);
}

TEST_F(FileAppenderTest, TruncateModeDiscardsOldContent) {
    auto file = dir_ / "app.log";
    {
        FileAppender appender(context_, "FA");
        appender.set_file(file);
        appender.set_encoder(std::make_shared<RecordingEncoder>());
        appender.start();
        appender.append(record_with("old"));
    }
    {
        FileAppender appender(context_, "FA");
        appender.set_file(file);
        appender.set_append(false);
        appender.set_encoder(std::make_shared<RecordingEncoder>());
        appender.start();
        appender.append(record_with("new"));
    }
    EXPECT_EQ(testing::read_file(file), "H\nnew\nF\n");
}

TEST_F(FileAppenderTest, UnopenableFileStaysIdle) {
    // A directory cannot be opened as a file
    FileAppender appender(context_, "FA");
    appender.set_file(dir_);
    appender.set_encoder(std::make_shared<RecordingEncoder>());
    appender.start();

    EXPECT_EQ(appender.state(), AppenderState::Idle);
    EXPECT_TRUE(testing::contains_match(context_, StatusLevel::Error, "Failed to open file"));
}


class InspectableFileAppender : public FileAppender {
public:
    using FileAppender::FileAppender;

    bool stream_open() { return writer().is_open(); }
};

TEST_F(FileAppenderTest, StopWhileAppendingClosesForGood) {
    constexpr int kThreads = 4;
    auto file = dir_ / "app.log";
    InspectableFileAppender appender(context_, "FA");
    appender.set_file(file);
    appender.set_encoder(std::make_shared<RecordingEncoder>());
    appender.start();
    ASSERT_TRUE(appender.is_started());

    std::atomic<bool> done{false};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            while (!done.load()) {
                appender.append(record_with("event"));
            }
        });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    appender.stop();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    done = true;
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(appender.state(), AppenderState::Stopped);
    EXPECT_FALSE(appender.stream_open());
    EXPECT_TRUE(testing::read_file(file).ends_with("event\nF\n"));
    EXPECT_EQ(count_matching(context_, StatusLevel::Error, "IO failure"), 0u);
}

} // namespace
} // namespace logroll
