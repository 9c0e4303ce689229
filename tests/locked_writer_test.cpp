// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "locked_writer.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace logroll {
namespace {

using detail::LockedWriter;
using testing::MemorySink;
using testing::RecordingEncoder;
using testing::memory_stream;

class LockedWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MemorySink>();
        encoder_ = std::make_shared<RecordingEncoder>();
        writer_.bind_encoder(encoder_);
    }

    void install() {
        auto session = writer_.acquire();
        ASSERT_TRUE(session.replace(memory_stream(sink_)).has_value());
    }

    std::shared_ptr<MemorySink> sink_;
    std::shared_ptr<RecordingEncoder> encoder_;
    LockedWriter writer_;
};

// ============================================================================
// Empty writes
// ============================================================================

TEST_F(LockedWriterTest, EmptyWriteDoesNotTakeTheLock) {
    install();

    auto session = writer_.acquire();  // Lock held for the whole test

    auto result = std::async(std::launch::async, [this] {
        return writer_.write(std::string_view{}).has_value();
    });
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(result.get());
    EXPECT_EQ(sink_->writes(), 0);
}

TEST_F(LockedWriterTest, EmptyWriteWithoutStreamSucceeds) {
    EXPECT_TRUE(writer_.write("").has_value());
}

// ============================================================================
// Writes
// ============================================================================

TEST_F(LockedWriterTest, WriteWithoutStreamFails) {
    auto result = writer_.write("data");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(Errc::stream_closed));
}

TEST_F(LockedWriterTest, WriteReachesStream) {
    install();
    ASSERT_TRUE(writer_.write("abc").has_value());
    ASSERT_TRUE(writer_.write("def").has_value());
    EXPECT_EQ(sink_->contents(), "abcdef");
}

TEST_F(LockedWriterTest, ImmediateFlushFlushesEveryWrite) {
    install();
    writer_.set_immediate_flush(true);
    ASSERT_TRUE(writer_.write("a").has_value());
    ASSERT_TRUE(writer_.write("b").has_value());
    EXPECT_EQ(sink_->flush_calls, 2);

    writer_.set_immediate_flush(false);
    ASSERT_TRUE(writer_.write("c").has_value());
    EXPECT_EQ(sink_->flush_calls, 2);
}

TEST_F(LockedWriterTest, WriteErrorIsReturned) {
    install();
    sink_->fail_writes = true;
    auto result = writer_.write("x");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), std::make_error_code(std::errc::no_space_on_device));
}

// ============================================================================
// Header and footer
// ============================================================================

TEST_F(LockedWriterTest, HeaderWrittenOncePerStream) {
    install();
    {
        auto session = writer_.acquire();
        ASSERT_TRUE(session.write_header().has_value());
        ASSERT_TRUE(session.write_header().has_value());
    }
    EXPECT_EQ(sink_->contents(), "H\n");
    EXPECT_EQ(encoder_->header_calls, 1);
}

TEST_F(LockedWriterTest, CloseWritesFooterOnce) {
    install();
    {
        auto session = writer_.acquire();
        ASSERT_TRUE(session.write_header().has_value());
        ASSERT_TRUE(session.write("m\n").has_value());
        ASSERT_TRUE(session.close().has_value());
        ASSERT_TRUE(session.close().has_value());
        EXPECT_FALSE(session.is_open());
    }
    EXPECT_EQ(sink_->contents(), "H\nm\nF\n");
    EXPECT_EQ(sink_->close_calls, 1);
    EXPECT_FALSE(writer_.is_open());
}

TEST_F(LockedWriterTest, ReplaceClosesPreviousStreamWithFooter) {
    install();
    auto second = std::make_shared<MemorySink>();
    {
        auto session = writer_.acquire();
        ASSERT_TRUE(session.write_header().has_value());
        ASSERT_TRUE(session.replace(memory_stream(second)).has_value());
        ASSERT_TRUE(session.write_header().has_value());
    }

    EXPECT_EQ(sink_->contents(), "H\nF\n");
    EXPECT_EQ(sink_->close_calls, 1);
    EXPECT_EQ(second->contents(), "H\n");
}

TEST_F(LockedWriterTest, DiscardClosesWithoutFooter) {
    install();
    {
        auto session = writer_.acquire();
        ASSERT_TRUE(session.write_header().has_value());
        ASSERT_TRUE(session.discard().has_value());
        EXPECT_FALSE(session.is_open());
    }
    EXPECT_EQ(sink_->contents(), "H\n");
    EXPECT_EQ(sink_->close_calls, 1);
    EXPECT_EQ(encoder_->footer_calls, 0);
}

TEST_F(LockedWriterTest, NoFooterWithoutStream) {
    auto session = writer_.acquire();
    ASSERT_TRUE(session.close().has_value());
    EXPECT_EQ(encoder_->footer_calls, 0);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(LockedWriterTest, ConcurrentWritesAreNotTorn) {
    install();
    writer_.set_immediate_flush(false);

    constexpr int kThreads = 8;
    constexpr int kWrites = 500;
    const std::string line_a(64, 'a');
    const std::string line_b(64, 'b');

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            const auto& body = t % 2 == 0 ? line_a : line_b;
            for (int i = 0; i < kWrites; ++i) {
                ASSERT_TRUE(writer_.write(body + "\n").has_value());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto contents = sink_->contents();
    ASSERT_EQ(contents.size(), static_cast<std::size_t>(kThreads * kWrites * 65));
    for (std::size_t pos = 0; pos < contents.size(); pos += 65) {
        auto line = contents.substr(pos, 65);
        EXPECT_TRUE(line == line_a + "\n" || line == line_b + "\n") << "torn line at " << pos;
    }
}

} // namespace
} // namespace logroll
