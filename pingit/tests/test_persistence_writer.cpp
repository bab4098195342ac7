#include <gtest/gtest.h>
#include "persistence_writer.hpp"
#include "test_helpers.hpp"

namespace {

WriterOptions fast_options() {
    WriterOptions options;
    options.queue_capacity = 100;
    options.batch_size = 10;
    options.flush_interval = std::chrono::milliseconds(10);
    options.max_attempts = 3;
    options.retry_base = std::chrono::milliseconds(1);
    options.shutdown_grace = std::chrono::milliseconds(1000);
    return options;
}

PersistItem result_at(int i) {
    return ProbeResult::ok(make_target("t"), at_ms(i), 1.0);
}

int64_t item_ms(const PersistItem& item) {
    return to_epoch_ms(std::get<ProbeResult>(item).timestamp) - to_epoch_ms(at_ms(0));
}

} // namespace

TEST(PersistenceWriter, FlushesEnqueuedItems) {
    RecordingStore store;
    PersistenceWriter writer(store, fast_options());
    writer.start();

    for (int i = 0; i < 25; ++i) {
        EXPECT_TRUE(writer.enqueue(result_at(i)));
    }
    ASSERT_TRUE(wait_for([&] { return store.written().size() == 25; }));
    writer.stop();

    auto written = store.written();
    for (int i = 0; i < 25; ++i) {
        EXPECT_EQ(item_ms(written[i]), i);
    }
    EXPECT_EQ(writer.written_items(), 25u);
    EXPECT_EQ(writer.failed_items(), 0u);
}

TEST(PersistenceWriter, OverflowDropsOldestWithoutBlocking) {
    RecordingStore store;
    auto options = fast_options();
    options.queue_capacity = 5;
    PersistenceWriter writer(store, options);

    // Not started: nothing drains, so the queue fills.
    auto started = std::chrono::steady_clock::now();
    int rejected = 0;
    for (int i = 0; i < 12; ++i) {
        if (!writer.enqueue(result_at(i))) ++rejected;
    }
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(500));
    EXPECT_EQ(rejected, 7);
    EXPECT_EQ(writer.pending(), 5u);
    EXPECT_EQ(writer.overflow_drops(), 7u);

    writer.start();
    ASSERT_TRUE(wait_for([&] { return store.written().size() == 5; }));
    writer.stop();

    auto written = store.written();
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(item_ms(written[i]), 7 + i);
    }
}

TEST(PersistenceWriter, TransientFailureWrittenOnce) {
    RecordingStore store;
    store.fail_next(2);
    PersistenceWriter writer(store, fast_options());

    // Queued before start so they land in one batch.
    for (int i = 0; i < 3; ++i) writer.enqueue(result_at(i));
    writer.start();
    ASSERT_TRUE(wait_for([&] { return store.written().size() == 3; }));
    writer.stop();

    EXPECT_EQ(store.written().size(), 3u);
    EXPECT_EQ(store.attempts(), 3);
    EXPECT_EQ(writer.failed_items(), 0u);
}

TEST(PersistenceWriter, PermanentFailureDroppedAfterMaxAttempts) {
    RecordingStore store;
    store.fail_always();
    PersistenceWriter writer(store, fast_options());

    for (int i = 0; i < 4; ++i) writer.enqueue(result_at(i));
    writer.start();
    ASSERT_TRUE(wait_for([&] { return writer.failed_items() == 4; }));
    writer.stop();

    EXPECT_EQ(store.attempts(), 3);
    EXPECT_TRUE(store.written().empty());
    EXPECT_EQ(writer.pending(), 0u);
}

TEST(PersistenceWriter, MaxAttemptsCountsTheFirstWrite) {
    RecordingStore store;
    store.fail_always();
    WriterOptions options = fast_options();
    options.max_attempts = 1;
    PersistenceWriter writer(store, options);

    writer.enqueue(result_at(0));
    writer.start();
    ASSERT_TRUE(wait_for([&] { return writer.failed_items() == 1; }));
    writer.stop();

    EXPECT_EQ(store.attempts(), 1);
}

TEST(PersistenceWriter, ShutdownDrainsPendingItems) {
    RecordingStore store;
    auto options = fast_options();
    options.flush_interval = std::chrono::milliseconds(60000);
    options.batch_size = 1000;
    PersistenceWriter writer(store, options);
    writer.start();

    for (int i = 0; i < 50; ++i) writer.enqueue(result_at(i));
    writer.stop();

    EXPECT_EQ(store.written().size(), 50u);
    EXPECT_EQ(writer.discarded_on_shutdown(), 0u);
    EXPECT_FALSE(writer.enqueue(result_at(99)));
}

TEST(PersistenceWriter, ShutdownGraceBoundsDrain) {
    RecordingStore store;
    store.write_delay = std::chrono::milliseconds(40);
    auto options = fast_options();
    options.flush_interval = std::chrono::milliseconds(60000);
    options.batch_size = 1;
    options.shutdown_grace = std::chrono::milliseconds(100);
    PersistenceWriter writer(store, options);
    writer.start();

    for (int i = 0; i < 40; ++i) writer.enqueue(result_at(i));

    auto started = std::chrono::steady_clock::now();
    writer.stop();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_GT(writer.discarded_on_shutdown(), 0u);
    EXPECT_EQ(writer.written_items() + writer.discarded_on_shutdown(), 40u);
}
