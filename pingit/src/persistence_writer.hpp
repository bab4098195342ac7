#pragma once
#include "result_store.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

struct WriterOptions {
    size_t queue_capacity = 10000;
    size_t batch_size = 500;
    std::chrono::milliseconds flush_interval{5000};
    // Writes per batch, the first one included.
    int max_attempts = 3;
    std::chrono::milliseconds retry_base{200};
    std::chrono::milliseconds shutdown_grace{5000};
};

// Batches items from a bounded queue into the store on its own thread.
// Producers never block: a full queue drops its oldest item.
class PersistenceWriter {
public:
    PersistenceWriter(ResultStore& store, WriterOptions options);
    ~PersistenceWriter();

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Returns false if the item was not queued as-is (an older one was
    // evicted, or the writer is already shut down).
    bool enqueue(PersistItem item);

    size_t pending() const;
    uint64_t overflow_drops() const { return overflow_drops_; }
    uint64_t written_items() const { return written_items_; }
    uint64_t failed_items() const { return failed_items_; }
    uint64_t discarded_on_shutdown() const { return discarded_on_shutdown_; }

    // Non-copyable
    PersistenceWriter(const PersistenceWriter&) = delete;
    PersistenceWriter& operator=(const PersistenceWriter&) = delete;

private:
    void writer_loop();
    void drain_on_shutdown();
    std::vector<PersistItem> take_batch();
    bool write_with_retry(const std::vector<PersistItem>& batch);
    bool wait_backoff(std::chrono::milliseconds backoff);

    ResultStore& store_;
    const WriterOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<PersistItem> queue_;
    bool stopping_ = false;
    bool closed_ = false;
    std::chrono::steady_clock::time_point drain_deadline_;

    std::atomic<bool> running_{false};
    std::thread writer_thread_;

    std::atomic<uint64_t> overflow_drops_{0};
    std::atomic<uint64_t> written_items_{0};
    std::atomic<uint64_t> failed_items_{0};
    std::atomic<uint64_t> discarded_on_shutdown_{0};
};
