#include "persistence_writer.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

PersistenceWriter::PersistenceWriter(ResultStore& store, WriterOptions options)
    : store_(store), options_(options) {}

PersistenceWriter::~PersistenceWriter() {
    stop();
}

void PersistenceWriter::start() {
    if (running_) {
        spdlog::warn("Persistence writer already running");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        closed_ = false;
    }
    running_ = true;
    writer_thread_ = std::thread(&PersistenceWriter::writer_loop, this);
    spdlog::info("Persistence writer started (capacity {}, batch {}, flush every {} ms)",
                 options_.queue_capacity, options_.batch_size, options_.flush_interval.count());
}

void PersistenceWriter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        stopping_ = true;
        drain_deadline_ = std::chrono::steady_clock::now() + options_.shutdown_grace;
    }
    cv_.notify_all();

    if (writer_thread_.joinable()) {
        writer_thread_.join();
    } else {
        // Never started: nothing will write what is still queued.
        std::lock_guard<std::mutex> lock(mutex_);
        discarded_on_shutdown_ += queue_.size();
        queue_.clear();
        closed_ = true;
    }
    running_ = false;
    spdlog::info("Persistence writer stopped ({} written, {} failed, {} overflowed, {} discarded)",
                 written_items_.load(), failed_items_.load(), overflow_drops_.load(),
                 discarded_on_shutdown_.load());
}

bool PersistenceWriter::enqueue(PersistItem item) {
    bool evicted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            spdlog::debug("Persistence writer closed, item not queued");
            return false;
        }
        if (queue_.size() >= options_.queue_capacity) {
            queue_.pop_front();
            evicted = true;
        }
        queue_.push_back(std::move(item));
        if (queue_.size() >= options_.batch_size) {
            cv_.notify_one();
        }
    }

    if (evicted) {
        auto drops = ++overflow_drops_;
        if (drops == 1 || drops % 1000 == 0) {
            spdlog::warn("Persistence queue full ({} items), dropped oldest pending write ({} dropped so far)",
                         options_.queue_capacity, drops);
        }
    }
    return !evicted;
}

size_t PersistenceWriter::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void PersistenceWriter::writer_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, options_.flush_interval, [this] {
                return stopping_ || queue_.size() >= options_.batch_size;
            });
            if (stopping_) break;
        }

        // Flush everything that is pending, one batch at a time.
        for (auto batch = take_batch(); !batch.empty(); batch = take_batch()) {
            write_with_retry(batch);
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) break;
        }
    }

    drain_on_shutdown();
}

void PersistenceWriter::drain_on_shutdown() {
    spdlog::info("Draining {} pending writes before shutdown", pending());

    while (std::chrono::steady_clock::now() < drain_deadline_) {
        auto batch = take_batch();
        if (batch.empty()) break;
        write_with_retry(batch);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!queue_.empty()) {
        spdlog::error("Shutdown grace period elapsed, discarding {} pending writes", queue_.size());
        discarded_on_shutdown_ += queue_.size();
        queue_.clear();
    }
    closed_ = true;
}

std::vector<PersistItem> PersistenceWriter::take_batch() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = std::min(queue_.size(), options_.batch_size);
    std::vector<PersistItem> batch;
    batch.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
    }
    return batch;
}

bool PersistenceWriter::write_with_retry(const std::vector<PersistItem>& batch) {
    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        try {
            store_.write_batch(batch);
            written_items_ += batch.size();
            spdlog::debug("Persisted batch of {} items", batch.size());
            return true;
        } catch (const std::exception& e) {
            spdlog::error("Persistence write of {} items failed (attempt {}/{}): {}",
                          batch.size(), attempt, options_.max_attempts, e.what());
        }

        if (attempt == options_.max_attempts) break;

        // Exponential backoff with jitter
        auto base_ms = static_cast<double>(options_.retry_base.count()) * (1 << (attempt - 1));
        auto backoff = std::chrono::milliseconds(static_cast<int64_t>(util::random_jitter(base_ms, 0.1)));
        if (!wait_backoff(backoff)) {
            spdlog::warn("Shutdown deadline reached while retrying a batch of {} items", batch.size());
            break;
        }
    }

    failed_items_ += batch.size();
    spdlog::error("Dropping batch of {} items after failed persistence attempts", batch.size());
    return false;
}

bool PersistenceWriter::wait_backoff(std::chrono::milliseconds backoff) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!stopping_) {
        // A shutdown request cuts the wait short; the retry then runs under
        // the drain deadline.
        cv_.wait_for(lock, backoff, [this] { return stopping_; });
        return !stopping_ || std::chrono::steady_clock::now() < drain_deadline_;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= drain_deadline_) {
        return false;
    }
    auto wait = std::min<std::chrono::steady_clock::duration>(backoff, drain_deadline_ - now);
    lock.unlock();
    std::this_thread::sleep_for(wait);
    return std::chrono::steady_clock::now() < drain_deadline_;
}
