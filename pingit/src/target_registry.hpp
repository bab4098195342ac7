#pragma once
#include "types.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Immutable view of the configured targets. A reload replaces the whole
// snapshot; holders of an older snapshot keep a consistent list.
class TargetRegistry {
public:
    using Snapshot = std::shared_ptr<const std::vector<Target>>;

    explicit TargetRegistry(std::vector<Target> targets);

    Snapshot snapshot() const;
    std::optional<Target> find(const std::string& name) const;
    size_t size() const;

    // Swaps in a new generation and returns the previous one.
    Snapshot replace(std::vector<Target> targets);

    // Non-copyable
    TargetRegistry(const TargetRegistry&) = delete;
    TargetRegistry& operator=(const TargetRegistry&) = delete;

private:
    static Snapshot make_snapshot(std::vector<Target> targets);

    mutable std::mutex mutex_;
    Snapshot current_;
};
