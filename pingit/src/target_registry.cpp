#include "target_registry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_set>

TargetRegistry::TargetRegistry(std::vector<Target> targets)
    : current_(make_snapshot(std::move(targets))) {}

TargetRegistry::Snapshot TargetRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::optional<Target> TargetRegistry::find(const std::string& name) const {
    auto targets = snapshot();
    for (const auto& target : *targets) {
        if (target.name == name) {
            return target;
        }
    }
    return std::nullopt;
}

size_t TargetRegistry::size() const {
    return snapshot()->size();
}

TargetRegistry::Snapshot TargetRegistry::replace(std::vector<Target> targets) {
    auto next = make_snapshot(std::move(targets));
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::info("Target registry replaced: {} -> {} targets", current_->size(), next->size());
    std::swap(current_, next);
    return next;
}

TargetRegistry::Snapshot TargetRegistry::make_snapshot(std::vector<Target> targets) {
    std::unordered_set<std::string> names;
    for (const auto& target : targets) {
        if (!names.insert(target.name).second) {
            throw std::invalid_argument("Duplicate target name in registry: " + target.name);
        }
    }
    return std::make_shared<const std::vector<Target>>(std::move(targets));
}
