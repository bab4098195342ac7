#pragma once
#include "types.hpp"
#include <stdexcept>
#include <vector>

class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable sink for probe history, disconnect events and stats snapshots.
class ResultStore {
public:
    virtual ~ResultStore() = default;

    // Writes the whole batch or nothing. Throws PersistenceError on failure.
    virtual void write_batch(const std::vector<PersistItem>& items) = 0;
};
