#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "kalkon/result.h"

namespace kalkon {

class HistoryEntry {
public:
    using Clock = std::chrono::system_clock;

    HistoryEntry(std::size_t index, std::string expression, EvaluationResult result, Clock::time_point timestamp);

    // 1-based position in the order of appends; never reused, not even after clear().
    std::size_t index() const;
    const std::string& expression() const;
    const EvaluationResult& result() const;
    Clock::time_point timestamp() const;

private:
    std::size_t index_;
    std::string expression_;
    EvaluationResult result_;
    Clock::time_point timestamp_;
};

class RetentionPolicy {
public:
    static RetentionPolicy unbounded();
    // Keeps the `limit` newest entries. Throws std::invalid_argument for a zero limit.
    static RetentionPolicy bounded(std::size_t limit);

    bool isBounded() const;
    std::size_t limit() const;

private:
    explicit RetentionPolicy(std::size_t limit);

    std::size_t limit_;
};

class HistoryStore {
public:
    explicit HistoryStore(RetentionPolicy policy = RetentionPolicy::unbounded());

    const HistoryEntry& append(std::string expression, EvaluationResult result);
    std::vector<HistoryEntry> list() const;
    void clear();

    // Entry with the given order index, or nullptr if it was never appended or has been evicted.
    const HistoryEntry* find(std::size_t index) const;
    const HistoryEntry* latest() const;

    std::size_t size() const;
    bool empty() const;
    const RetentionPolicy& policy() const;

private:
    RetentionPolicy policy_;
    std::deque<HistoryEntry> entries_;
    std::size_t next_index_;
};

}  // namespace kalkon
