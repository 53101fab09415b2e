#include "kalkon/history.h"

#include <stdexcept>
#include <utility>

namespace kalkon {

HistoryEntry::HistoryEntry(std::size_t index,
                           std::string expression,
                           EvaluationResult result,
                           Clock::time_point timestamp)
    : index_(index), expression_(std::move(expression)), result_(std::move(result)), timestamp_(timestamp) {}

std::size_t HistoryEntry::index() const {
    return index_;
}

const std::string& HistoryEntry::expression() const {
    return expression_;
}

const EvaluationResult& HistoryEntry::result() const {
    return result_;
}

HistoryEntry::Clock::time_point HistoryEntry::timestamp() const {
    return timestamp_;
}

RetentionPolicy::RetentionPolicy(std::size_t limit) : limit_(limit) {}

RetentionPolicy RetentionPolicy::unbounded() {
    return RetentionPolicy(0);
}

RetentionPolicy RetentionPolicy::bounded(std::size_t limit) {
    if (limit == 0) {
        throw std::invalid_argument("History limit must be at least 1");
    }
    return RetentionPolicy(limit);
}

bool RetentionPolicy::isBounded() const {
    return limit_ != 0;
}

std::size_t RetentionPolicy::limit() const {
    return limit_;
}

HistoryStore::HistoryStore(RetentionPolicy policy) : policy_(policy), next_index_(1) {}

const HistoryEntry& HistoryStore::append(std::string expression, EvaluationResult result) {
    entries_.emplace_back(next_index_++, std::move(expression), std::move(result), HistoryEntry::Clock::now());
    while (policy_.isBounded() && entries_.size() > policy_.limit()) {
        entries_.pop_front();
    }
    return entries_.back();
}

std::vector<HistoryEntry> HistoryStore::list() const {
    return {entries_.begin(), entries_.end()};
}

void HistoryStore::clear() {
    entries_.clear();
}

const HistoryEntry* HistoryStore::find(std::size_t index) const {
    if (entries_.empty() || index < entries_.front().index() || index > entries_.back().index()) {
        return nullptr;
    }
    // Indices are contiguous between the oldest and newest retained entry.
    return &entries_[index - entries_.front().index()];
}

const HistoryEntry* HistoryStore::latest() const {
    if (entries_.empty()) {
        return nullptr;
    }
    return &entries_.back();
}

std::size_t HistoryStore::size() const {
    return entries_.size();
}

bool HistoryStore::empty() const {
    return entries_.empty();
}

const RetentionPolicy& HistoryStore::policy() const {
    return policy_;
}

}  // namespace kalkon
