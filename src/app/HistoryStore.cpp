#include "app/HistoryStore.hpp"
#include <stdexcept>

namespace netstatus::app {

HistoryStore::HistoryStore(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

void HistoryStore::append(const model::CheckRecord& rec) {
  std::lock_guard lk(mu_);
  if (!records_.empty() && rec.timestamp < records_.back().timestamp) {
    throw std::invalid_argument("HistoryStore::append: timestamp older than latest record");
  }
  records_.push_back(rec);
  while (records_.size() > capacity_) records_.pop_front();
  seq_.fetch_add(1, std::memory_order_release);
}

std::vector<model::CheckRecord> HistoryStore::snapshot() const {
  std::lock_guard lk(mu_);
  return {records_.begin(), records_.end()};
}

std::optional<model::CheckRecord> HistoryStore::latest() const {
  std::lock_guard lk(mu_);
  if (records_.empty()) return std::nullopt;
  return records_.back();
}

size_t HistoryStore::size() const {
  std::lock_guard lk(mu_);
  return records_.size();
}

} // namespace netstatus::app
