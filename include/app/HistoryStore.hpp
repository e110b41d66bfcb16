#pragma once
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>
#include "model/CheckRecord.hpp"

namespace netstatus::app {

// Bounded FIFO of check records, oldest first. One writer (the scheduler),
// any number of readers. Readers only ever get copies.
class HistoryStore {
public:
  static constexpr size_t kDefaultCapacity = 500;

  explicit HistoryStore(size_t capacity = kDefaultCapacity);
  // Non-copyable
  HistoryStore(const HistoryStore&) = delete;
  HistoryStore& operator=(const HistoryStore&) = delete;

  // Throws std::invalid_argument if rec is older than the newest stored record.
  void append(const model::CheckRecord& rec);

  [[nodiscard]] std::vector<model::CheckRecord> snapshot() const;
  [[nodiscard]] std::optional<model::CheckRecord> latest() const;

  [[nodiscard]] size_t size() const;
  size_t capacity() const { return capacity_; }
  // Number of appends so far (monotonic, survives eviction)
  uint64_t seq() const { return seq_.load(std::memory_order_acquire); }

private:
  const size_t capacity_;
  mutable std::mutex mu_;
  std::deque<model::CheckRecord> records_;
  std::atomic<uint64_t> seq_{0};
};

} // namespace netstatus::app
