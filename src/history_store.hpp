#pragma once
/*
 * HistoryStore
 *
 * Purpose: bounded, order-preserving list of accepted words with a review
 *          cursor independent of live input.
 * Storage: fixed arena of kCapacity slots + count; review cursor is an
 *          optional index into it (nullopt: live input view).
 * Policy: normal mode keeps up to 20 words and drops accepts once full;
 *         paper mode keeps only the most recent word.
 */
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct HistoryEntry {
  std::string word;
  uint64_t order = 0; // insertion order across the session
};

class HistoryStore {
public:
  static constexpr size_t kCapacity = 20;

  explicit HistoryStore(bool paper_mode = false) : paper_(paper_mode) {}

  // Returns false when the word was dropped (store full, normal mode).
  bool accept(const std::string& word);
  void review_up();
  void review_down();
  void clear_review() { review_.reset(); }

  std::optional<std::string> current() const;
  std::optional<size_t> review_index() const { return review_; }
  bool reviewing() const { return review_.has_value(); }

  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }
  bool full() const { return count_ >= capacity(); }
  size_t capacity() const { return paper_ ? 1 : kCapacity; }
  bool paper_mode() const { return paper_; }
  const HistoryEntry& at(size_t i) const { return slots_[i]; }
  std::vector<std::string> words() const;

private:
  std::array<HistoryEntry, kCapacity> slots_{};
  size_t count_ = 0;
  std::optional<size_t> review_;
  uint64_t next_order_ = 0;
  bool paper_ = false;
};
