#include "history_store.hpp"

bool HistoryStore::accept(const std::string& word) {
  if (paper_) {
    slots_[0] = HistoryEntry{word, next_order_++};
    count_ = 1;
    review_ = 0;
    return true;
  }
  if (count_ >= kCapacity) return false;
  slots_[count_] = HistoryEntry{word, next_order_++};
  review_ = count_;
  count_++;
  return true;
}

void HistoryStore::review_up() {
  if (count_ == 0) return;
  if (!review_) { review_ = count_ - 1; return; }
  if (*review_ > 0) --*review_;
}

void HistoryStore::review_down() {
  if (count_ == 0) return;
  if (!review_) { review_ = 0; return; }
  if (*review_ + 1 < count_) ++*review_;
  else review_.reset();
}

std::optional<std::string> HistoryStore::current() const {
  if (!review_ || *review_ >= count_) return std::nullopt;
  return slots_[*review_].word;
}

std::vector<std::string> HistoryStore::words() const {
  std::vector<std::string> out;
  out.reserve(count_);
  for (size_t i = 0; i < count_; ++i) out.push_back(slots_[i].word);
  return out;
}
