#include "history_store.hpp"
#include <cassert>
#include <string>

static void test_accept_and_saturation() {
  HistoryStore h;
  assert(h.empty() && !h.current());
  for (int i = 0; i < 20; ++i) {
    assert(h.accept("w" + std::to_string(i)));
    assert(h.review_index() == static_cast<size_t>(i));
  }
  assert(h.size() == 20 && h.full());
  auto before = h.words();
  assert(!h.accept("extra"));
  assert(h.size() == 20);
  assert(h.words() == before);
  assert(h.at(0).word == "w0" && h.at(19).word == "w19");
  assert(h.at(0).order < h.at(19).order);
}

static void test_paper_mode() {
  HistoryStore h(true);
  assert(h.capacity() == 1);
  h.accept("acid");
  h.accept("zero");
  assert(h.size() == 1);
  assert(h.at(0).word == "zero");
  assert(h.review_index() == 0u);
  assert(h.current() == std::string("zero"));
  for (int i = 0; i < 30; ++i) assert(h.accept("w" + std::to_string(i)));
  assert(h.size() == 1 && h.at(0).word == "w29");
}

static void test_review_up() {
  HistoryStore h;
  h.review_up();
  assert(!h.reviewing());
  h.accept("a"); h.accept("b"); h.accept("c");
  h.clear_review();
  h.review_up();
  assert(h.review_index() == 2u);
  h.review_up();
  h.review_up();
  assert(h.review_index() == 0u);
  h.review_up();
  assert(h.review_index() == 0u);
  assert(h.current() == std::string("a"));
}

static void test_review_down_and_exit() {
  HistoryStore empty;
  empty.review_down();
  assert(!empty.reviewing());

  HistoryStore h;
  h.accept("a"); h.accept("b");
  h.clear_review();
  h.review_down();
  assert(h.review_index() == 0u);
  h.review_down();
  assert(h.review_index() == 1u);
  // past the most recent entry: back to live input
  h.review_down();
  assert(!h.reviewing());
  assert(!h.current());
  h.review_down();
  assert(h.review_index() == 0u);
}

int main() {
  test_accept_and_saturation();
  test_paper_mode();
  test_review_up();
  test_review_down_and_exit();
  return 0;
}
