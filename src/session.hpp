#pragma once
/*
 * Session
 *
 * Purpose: interactive state machine. Owns the input buffer, the active mode
 *          and composes SuggestionEngine / HistoryStore / Codec per event.
 * States: Startup{selection} -> Running{mode}; the mode exists only once
 *         Running is reached. Quit is terminal.
 * Constraint: no event aborts the session; invalid input is a no-op.
 *             snapshot() is read-only and may be called any number of times.
 */
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "history_store.hpp"
#include "suggestion_engine.hpp"
#include "types.hpp"
#include "word_catalog.hpp"

struct StartupState { InputMode selection = InputMode::Word; };
struct RunningState { InputMode mode = InputMode::Word; };
using SessionState = std::variant<StartupState, RunningState>;

struct SessionSnapshot {
  bool running = false;
  bool quit = false;
  std::optional<InputMode> mode;
  InputMode modal_selection = InputMode::Word;
  std::string input;
  std::vector<std::string> suggestions;
  size_t suggestion_cursor = 0;
  std::vector<std::string> history;
  std::optional<size_t> review_index;
  size_t history_capacity = HistoryStore::kCapacity;
  bool paper_mode = false;
  std::optional<std::string> decoded; // binary mode, complete bit string only
  std::string message;
};

class Session {
public:
  static constexpr size_t kMaxBits = 10;

  // A preselected mode skips Startup.
  Session(const WordCatalog& catalog, bool paper_mode, std::optional<InputMode> mode = std::nullopt);

  void handle(const SessionEvent& ev);
  SessionSnapshot snapshot() const;

  bool should_quit() const { return quit_; }
  bool running() const { return std::holds_alternative<RunningState>(state_); }
  std::optional<InputMode> mode() const;
  InputMode modal_selection() const;
  const std::string& input() const { return input_; }
  const std::string& message() const { return message_; }
  const SuggestionEngine& suggestions() const { return suggestions_; }
  const HistoryStore& history() const { return history_; }

private:
  void handle_startup(StartupState& st, const SessionEvent& ev);
  void handle_running(InputMode mode, const SessionEvent& ev);
  void append_char(InputMode mode, char c);
  void backspace(InputMode mode);
  void move_suggestion(InputMode mode, Direction dir);
  void confirm(InputMode mode);
  void accept_word(const std::string& word);
  std::optional<std::string> decoded_input() const;

  const WordCatalog& catalog_;
  SessionState state_;
  std::string input_;
  SuggestionEngine suggestions_;
  HistoryStore history_;
  std::string message_;
  bool quit_ = false;
};
