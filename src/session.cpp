#include "session.hpp"
#include "codec.hpp"

Session::Session(const WordCatalog& catalog, bool paper_mode, std::optional<InputMode> mode)
  : catalog_(catalog),
    state_(mode ? SessionState{RunningState{*mode}} : SessionState{StartupState{}}),
    suggestions_(catalog),
    history_(paper_mode) {}

std::optional<InputMode> Session::mode() const {
  if (auto* r = std::get_if<RunningState>(&state_)) return r->mode;
  return std::nullopt;
}

InputMode Session::modal_selection() const {
  if (auto* s = std::get_if<StartupState>(&state_)) return s->selection;
  return std::get<RunningState>(state_).mode;
}

void Session::handle(const SessionEvent& ev) {
  if (quit_) return;
  if (ev.kind == SessionEvent::Kind::Terminate) { quit_ = true; return; }
  if (auto* st = std::get_if<StartupState>(&state_)) { handle_startup(*st, ev); return; }
  handle_running(std::get<RunningState>(state_).mode, ev);
}

void Session::handle_startup(StartupState& st, const SessionEvent& ev) {
  switch (ev.kind) {
    case SessionEvent::Kind::CursorLeft:
    case SessionEvent::Kind::CursorRight:
      st.selection = (st.selection == InputMode::Word) ? InputMode::Binary : InputMode::Word;
      break;
    case SessionEvent::Kind::Confirm: {
      InputMode m = st.selection;
      state_ = RunningState{m}; // st dangles from here
      message_ = std::string(mode_name(m)) + " input";
    } break;
    default: break;
  }
}

void Session::handle_running(InputMode mode, const SessionEvent& ev) {
  switch (ev.kind) {
    case SessionEvent::Kind::AppendChar: append_char(mode, ev.ch); break;
    case SessionEvent::Kind::Backspace: backspace(mode); break;
    case SessionEvent::Kind::CursorLeft: move_suggestion(mode, Direction::Left); break;
    case SessionEvent::Kind::CursorRight: move_suggestion(mode, Direction::Right); break;
    case SessionEvent::Kind::ReviewUp: history_.review_up(); break;
    case SessionEvent::Kind::ReviewDown: history_.review_down(); break;
    case SessionEvent::Kind::Confirm: confirm(mode); break;
    default: break;
  }
}

void Session::append_char(InputMode mode, char c) {
  if (mode == InputMode::Binary) {
    if ((c != '0' && c != '1') || input_.size() >= kMaxBits) return;
    history_.clear_review();
    input_.push_back(c);
    return;
  }
  history_.clear_review();
  input_.push_back(c);
  suggestions_.set_input(input_);
}

void Session::backspace(InputMode mode) {
  history_.clear_review();
  if (!input_.empty()) input_.pop_back();
  if (mode == InputMode::Word) suggestions_.set_input(input_);
}

void Session::move_suggestion(InputMode mode, Direction dir) {
  if (mode != InputMode::Word) return;
  history_.clear_review();
  suggestions_.move_cursor(dir);
}

void Session::confirm(InputMode mode) {
  if (mode == InputMode::Binary) {
    auto word = decoded_input();
    if (!word) return;
    accept_word(*word);
    input_.clear();
    return;
  }
  auto word = suggestions_.current();
  if (!word) return;
  accept_word(*word);
  input_.clear();
  suggestions_.set_input(input_);
}

void Session::accept_word(const std::string& word) {
  if (!history_.accept(word)) {
    message_ = "history full (" + std::to_string(history_.capacity()) + "), '" + word + "' not saved";
    return;
  }
  if (history_.paper_mode()) message_ = "selected '" + word + "'";
  else message_ = "saved '" + word + "' (" + std::to_string(history_.size()) + "/" + std::to_string(history_.capacity()) + ")";
}

std::optional<std::string> Session::decoded_input() const {
  if (input_.size() != kMaxBits) return std::nullopt;
  std::string word; LookupError err;
  if (!decode_bits(catalog_, input_, word, err)) return std::nullopt;
  return word;
}

SessionSnapshot Session::snapshot() const {
  SessionSnapshot s;
  s.running = running();
  s.quit = quit_;
  s.mode = mode();
  s.modal_selection = modal_selection();
  s.input = input_;
  s.suggestions = suggestions_.suggestions();
  s.suggestion_cursor = suggestions_.cursor();
  s.history = history_.words();
  s.review_index = history_.review_index();
  s.history_capacity = history_.capacity();
  s.paper_mode = history_.paper_mode();
  if (s.mode == InputMode::Binary) s.decoded = decoded_input();
  s.message = message_;
  return s;
}
