#include "input.hpp"
#include <ncurses.h>

static constexpr int ESC = 27;
static constexpr int DEL = 127;
static constexpr int CTRL_h = 'H'-64;

std::optional<SessionEvent> Input::translate(int ch) const {
  using K = SessionEvent::Kind;
  switch (ch) {
    case ESC: return SessionEvent::of(K::Terminate);
    case KEY_BACKSPACE: case DEL: case CTRL_h: return SessionEvent::of(K::Backspace);
    case KEY_LEFT: return SessionEvent::of(K::CursorLeft);
    case KEY_RIGHT: return SessionEvent::of(K::CursorRight);
    case KEY_UP: return SessionEvent::of(K::ReviewUp);
    case KEY_DOWN: return SessionEvent::of(K::ReviewDown);
    case '\n': case '\r': case KEY_ENTER: return SessionEvent::of(K::Confirm);
    default: break;
  }
  if (ch >= 32 && ch <= 126) return SessionEvent::append(static_cast<char>(ch));
  return std::nullopt;
}
