#pragma once
/*
 * Input
 *
 * Purpose: translate raw ncurses key codes into SessionEvents.
 * Keys: printable ASCII -> AppendChar; Backspace/127/8 -> Backspace;
 *       arrows -> cursor/review; Enter -> Confirm; Esc -> Terminate.
 */
#include <optional>
#include "types.hpp"

class Input {
public:
  std::optional<SessionEvent> translate(int ch) const;
};
