#include "app.hpp"
#include <ncurses.h>

App::App(const WordCatalog& catalog, const Settings& settings, const Terminal& screen,
         const std::string& startup_message)
  : session_(catalog, settings.paper_mode, settings.mode),
    renderer_(catalog),
    render_opts_{screen.color(), settings.carousel_window},
    term_(screen),
    startup_message_(startup_message) {}

void App::run() {
  while (!session_.should_quit()) {
    render();
    int ch = getch();
    if (ch == ERR) continue;
    handle_key(ch);
  }
}

void App::render() {
  SessionSnapshot snap = session_.snapshot();
  if (snap.message.empty()) snap.message = startup_message_;
  renderer_.render(term_, snap, render_opts_);
}

void App::handle_key(int ch) {
  if (ch == KEY_RESIZE) return;
  if (auto ev = input_.translate(ch)) session_.handle(*ev);
}
