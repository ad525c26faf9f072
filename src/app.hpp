#pragma once
/*
 * App
 *
 * Purpose: interactive session driver. Blocks for a key, translates it into
 *          one SessionEvent, applies it, renders a fresh snapshot.
 * Note: the Terminal passed in owns the ncurses screen and must outlive App.
 */
#include <string>
#include "config.hpp"
#include "input.hpp"
#include "ncurses_terminal.hpp"
#include "renderer.hpp"
#include "session.hpp"
#include "terminal.hpp"
#include "word_catalog.hpp"

class App {
public:
  App(const WordCatalog& catalog, const Settings& settings, const Terminal& screen,
      const std::string& startup_message);
  void run();

private:
  void render();
  void handle_key(int ch);

  Session session_;
  Input input_;
  Renderer renderer_;
  RenderOptions render_opts_;
  NcursesTerminal term_;
  std::string startup_message_;
};
