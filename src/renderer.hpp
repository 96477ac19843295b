#pragma once
/*
 * Renderer
 *
 * Purpose: draw the visible windows of the current tab plus the status /
 * command line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from ScreenHost to render.
 */
#include <string>
#include <vector>
#include "geometry.hpp"
#include "iterminal.hpp"

struct WindowRenderInfo {
  const std::vector<std::string>* lines = nullptr;
  std::string title;
  Rect area{};
  bool floating = false;
  bool focused = false;
  bool follow_tail = false;  // process output: show the last lines
};

class Renderer {
public:
  // windows are drawn in order; floating ones should come last
  void render(ITerminal& term,
              const std::vector<WindowRenderInfo>& windows,
              const std::string& message,
              const std::string& cmdline,
              bool command_mode);
};
