#pragma once
/*
 * App
 *
 * Purpose: the mfling terminal program: ScreenHost + Registry + commands,
 * driven by a poll loop over the keyboard and the surfaces' ptys.
 * Keys: everything goes to the focused surface's process; Ctrl-] is the
 * prefix (n next, p prev, h hide, t toggle, l list, : command line, q quit,
 * Ctrl-] sends a literal Ctrl-]). With no process focused, ':' opens the
 * command line directly.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "cmd_registry.hpp"
#include "iterminal.hpp"
#include "registry.hpp"
#include "renderer.hpp"
#include "screen_host.hpp"
#include "session_provider.hpp"
#include "surface_commands.hpp"

class App {
public:
  App(ITerminal& term, std::optional<std::filesystem::path> rc);
  int run();

private:
  enum class Mode { Normal, Prefix, Command };

  void render();
  void wait_for_input();
  void handle_input(int ch);
  void handle_normal_input(int ch);
  void handle_prefix_input(int ch);
  void handle_command_input(int ch);
  void execute_command();
  void report(const Status& st);
  void load_rc();

  ITerminal& term;
  ScreenHost host;
  PosixCommandRunner runner;
  SessionProviderRegistry sessions;
  Registry registry;
  CommandRegistry commands;
  CommandOutput output;
  Renderer renderer;
  std::optional<std::filesystem::path> rc_path;
  Mode mode = Mode::Normal;
  std::string message;
  std::string cmdline;
};
