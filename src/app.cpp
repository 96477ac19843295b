#include "app.hpp"
#include <ncurses.h>
#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <vector>

static constexpr int CTRL_RBRACKET = 29;
static constexpr int ESC = 27;

App::App(ITerminal& term, std::optional<std::filesystem::path> rc)
  : term(term), host(term), registry(host, sessions), rc_path(std::move(rc)) {
  register_default_providers(sessions, runner);
  register_surface_commands(commands, registry, output);
  registry.set_notify([this](const std::string& m) { message = m; });
  load_rc();
}

void App::load_rc() {
  std::filesystem::path p;
  if (rc_path) {
    p = *rc_path;
  } else {
    const char* home = std::getenv("HOME");
    if (!home) return;
    p = std::filesystem::path(home) / ".mflingrc";
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) return;
  }
  std::vector<std::string> errors;
  std::string msg;
  if (!load_rc_file(commands, p, errors, msg)) { message = msg; return; }
  if (!errors.empty()) {
    message = p.string() + " " + errors.front();
    if (errors.size() > 1) message += " (+" + std::to_string(errors.size() - 1) + " more)";
  }
}

int App::run() {
  while (!output.quit) {
    host.pump();
    registry.pump_host_events();
    registry.run_due_sends(Registry::Clock::now());
    render();
    wait_for_input();
    for (int ch = term.read_key(); ch != -1 && !output.quit; ch = term.read_key()) handle_input(ch);
  }
  return 0;
}

void App::render() {
  host.render(renderer, message, cmdline, mode == Mode::Command);
}

void App::wait_for_input() {
  std::vector<pollfd> fds;
  fds.push_back(pollfd{STDIN_FILENO, POLLIN, 0});
  for (int fd : host.poll_fds()) fds.push_back(pollfd{fd, POLLIN, 0});
  int timeout_ms = 250;
  if (auto due = registry.next_send_due()) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*due - Registry::Clock::now()).count();
    timeout_ms = static_cast<int>(std::clamp<long long>(left, 0, timeout_ms));
  }
  (void)::poll(fds.data(), fds.size(), timeout_ms);
}

// notify() may already have left a message while the command ran
void App::report(const Status& st) {
  if (!st) message = st.describe();
  else if (!output.message.empty()) message = output.message;
}

void App::handle_input(int ch) {
  if (ch == KEY_RESIZE) { host.sync_size(); return; }
  switch (mode) {
    case Mode::Normal: handle_normal_input(ch); break;
    case Mode::Prefix: handle_prefix_input(ch); break;
    case Mode::Command: handle_command_input(ch); break;
  }
}

void App::handle_normal_input(int ch) {
  if (ch == CTRL_RBRACKET) { mode = Mode::Prefix; return; }
  std::string bytes;
  switch (ch) {
    case KEY_UP: bytes = "\x1b[A"; break;
    case KEY_DOWN: bytes = "\x1b[B"; break;
    case KEY_RIGHT: bytes = "\x1b[C"; break;
    case KEY_LEFT: bytes = "\x1b[D"; break;
    case KEY_HOME: bytes = "\x1b[H"; break;
    case KEY_END: bytes = "\x1b[F"; break;
    case KEY_DC: bytes = "\x1b[3~"; break;
    case KEY_BACKSPACE: bytes = "\x7f"; break;
    case KEY_ENTER: case '\n': bytes = "\r"; break;
    default:
      if (ch >= 0 && ch < 256) bytes.push_back(static_cast<char>(ch));
  }
  if (bytes.empty()) return;
  if (host.forward_to_focused(bytes)) return;
  if (ch == ':') { mode = Mode::Command; cmdline.clear(); }
}

void App::handle_prefix_input(int ch) {
  mode = Mode::Normal;
  output.message.clear();
  message.clear();
  switch (ch) {
    case 'n': report(registry.next()); break;
    case 'p': report(registry.prev()); break;
    case 'h': report(registry.hide_current()); break;
    case 't': report(registry.toggle_current()); break;
    case 'l': report(execute_command_line(commands, "list")); break;
    case 'q': output.quit = true; break;
    case ':': mode = Mode::Command; cmdline.clear(); break;
    case CTRL_RBRACKET: host.forward_to_focused("\x1d"); break;
    default: break;
  }
}

void App::handle_command_input(int ch) {
  if (ch == ESC) { mode = Mode::Normal; return; }
  if (ch == KEY_BACKSPACE || ch == 127) {
    if (cmdline.empty()) { mode = Mode::Normal; return; }
    cmdline.pop_back();
    return;
  }
  if (ch == '\n' || ch == KEY_ENTER || ch == '\r') { mode = Mode::Normal; execute_command(); return; }
  if (ch >= 32 && ch <= 126) { cmdline.push_back((char)ch); }
}

void App::execute_command() {
  output.message.clear();
  message.clear();
  report(execute_command_line(commands, cmdline));
  cmdline.clear();
}
