#pragma once
/*
 * ScreenHost
 *
 * Purpose: IHost on a real terminal. Windows are drawn through ITerminal,
 * backing processes run on ptys and their output becomes the content lines.
 * Note: the bottom row belongs to the status line, so screen_size() is one
 * row shorter than the terminal.
 */
#include <algorithm>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "host_model.hpp"
#include "pty_process.hpp"
#include "renderer.hpp"

class ScreenHost : public HostModel {
public:
  explicit ScreenHost(ITerminal& term);

  // re-read the terminal size after a resize
  void sync_size();
  // read process output and reap exited children; true when something changed
  bool pump();
  std::vector<int> poll_fds() const;
  // keystrokes for the process shown in the focused window
  bool forward_to_focused(std::string_view bytes);
  void render(Renderer& r, const std::string& message, const std::string& cmdline, bool command_mode);

protected:
  bool launch(Content& c, const std::string& command, int& pid, std::string& msg) override;
  bool deliver(int pid, std::string_view bytes) override;
  void terminate(int pid) override;
  void on_window_resized(const Window& w) override;

private:
  static TermSize usable(TermSize t) { return TermSize{std::max(1, t.rows - 1), t.cols}; }

  ITerminal& term_;
  std::map<int, std::unique_ptr<PtyProcess>> ptys_;
  std::vector<std::unique_ptr<PtyProcess>> dying_;
  static constexpr std::size_t kScrollback = 2000;
};
