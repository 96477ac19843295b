#include "renderer.hpp"
#include <algorithm>

static std::string fit(const std::string& s, int width) {
  if (width <= 0) return std::string();
  if ((int)s.size() <= width) return s;
  return s.substr(0, static_cast<size_t>(width));
}

static void render_body(ITerminal& term, const WindowRenderInfo& w, Rect inner) {
  if (!w.lines || inner.height <= 0 || inner.width <= 0) return;
  const auto& lines = *w.lines;
  int total = static_cast<int>(lines.size());
  // a trailing empty line is where the next output goes, not content
  if (w.follow_tail && total > 0 && lines.back().empty()) total--;
  int first = w.follow_tail ? std::max(0, total - inner.height) : 0;
  for (int i = 0; i < inner.height && first + i < total; ++i) {
    term.draw_text(inner.row + i, inner.col, fit(lines[first + i], inner.width));
  }
}

void Renderer::render(ITerminal& term,
                      const std::vector<WindowRenderInfo>& windows,
                      const std::string& message,
                      const std::string& cmdline,
                      bool command_mode) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  for (const auto& w : windows) {
    const Rect& a = w.area;
    if (a.height <= 0 || a.width <= 0) continue;
    if (w.floating) {
      term.draw_box(a.row, a.col, a.height, a.width, w.focused);
      std::string title = " " + w.title + " ";
      if (a.width > 4) term.draw_text(a.row, a.col + 2, fit(title, a.width - 4));
      render_body(term, w, Rect{a.row + 1, a.col + 1, a.height - 2, a.width - 2});
    } else {
      // splits and tab windows: one title bar on top
      std::string bar = fit(" " + w.title, a.width);
      bar.append(static_cast<size_t>(a.width) - bar.size(), ' ');
      if (w.focused) term.draw_highlighted(a.row, a.col, bar); else term.draw_text(a.row, a.col, bar);
      render_body(term, w, Rect{a.row + 1, a.col, a.height - 1, a.width});
    }
  }
  std::string status = command_mode ? ":" + cmdline : message;
  term.draw_text(rows - 1, 0, fit(status, cols));
  term.clear_to_eol(rows - 1, std::min(cols - 1, (int)status.size()));
  if (command_mode) {
    term.move_cursor(rows - 1, std::min(cols - 1, (int)cmdline.size() + 1));
  } else {
    term.move_cursor(rows - 1, 0);
  }
  term.refresh();
}
