#pragma once
/*
 * IHost
 *
 * Purpose: the display environment surfaces live in: windows (floating or
 * docked split), tabs, content containers and the processes attached to them.
 * Goal: keep the lifecycle engine independent of the concrete screen; the
 * headless host drives tests, ScreenHost drives the terminal.
 * Note: handles carry a host-assigned generation; an identifier reused after
 * close never compares equal to its earlier incarnation.
 */
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "geometry.hpp"
#include "iterminal.hpp"
#include "presentation.hpp"

struct WindowHandle {
  int id = 0;
  std::uint64_t generation = 0;
};
inline bool operator==(const WindowHandle& a, const WindowHandle& b) {
  return a.id == b.id && a.generation == b.generation;
}
inline bool operator!=(const WindowHandle& a, const WindowHandle& b) { return !(a == b); }

struct WindowHandleHash {
  std::size_t operator()(const WindowHandle& h) const {
    return std::hash<std::uint64_t>()((static_cast<std::uint64_t>(static_cast<std::uint32_t>(h.id)) << 32) ^ h.generation);
  }
};

struct TabHandle {
  int id = 0;
  std::uint64_t generation = 0;
};
inline bool operator==(const TabHandle& a, const TabHandle& b) {
  return a.id == b.id && a.generation == b.generation;
}
inline bool operator!=(const TabHandle& a, const TabHandle& b) { return !(a == b); }

struct ContentHandle {
  int id = 0;
  std::uint64_t generation = 0;
};
inline bool operator==(const ContentHandle& a, const ContentHandle& b) {
  return a.id == b.id && a.generation == b.generation;
}

// pid (or job id) plus the generation it was started under
struct ProcessHandle {
  int pid = 0;
  std::uint64_t generation = 0;
};
inline bool operator==(const ProcessHandle& a, const ProcessHandle& b) {
  return a.pid == b.pid && a.generation == b.generation;
}
inline bool operator!=(const ProcessHandle& a, const ProcessHandle& b) { return !(a == b); }

struct ProcessExitEvent {
  ProcessHandle process;
  int exit_code = 0;
};

class IHost {
public:
  virtual ~IHost() = default;

  virtual TermSize screen_size() const = 0;

  // content containers
  virtual bool create_content(const std::string& name, ContentHandle& out, std::string& msg) = 0;
  virtual bool content_valid(ContentHandle c) const = 0;
  virtual void destroy_content(ContentHandle c) = 0;
  virtual void set_content_lines(ContentHandle c, const std::vector<std::string>& lines) = 0;

  // windows
  virtual bool open_floating(ContentHandle c, const Rect& r, WindowHandle& out, std::string& msg) = 0;
  virtual bool open_split(ContentHandle c, SplitDirection dir, int size, WindowHandle& out, std::string& msg) = 0;
  virtual bool window_valid(WindowHandle w) const = 0;
  virtual bool window_is_floating(WindowHandle w) const = 0;
  virtual bool close_window(WindowHandle w, std::string& msg) = 0;
  virtual bool focus_window(WindowHandle w) = 0;
  virtual std::optional<WindowHandle> current_window() const = 0;
  virtual bool get_window_rect(WindowHandle w, Rect& out) const = 0;
  virtual bool set_window_rect(WindowHandle w, const Rect& r, std::string& msg) = 0;
  virtual bool set_window_width(WindowHandle w, int width, std::string& msg) = 0;
  virtual bool set_window_height(WindowHandle w, int height, std::string& msg) = 0;

  // tabs; open_tab also creates the tab's single window showing `c`
  virtual bool open_tab(ContentHandle c, TabHandle& tab, WindowHandle& win, std::string& msg) = 0;
  virtual bool tab_valid(TabHandle t) const = 0;
  virtual bool switch_to_tab(TabHandle t) = 0;
  virtual std::vector<TabHandle> list_tabs() const = 0;
  virtual std::optional<TabHandle> current_tab() const = 0;

  // processes: fire-and-forget start, exits are reported through drain_process_exits()
  virtual bool start_process(ContentHandle c, const std::string& command, ProcessHandle& out, std::string& msg) = 0;
  virtual bool send_to_process(ProcessHandle p, std::string_view bytes) = 0;
  virtual std::vector<ProcessExitEvent> drain_process_exits() = 0;
};
