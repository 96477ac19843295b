#pragma once
/*
 * HostModel
 *
 * Purpose: in-memory bookkeeping of tabs, windows and content containers
 * shared by HeadlessHost and ScreenHost.
 * Layout: tab 1 is the main tab. Floating and split windows belong to the tab
 * that was current when they opened; splits carve the tab's area from its
 * edges in creation order, floats sit on top.
 * Extend: subclasses supply real or simulated processes via launch/deliver/terminate.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "host.hpp"

class HostModel : public IHost {
public:
  explicit HostModel(TermSize size);

  TermSize screen_size() const override { return size_; }
  void set_screen_size(TermSize size);

  bool create_content(const std::string& name, ContentHandle& out, std::string& msg) override;
  bool content_valid(ContentHandle c) const override;
  void destroy_content(ContentHandle c) override;
  void set_content_lines(ContentHandle c, const std::vector<std::string>& lines) override;

  bool open_floating(ContentHandle c, const Rect& r, WindowHandle& out, std::string& msg) override;
  bool open_split(ContentHandle c, SplitDirection dir, int size, WindowHandle& out, std::string& msg) override;
  bool window_valid(WindowHandle w) const override;
  bool window_is_floating(WindowHandle w) const override;
  bool close_window(WindowHandle w, std::string& msg) override;
  bool focus_window(WindowHandle w) override;
  std::optional<WindowHandle> current_window() const override { return current_window_; }
  bool get_window_rect(WindowHandle w, Rect& out) const override;
  bool set_window_rect(WindowHandle w, const Rect& r, std::string& msg) override;
  bool set_window_width(WindowHandle w, int width, std::string& msg) override;
  bool set_window_height(WindowHandle w, int height, std::string& msg) override;

  bool open_tab(ContentHandle c, TabHandle& tab, WindowHandle& win, std::string& msg) override;
  bool tab_valid(TabHandle t) const override;
  bool switch_to_tab(TabHandle t) override;
  std::vector<TabHandle> list_tabs() const override;
  std::optional<TabHandle> current_tab() const override { return current_tab_; }

  bool start_process(ContentHandle c, const std::string& command, ProcessHandle& out, std::string& msg) override;
  bool send_to_process(ProcessHandle p, std::string_view bytes) override;
  std::vector<ProcessExitEvent> drain_process_exits() override;

  TabHandle main_tab() const { return tabs_.front().h; }
  std::size_t window_count() const { return windows_.size(); }
  std::size_t content_count() const { return contents_.size(); }
  std::size_t tab_count() const { return tabs_.size(); }
  const std::vector<std::string>* content_lines(ContentHandle c) const;

protected:
  struct Window {
    WindowHandle h;
    ContentHandle content;
    PresentationMode kind = PresentationMode::Floating;
    Rect rect{};
    SplitDirection dir = SplitDirection::Bottom;
    int split_size = 0;
    int tab_id = 0;
  };
  struct Tab {
    TabHandle h;
    std::optional<WindowHandle> window;  // the window of a dedicated tab
  };
  struct Content {
    ContentHandle h;
    std::string name;
    std::vector<std::string> lines;
    std::optional<ProcessHandle> process;
    bool ran_process = false;
  };

  // process backend
  virtual bool launch(Content& c, const std::string& command, int& pid, std::string& msg) = 0;
  virtual bool deliver(int pid, std::string_view bytes) = 0;
  virtual void terminate(int pid) = 0;
  virtual void on_window_resized(const Window&) {}

  // subclasses report exits here (generation taken from the owning content)
  void report_exit(int pid, int exit_code);

  Window* window_ptr(WindowHandle w);
  const Window* window_ptr(WindowHandle w) const;
  Content* content_ptr(ContentHandle c);
  const Content* content_ptr(ContentHandle c) const;
  Content* content_by_pid(int pid);
  Tab* tab_ptr(TabHandle t);
  const Tab* tab_ptr(TabHandle t) const;
  // windows of one tab, in creation order
  std::vector<const Window*> windows_in_tab(int tab_id) const;
  void relayout(int tab_id);

  TermSize size_;
  std::vector<Window> windows_;
  std::vector<Tab> tabs_;
  std::vector<Content> contents_;
  TabHandle current_tab_;
  std::optional<WindowHandle> current_window_;
  std::vector<ProcessExitEvent> exits_;

private:
  int free_window_id() const;
  void remove_window(WindowHandle w);
  std::uint64_t next_generation() { return ++generation_; }

  std::uint64_t generation_ = 0;
  int next_tab_id_ = 1;
  int next_content_id_ = 1;
};
