#include "host_model.hpp"
#include <algorithm>

HostModel::HostModel(TermSize size) : size_(size) {
  Tab main;
  main.h = TabHandle{next_tab_id_++, next_generation()};
  tabs_.push_back(main);
  current_tab_ = main.h;
}

void HostModel::set_screen_size(TermSize size) {
  size_ = size;
  for (auto& w : windows_) {
    if (w.kind == PresentationMode::Tab) {
      w.rect = Rect{0, 0, size_.rows, size_.cols};
      on_window_resized(w);
    }
  }
  for (const auto& t : tabs_) relayout(t.h.id);
}

HostModel::Window* HostModel::window_ptr(WindowHandle w) {
  for (auto& x : windows_) if (x.h == w) return &x;
  return nullptr;
}

const HostModel::Window* HostModel::window_ptr(WindowHandle w) const {
  for (const auto& x : windows_) if (x.h == w) return &x;
  return nullptr;
}

HostModel::Content* HostModel::content_ptr(ContentHandle c) {
  for (auto& x : contents_) if (x.h == c) return &x;
  return nullptr;
}

const HostModel::Content* HostModel::content_ptr(ContentHandle c) const {
  for (const auto& x : contents_) if (x.h == c) return &x;
  return nullptr;
}

HostModel::Content* HostModel::content_by_pid(int pid) {
  for (auto& x : contents_) if (x.process && x.process->pid == pid) return &x;
  return nullptr;
}

HostModel::Tab* HostModel::tab_ptr(TabHandle t) {
  for (auto& x : tabs_) if (x.h == t) return &x;
  return nullptr;
}

const HostModel::Tab* HostModel::tab_ptr(TabHandle t) const {
  for (const auto& x : tabs_) if (x.h == t) return &x;
  return nullptr;
}

std::vector<const HostModel::Window*> HostModel::windows_in_tab(int tab_id) const {
  std::vector<const Window*> out;
  for (const auto& w : windows_) if (w.tab_id == tab_id) out.push_back(&w);
  return out;
}

int HostModel::free_window_id() const {
  int id = 1;
  while (std::any_of(windows_.begin(), windows_.end(), [&](const Window& w) { return w.h.id == id; })) ++id;
  return id;
}

void HostModel::relayout(int tab_id) {
  Rect area{0, 0, size_.rows, size_.cols};
  for (auto& w : windows_) {
    if (w.tab_id != tab_id || w.kind != PresentationMode::Split) continue;
    Rect before = w.rect;
    bool horizontal = is_horizontal(w.dir);
    int avail = horizontal ? area.height : area.width;
    int n = std::clamp(w.split_size, 1, std::max(1, avail - 1));
    switch (w.dir) {
      case SplitDirection::Top:
        w.rect = Rect{area.row, area.col, n, area.width};
        area.row += n; area.height -= n;
        break;
      case SplitDirection::Bottom:
        w.rect = Rect{area.row + area.height - n, area.col, n, area.width};
        area.height -= n;
        break;
      case SplitDirection::Left:
        w.rect = Rect{area.row, area.col, area.height, n};
        area.col += n; area.width -= n;
        break;
      case SplitDirection::Right:
        w.rect = Rect{area.row, area.col + area.width - n, area.height, n};
        area.width -= n;
        break;
    }
    if (w.rect != before) on_window_resized(w);
  }
}

bool HostModel::create_content(const std::string& name, ContentHandle& out, std::string& msg) {
  (void)msg;
  Content c;
  c.h = ContentHandle{next_content_id_++, next_generation()};
  c.name = name;
  contents_.push_back(std::move(c));
  out = contents_.back().h;
  return true;
}

bool HostModel::content_valid(ContentHandle c) const { return content_ptr(c) != nullptr; }

void HostModel::destroy_content(ContentHandle c) {
  Content* content = content_ptr(c);
  if (!content) return;
  std::vector<WindowHandle> showing;
  for (const auto& w : windows_) if (w.content == c) showing.push_back(w.h);
  for (const auto& w : showing) remove_window(w);
  if (content->process) {
    // hangup; the exit is reported now because the content can no longer be found by pid
    terminate(content->process->pid);
    exits_.push_back(ProcessExitEvent{*content->process, 129});
  }
  contents_.erase(std::remove_if(contents_.begin(), contents_.end(),
                                 [&](const Content& x) { return x.h == c; }),
                  contents_.end());
}

void HostModel::set_content_lines(ContentHandle c, const std::vector<std::string>& lines) {
  if (Content* content = content_ptr(c)) content->lines = lines;
}

const std::vector<std::string>* HostModel::content_lines(ContentHandle c) const {
  const Content* content = content_ptr(c);
  return content ? &content->lines : nullptr;
}

bool HostModel::open_floating(ContentHandle c, const Rect& r, WindowHandle& out, std::string& msg) {
  if (!content_valid(c)) { msg = "content is gone"; return false; }
  Window w;
  w.h = WindowHandle{free_window_id(), next_generation()};
  w.content = c;
  w.kind = PresentationMode::Floating;
  w.rect = r;
  w.tab_id = current_tab_.id;
  windows_.push_back(w);
  out = w.h;
  current_window_ = w.h;
  return true;
}

bool HostModel::open_split(ContentHandle c, SplitDirection dir, int size, WindowHandle& out, std::string& msg) {
  if (!content_valid(c)) { msg = "content is gone"; return false; }
  Window w;
  w.h = WindowHandle{free_window_id(), next_generation()};
  w.content = c;
  w.kind = PresentationMode::Split;
  w.dir = dir;
  w.split_size = size;
  w.tab_id = current_tab_.id;
  windows_.push_back(w);
  relayout(w.tab_id);
  out = w.h;
  current_window_ = w.h;
  return true;
}

bool HostModel::window_valid(WindowHandle w) const { return window_ptr(w) != nullptr; }

bool HostModel::window_is_floating(WindowHandle w) const {
  const Window* win = window_ptr(w);
  return win && win->kind == PresentationMode::Floating;
}

void HostModel::remove_window(WindowHandle h) {
  const Window* w = window_ptr(h);
  if (!w) return;
  int tab_id = w->tab_id;
  bool tab_window = w->kind == PresentationMode::Tab;
  windows_.erase(std::remove_if(windows_.begin(), windows_.end(),
                                [&](const Window& x) { return x.h == h; }),
                 windows_.end());
  relayout(tab_id);

  if (tab_window) {
    // the tab goes with its window, along with anything opened inside it
    auto it = std::find_if(tabs_.begin(), tabs_.end(), [&](const Tab& t) { return t.h.id == tab_id; });
    if (it != tabs_.end()) {
      bool was_current = it->h == current_tab_;
      std::size_t idx = static_cast<std::size_t>(it - tabs_.begin());
      tabs_.erase(it);
      windows_.erase(std::remove_if(windows_.begin(), windows_.end(),
                                    [&](const Window& x) { return x.tab_id == tab_id; }),
                     windows_.end());
      if (was_current) switch_to_tab(tabs_[idx > 0 ? idx - 1 : 0].h);
    }
  }
  if (current_window_ && !window_valid(*current_window_)) {
    current_window_.reset();
    auto in_tab = windows_in_tab(current_tab_.id);
    if (!in_tab.empty()) current_window_ = in_tab.back()->h;
  }
}

bool HostModel::close_window(WindowHandle w, std::string& msg) {
  if (!window_valid(w)) { msg = "no such window"; return false; }
  remove_window(w);
  return true;
}

bool HostModel::focus_window(WindowHandle w) {
  const Window* win = window_ptr(w);
  if (!win) return false;
  if (win->tab_id != current_tab_.id) {
    for (const auto& t : tabs_) if (t.h.id == win->tab_id) current_tab_ = t.h;
  }
  current_window_ = w;
  return true;
}

bool HostModel::get_window_rect(WindowHandle w, Rect& out) const {
  const Window* win = window_ptr(w);
  if (!win) return false;
  out = win->rect;
  return true;
}

bool HostModel::set_window_rect(WindowHandle w, const Rect& r, std::string& msg) {
  Window* win = window_ptr(w);
  if (!win) { msg = "no such window"; return false; }
  if (win->kind != PresentationMode::Floating) { msg = "only floating windows take a rect"; return false; }
  win->rect = r;
  on_window_resized(*win);
  return true;
}

bool HostModel::set_window_width(WindowHandle w, int width, std::string& msg) {
  Window* win = window_ptr(w);
  if (!win) { msg = "no such window"; return false; }
  if (width < 1) { msg = "width must be positive"; return false; }
  if (win->kind == PresentationMode::Floating) {
    win->rect.width = width;
    on_window_resized(*win);
  } else if (win->kind == PresentationMode::Split && !is_horizontal(win->dir)) {
    win->split_size = width;
    relayout(win->tab_id);
  }
  return true;
}

bool HostModel::set_window_height(WindowHandle w, int height, std::string& msg) {
  Window* win = window_ptr(w);
  if (!win) { msg = "no such window"; return false; }
  if (height < 1) { msg = "height must be positive"; return false; }
  if (win->kind == PresentationMode::Floating) {
    win->rect.height = height;
    on_window_resized(*win);
  } else if (win->kind == PresentationMode::Split && is_horizontal(win->dir)) {
    win->split_size = height;
    relayout(win->tab_id);
  }
  return true;
}

bool HostModel::open_tab(ContentHandle c, TabHandle& tab, WindowHandle& win, std::string& msg) {
  if (!content_valid(c)) { msg = "content is gone"; return false; }
  Tab t;
  t.h = TabHandle{next_tab_id_++, next_generation()};
  Window w;
  w.h = WindowHandle{free_window_id(), next_generation()};
  w.content = c;
  w.kind = PresentationMode::Tab;
  w.rect = Rect{0, 0, size_.rows, size_.cols};
  w.tab_id = t.h.id;
  t.window = w.h;
  tabs_.push_back(t);
  windows_.push_back(w);
  on_window_resized(w);
  current_tab_ = t.h;
  current_window_ = w.h;
  tab = t.h;
  win = w.h;
  return true;
}

bool HostModel::tab_valid(TabHandle t) const { return tab_ptr(t) != nullptr; }

bool HostModel::switch_to_tab(TabHandle t) {
  const Tab* tab = tab_ptr(t);
  if (!tab) return false;
  current_tab_ = t;
  current_window_.reset();
  if (tab->window) {
    current_window_ = tab->window;
  } else {
    auto in_tab = windows_in_tab(t.id);
    if (!in_tab.empty()) current_window_ = in_tab.back()->h;
  }
  return true;
}

std::vector<TabHandle> HostModel::list_tabs() const {
  std::vector<TabHandle> out;
  for (const auto& t : tabs_) out.push_back(t.h);
  return out;
}

bool HostModel::start_process(ContentHandle c, const std::string& command, ProcessHandle& out, std::string& msg) {
  Content* content = content_ptr(c);
  if (!content) { msg = "content is gone"; return false; }
  if (content->process) { msg = "content already runs a process"; return false; }
  int pid = 0;
  if (!launch(*content, command, pid, msg)) return false;
  content->process = ProcessHandle{pid, next_generation()};
  content->ran_process = true;
  out = *content->process;
  return true;
}

bool HostModel::send_to_process(ProcessHandle p, std::string_view bytes) {
  for (const auto& c : contents_) {
    if (c.process && *c.process == p) return deliver(p.pid, bytes);
  }
  return false;
}

void HostModel::report_exit(int pid, int exit_code) {
  Content* c = content_by_pid(pid);
  if (!c) return;
  exits_.push_back(ProcessExitEvent{*c->process, exit_code});
  c->process.reset();
}

std::vector<ProcessExitEvent> HostModel::drain_process_exits() {
  std::vector<ProcessExitEvent> out;
  out.swap(exits_);
  return out;
}
