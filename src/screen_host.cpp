#include "screen_host.hpp"

ScreenHost::ScreenHost(ITerminal& term) : HostModel(usable(term.get_size())), term_(term) {}

void ScreenHost::sync_size() {
  TermSize t = usable(term_.get_size());
  if (t.rows != size_.rows || t.cols != size_.cols) set_screen_size(t);
}

bool ScreenHost::launch(Content& c, const std::string& command, int& pid, std::string& msg) {
  auto proc = std::make_unique<PtyProcess>();
  if (!proc->spawn(command, size_, msg)) return false;
  pid = proc->pid();
  c.lines.clear();
  ptys_[pid] = std::move(proc);
  return true;
}

bool ScreenHost::deliver(int pid, std::string_view bytes) {
  auto it = ptys_.find(pid);
  return it != ptys_.end() && it->second->write_all(bytes);
}

void ScreenHost::terminate(int pid) {
  auto it = ptys_.find(pid);
  if (it == ptys_.end()) return;
  it->second->hangup();
  dying_.push_back(std::move(it->second));
  ptys_.erase(it);
}

void ScreenHost::on_window_resized(const Window& w) {
  const Content* c = content_ptr(w.content);
  if (!c || !c->process) return;
  auto it = ptys_.find(c->process->pid);
  if (it == ptys_.end()) return;
  if (w.kind == PresentationMode::Floating) {
    it->second->resize(TermSize{w.rect.height - 2, w.rect.width - 2});
  } else {
    it->second->resize(TermSize{w.rect.height - 1, w.rect.width});
  }
}

bool ScreenHost::pump() {
  bool changed = false;
  for (auto it = ptys_.begin(); it != ptys_.end();) {
    int pid = it->first;
    if (Content* c = content_by_pid(pid)) {
      if (it->second->pump(c->lines, kScrollback) > 0) changed = true;
    }
    int code = 0;
    if (it->second->reap(code)) {
      report_exit(pid, code);
      it = ptys_.erase(it);
      changed = true;
      continue;
    }
    ++it;
  }
  dying_.erase(std::remove_if(dying_.begin(), dying_.end(),
                              [](const std::unique_ptr<PtyProcess>& p) { int code = 0; return p->reap(code); }),
               dying_.end());
  return changed;
}

std::vector<int> ScreenHost::poll_fds() const {
  std::vector<int> fds;
  for (const auto& [pid, proc] : ptys_) if (proc->fd() >= 0) fds.push_back(proc->fd());
  return fds;
}

bool ScreenHost::forward_to_focused(std::string_view bytes) {
  if (!current_window_) return false;
  const Window* w = window_ptr(*current_window_);
  if (!w) return false;
  const Content* c = content_ptr(w->content);
  if (!c || !c->process) return false;
  return deliver(c->process->pid, bytes);
}

void ScreenHost::render(Renderer& r, const std::string& message, const std::string& cmdline, bool command_mode) {
  std::vector<WindowRenderInfo> infos;
  std::vector<WindowRenderInfo> floats;
  for (const Window* w : windows_in_tab(current_tab_.id)) {
    WindowRenderInfo info;
    const Content* c = content_ptr(w->content);
    if (c) {
      info.lines = &c->lines;
      info.title = c->name;
      info.follow_tail = c->ran_process;
    }
    info.area = w->rect;
    info.floating = w->kind == PresentationMode::Floating;
    info.focused = current_window_ && *current_window_ == w->h;
    if (info.floating) floats.push_back(info); else infos.push_back(info);
  }
  infos.insert(infos.end(), floats.begin(), floats.end());
  r.render(term_, infos, message, cmdline, command_mode);
}
