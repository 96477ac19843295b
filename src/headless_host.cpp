#include "headless_host.hpp"

HeadlessHost::HeadlessHost(TermSize size) : HostModel(size) {}

void HeadlessHost::fail_next(HostCall call, std::string msg) { faults_[call] = std::move(msg); }

bool HeadlessHost::take_fault(HostCall call, std::string& msg) {
  auto it = faults_.find(call);
  if (it == faults_.end()) return false;
  msg = it->second;
  faults_.erase(it);
  return true;
}

bool HeadlessHost::create_content(const std::string& name, ContentHandle& out, std::string& msg) {
  calls_.push_back("create_content " + name);
  if (take_fault(HostCall::CreateContent, msg)) return false;
  return HostModel::create_content(name, out, msg);
}

bool HeadlessHost::open_floating(ContentHandle c, const Rect& r, WindowHandle& out, std::string& msg) {
  calls_.push_back("open_floating " + std::to_string(r.width) + "x" + std::to_string(r.height) +
                   "+" + std::to_string(r.row) + "+" + std::to_string(r.col));
  if (take_fault(HostCall::OpenWindow, msg)) return false;
  return HostModel::open_floating(c, r, out, msg);
}

bool HeadlessHost::open_split(ContentHandle c, SplitDirection dir, int size, WindowHandle& out, std::string& msg) {
  calls_.push_back("open_split " + std::string(direction_name(dir)) + " " + std::to_string(size));
  if (take_fault(HostCall::OpenWindow, msg)) return false;
  return HostModel::open_split(c, dir, size, out, msg);
}

bool HeadlessHost::close_window(WindowHandle w, std::string& msg) {
  calls_.push_back("close_window " + std::to_string(w.id));
  if (take_fault(HostCall::CloseWindow, msg)) return false;
  return HostModel::close_window(w, msg);
}

bool HeadlessHost::open_tab(ContentHandle c, TabHandle& tab, WindowHandle& win, std::string& msg) {
  calls_.push_back("open_tab");
  if (take_fault(HostCall::OpenTab, msg)) return false;
  return HostModel::open_tab(c, tab, win, msg);
}

bool HeadlessHost::start_process(ContentHandle c, const std::string& command, ProcessHandle& out, std::string& msg) {
  calls_.push_back("start_process " + command);
  if (take_fault(HostCall::StartProcess, msg)) return false;
  return HostModel::start_process(c, command, out, msg);
}

bool HeadlessHost::set_window_width(WindowHandle w, int width, std::string& msg) {
  calls_.push_back("set_window_width " + std::to_string(width));
  if (take_fault(HostCall::SetWidth, msg)) return false;
  return HostModel::set_window_width(w, width, msg);
}

bool HeadlessHost::set_window_height(WindowHandle w, int height, std::string& msg) {
  calls_.push_back("set_window_height " + std::to_string(height));
  if (take_fault(HostCall::SetHeight, msg)) return false;
  return HostModel::set_window_height(w, height, msg);
}

bool HeadlessHost::launch(Content& c, const std::string& command, int& pid, std::string& msg) {
  (void)c;
  if (command.empty()) { msg = "empty command"; return false; }
  pid = next_pid_++;
  procs_[pid] = SimProcess{command, {}, true};
  return true;
}

bool HeadlessHost::deliver(int pid, std::string_view bytes) {
  auto it = procs_.find(pid);
  if (it == procs_.end() || !it->second.alive) return false;
  it->second.received.append(bytes);
  calls_.push_back("send " + std::to_string(pid));
  return true;
}

void HeadlessHost::terminate(int pid) {
  auto it = procs_.find(pid);
  if (it != procs_.end()) it->second.alive = false;
}

bool HeadlessHost::close_window_externally(WindowHandle w) {
  std::string msg;
  return HostModel::close_window(w, msg);
}

bool HeadlessHost::close_tab_externally(TabHandle t) {
  const Tab* tab = tab_ptr(t);
  if (!tab || !tab->window) return false;
  std::string msg;
  return HostModel::close_window(*tab->window, msg);
}

bool HeadlessHost::simulate_exit(ProcessHandle p, int exit_code) {
  Content* c = content_by_pid(p.pid);
  if (!c || *c->process != p) return false;
  auto it = procs_.find(p.pid);
  if (it != procs_.end()) it->second.alive = false;
  report_exit(p.pid, exit_code);
  return true;
}

int HeadlessHost::call_count(const std::string& prefix) const {
  int n = 0;
  for (const auto& c : calls_) if (c.compare(0, prefix.size(), prefix) == 0) ++n;
  return n;
}

std::string HeadlessHost::sent_to(ProcessHandle p) const {
  auto it = procs_.find(p.pid);
  return it == procs_.end() ? std::string() : it->second.received;
}

std::optional<std::string> HeadlessHost::command_of(ProcessHandle p) const {
  auto it = procs_.find(p.pid);
  if (it == procs_.end()) return std::nullopt;
  return it->second.command;
}

std::size_t HeadlessHost::running_processes() const {
  std::size_t n = 0;
  for (const auto& [pid, proc] : procs_) if (proc.alive) ++n;
  return n;
}

std::optional<Rect> HeadlessHost::rect_of(WindowHandle w) const {
  Rect r;
  if (!get_window_rect(w, r)) return std::nullopt;
  return r;
}
