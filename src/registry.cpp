#include "registry.hpp"
#include <algorithm>

static Status not_found(const std::string& name) {
  return Status::error(ErrorCode::SurfaceNotFound, "no surface named '" + name + "'");
}

static Status with_context(Status st, const std::string& name, const char* op) {
  st.context(op);
  st.context(name);
  return st;
}

Registry::Registry(IHost& host, SessionProviderRegistry& sessions, Settings settings)
  : host_(host), sessions_(sessions), settings_(std::move(settings)) {}

Surface* Registry::define(const SurfaceSpec& spec, Status& st) {
  SurfaceSpec s = spec;
  if (s.name.empty()) {
    if (!s.cmd || s.cmd->empty()) {
      st = Status::error(ErrorCode::ConfigurationError, "'name' or 'cmd' is required");
      return nullptr;
    }
    s.name = *s.cmd;
  }
  if (auto it = by_name_.find(s.name); it != by_name_.end()) {
    Surface* existing = order_[it->second].get();
    existing->refresh_hooks(s);
    st = Status::ok();
    return existing;
  }
  std::string name = s.name;
  order_.push_back(std::make_unique<Surface>(std::move(s)));
  by_name_[name] = order_.size() - 1;
  st = Status::ok();
  return order_.back().get();
}

Surface* Registry::find(const std::string& name) {
  auto it = by_name_.find(name);
  return it == by_name_.end() ? nullptr : order_[it->second].get();
}

const Surface* Registry::find(const std::string& name) const {
  auto it = by_name_.find(name);
  return it == by_name_.end() ? nullptr : order_[it->second].get();
}

Surface* Registry::find_by_window(WindowHandle w) {
  auto it = by_window_.find(w);
  return it == by_window_.end() ? nullptr : it->second;
}

Surface* Registry::focused_surface() {
  auto w = host_.current_window();
  if (!w) return nullptr;
  return find_by_window(*w);
}

std::optional<std::string> Registry::cursor_name() const {
  if (!cursor_ || *cursor_ >= order_.size()) return std::nullopt;
  return order_[*cursor_]->name();
}

void Registry::bind_window(WindowHandle w, Surface& s) { by_window_[w] = &s; }

void Registry::unbind_window(WindowHandle w) { by_window_.erase(w); }

void Registry::set_cursor(const std::string& name) {
  auto it = by_name_.find(name);
  if (it != by_name_.end()) cursor_ = it->second;
}

void Registry::clear_cursor_if(const std::string& name) {
  auto it = by_name_.find(name);
  if (it != by_name_.end() && cursor_ && *cursor_ == it->second) {
    last_hidden_ = cursor_;
    cursor_.reset();
  }
}

void Registry::prune_stale_windows() {
  for (auto& s : order_) s->forget_stale_handles(*this);
}

Status Registry::show(Surface& s) {
  PresentationConfig cfg = s.last_config();
  Status st = s.open(cfg, *this);
  if (st) s.run_setup(*this);
  return st;
}

Status Registry::open(const SurfaceSpec& spec, const WinOpts& opts) {
  prune_stale_windows();
  Status st;
  Surface* s = define(spec, st);
  if (!s) return st.context("open");
  PresentationConfig cfg;
  if (Status cst = resolve_presentation(opts, settings_.lenient_position, cfg); !cst) {
    return with_context(cst, s->name(), "open");
  }
  st = s->open(cfg, *this);
  if (st) s->run_setup(*this);
  return with_context(st, s->name(), "open");
}

Status Registry::open(const std::string& name, const PresentationConfig& cfg) {
  prune_stale_windows();
  Surface* s = find(name);
  if (!s) return with_context(not_found(name), name, "open");
  Status st = s->open(cfg, *this);
  if (st) s->run_setup(*this);
  return with_context(st, name, "open");
}

Status Registry::toggle(const SurfaceSpec& spec, const WinOpts* opts) {
  prune_stale_windows();
  Status st;
  Surface* s = define(spec, st);
  if (!s) return st.context("toggle");
  if (!opts) return with_context(s->hide(*this), s->name(), "toggle");
  PresentationConfig cfg;
  if (Status cst = resolve_presentation(*opts, settings_.lenient_position, cfg); !cst) {
    return with_context(cst, s->name(), "toggle");
  }
  st = s->toggle(&cfg, *this);
  if (st) s->run_setup(*this);
  return with_context(st, s->name(), "toggle");
}

Status Registry::toggle(const std::string& name, const PresentationConfig* cfg) {
  prune_stale_windows();
  Surface* s = find(name);
  if (!s) return with_context(not_found(name), name, "toggle");
  Status st = s->toggle(cfg, *this);
  if (st && cfg) s->run_setup(*this);
  return with_context(st, name, "toggle");
}

Status Registry::hide(const std::string& name) {
  prune_stale_windows();
  Surface* s = find(name);
  if (!s) return with_context(not_found(name), name, "hide");
  return with_context(s->hide(*this), name, "hide");
}

Status Registry::resize(const std::string& name, const ResizeOpts& opts) {
  prune_stale_windows();
  Surface* s = find(name);
  if (!s) return with_context(not_found(name), name, "resize");
  return with_context(resize_window(*s, *this, opts), name, "resize");
}

Status Registry::reposition(const std::string& name, const RepositionOpts& opts) {
  prune_stale_windows();
  Surface* s = find(name);
  if (!s) return with_context(not_found(name), name, "reposition");
  return with_context(reposition_window(*s, *this, opts), name, "reposition");
}

std::vector<std::size_t> Registry::navigable() const {
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < order_.size(); ++i) {
    if (order_[i]->has_live_content(host_)) out.push_back(i);
  }
  return out;
}

Status Registry::cycle(int step) {
  prune_stale_windows();
  const char* op = step > 0 ? "next" : "prev";
  std::vector<std::size_t> valid = navigable();
  if (valid.empty()) return Status::error(ErrorCode::SurfaceNotFound, std::string(op) + ": no surfaces available");

  std::optional<std::size_t> pos;
  if (cursor_) {
    auto it = std::find(valid.begin(), valid.end(), *cursor_);
    if (it != valid.end()) pos = static_cast<std::size_t>(it - valid.begin());
  }

  std::size_t target = 0;
  const std::size_t n = valid.size();
  if (pos) {
    Surface& cur = *order_[valid[*pos]];
    if (cur.is_open(host_)) {
      if (Status st = cur.hide(*this); !st) return with_context(st, cur.name(), op);
    }
    target = step > 0 ? (*pos + 1) % n : (*pos + n - 1) % n;
  } else {
    target = step > 0 ? 0 : n - 1;
  }
  Surface& next = *order_[valid[target]];
  cursor_ = valid[target];
  return with_context(show(next), next.name(), op);
}

Status Registry::next() { return cycle(1); }
Status Registry::prev() { return cycle(-1); }

Status Registry::goto_surface(const std::string& name) {
  prune_stale_windows();
  Surface* s = find(name);
  if (!s) return with_context(not_found(name), name, "goto");
  if (!s->has_live_content(host_)) {
    return with_context(Status::error(ErrorCode::SurfaceNotFound, "content is no longer valid"), name, "goto");
  }
  set_cursor(name);
  PresentationConfig cfg = s->last_config();
  Status st = s->toggle(&cfg, *this);
  if (st) s->run_setup(*this);
  return with_context(st, name, "goto");
}

Status Registry::toggle_current() {
  prune_stale_windows();
  // after a hide the cursor is gone; fall back to the surface it pointed at
  std::optional<std::size_t> idx = cursor_ ? cursor_ : last_hidden_;
  Surface* s = idx && *idx < order_.size() ? order_[*idx].get() : nullptr;
  if (!s || !s->has_live_content(host_)) {
    return Status::error(ErrorCode::SurfaceNotFound, "toggle: no current surface");
  }
  if (s->is_open(host_)) return with_context(s->hide(*this), s->name(), "toggle");
  return with_context(show(*s), s->name(), "toggle");
}

Status Registry::hide_current() {
  prune_stale_windows();
  Surface* s = focused_surface();
  if (!s) return Status::error(ErrorCode::SurfaceNotFound, "hide: focused window is not a surface");
  return with_context(s->hide(*this), s->name(), "hide");
}

Status Registry::resize_current(const ResizeOpts& opts) {
  prune_stale_windows();
  Surface* s = focused_surface();
  if (!s) return Status::error(ErrorCode::SurfaceNotFound, "resize: focused window is not a surface");
  return with_context(resize_window(*s, *this, opts), s->name(), "resize");
}

Status Registry::reposition_current(const RepositionOpts& opts) {
  prune_stale_windows();
  Surface* s = focused_surface();
  if (!s) return Status::error(ErrorCode::SurfaceNotFound, "reposition: focused window is not a surface");
  return with_context(reposition_window(*s, *this, opts), s->name(), "reposition");
}

Status Registry::kill(const std::string& name) {
  prune_stale_windows();
  Surface* s = find(name);
  if (!s) return with_context(not_found(name), name, "kill");
  if (Status st = s->destroy(*this); !st) return with_context(st, name, "kill");
  const auto& session = s->spec().session;
  if (!session) return Status::ok();
  ISessionProvider* provider = sessions_.find(*session);
  if (!provider) return Status::ok();
  return with_context(provider->kill_session(session_id_for(settings_.session_prefix, name)), name, "kill");
}

Status Registry::send(const std::string& name, const std::string& bytes, Clock::time_point now) {
  Surface* s = find(name);
  if (!s) return with_context(not_found(name), name, "send");
  if (!s->process()) {
    return with_context(Status::error(ErrorCode::ConfigurationError, "surface has no running process"), name, "send");
  }
  ProcessHandle target = *s->process();
  for (auto& p : pending_) {
    if (p.surface != name) continue;
    if (p.target != target) { p.target = target; p.payload.clear(); p.last_chunk.clear(); }
    // one pending send per surface; repeating the last queued chunk is a no-op
    if (bytes == p.last_chunk) return Status::ok();
    p.payload += bytes;
    p.last_chunk = bytes;
    return Status::ok();
  }
  int delay = s->spec().send_delay_ms.value_or(settings_.send_delay_ms);
  pending_.push_back(PendingSend{name, target, bytes, bytes, now + std::chrono::milliseconds(std::max(0, delay))});
  return Status::ok();
}

void Registry::cancel_sends(const std::string& name) {
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [&](const PendingSend& p) { return p.surface == name; }),
                 pending_.end());
}

void Registry::run_due_sends(Clock::time_point now) {
  std::vector<PendingSend> due;
  auto split = std::stable_partition(pending_.begin(), pending_.end(),
                                     [&](const PendingSend& p) { return p.due > now; });
  due.assign(std::make_move_iterator(split), std::make_move_iterator(pending_.end()));
  pending_.erase(split, pending_.end());
  for (const auto& p : due) {
    const Surface* s = find(p.surface);
    if (!s || !s->process() || *s->process() != p.target) {
      notify(p.surface + ": process gone, dropped pending input");
      continue;
    }
    if (!host_.send_to_process(p.target, p.payload)) notify(p.surface + ": send failed");
  }
}

std::optional<Registry::Clock::time_point> Registry::next_send_due() const {
  std::optional<Clock::time_point> best;
  for (const auto& p : pending_) if (!best || p.due < *best) best = p.due;
  return best;
}

void Registry::handle_process_exit(const ProcessExitEvent& ev) {
  for (auto& s : order_) {
    if (!s->process() || *s->process() != ev.process) continue;
    s->on_process_exit(ev, *this);
    if (ev.exit_code != 0) notify(s->name() + ": process exited with code " + std::to_string(ev.exit_code));
    return;
  }
}

void Registry::pump_host_events() {
  for (const auto& ev : host_.drain_process_exits()) handle_process_exit(ev);
}

std::vector<SurfaceInfo> Registry::list() const {
  std::vector<SurfaceInfo> out;
  for (std::size_t i = 0; i < order_.size(); ++i) {
    const Surface& s = *order_[i];
    SurfaceInfo info;
    info.name = s.name();
    info.mode = s.mode();
    info.window = s.window();
    info.process = s.process();
    info.command = s.backing_command() ? s.backing_command() : s.spec().cmd;
    info.is_open = s.is_open(host_);
    info.has_content = s.has_live_content(host_);
    info.is_current = cursor_ && *cursor_ == i;
    out.push_back(std::move(info));
  }
  return out;
}

bool Registry::check_consistency(std::string& msg) const {
  for (const auto& [w, s] : by_window_) {
    if (!s->window() || *s->window() != w) {
      msg = "window " + std::to_string(w.id) + " maps to '" + s->name() + "' which does not hold it";
      return false;
    }
  }
  std::size_t held = 0;
  for (const auto& s : order_) {
    if (s->tab() && s->mode() != PresentationMode::Tab) {
      msg = "'" + s->name() + "' holds a tab outside tab mode";
      return false;
    }
    if (!s->window()) continue;
    ++held;
    auto it = by_window_.find(*s->window());
    if (it == by_window_.end() || it->second != s.get()) {
      msg = "'" + s->name() + "' holds window " + std::to_string(s->window()->id) + " missing from the index";
      return false;
    }
    if (!host_.window_valid(*s->window())) {
      msg = "'" + s->name() + "' holds closed window " + std::to_string(s->window()->id);
      return false;
    }
  }
  if (held != by_window_.size()) {
    msg = "window index has " + std::to_string(by_window_.size()) + " entries for " + std::to_string(held) + " windows";
    return false;
  }
  return true;
}
