#include "surface.hpp"
#include "geometry.hpp"
#include "registry.hpp"
#include "session_provider.hpp"

static Status host_failed(const std::string& what, const std::string& msg) {
  return Status::error(ErrorCode::HostOperationFailed, msg.empty() ? what : what + ": " + msg);
}

Surface::Surface(SurfaceSpec spec) : name_(spec.name), spec_(std::move(spec)) {}

void Surface::refresh_hooks(const SurfaceSpec& spec) {
  if (spec.setup) spec_.setup = spec.setup;
  if (spec.send_delay_ms) spec_.send_delay_ms = spec.send_delay_ms;
}

bool Surface::is_open(const IHost& host) const {
  if (mode_ == PresentationMode::Tab) return tab_ && host.tab_valid(*tab_);
  return window_ && host.window_valid(*window_);
}

bool Surface::has_live_content(const IHost& host) const {
  return content_ && host.content_valid(*content_);
}

Status Surface::reentrant(const char* op) const {
  return Status::error(ErrorCode::ReentrantOperation, std::string(op) + " while another operation on this surface is running");
}

void Surface::set_window(std::optional<WindowHandle> w, Registry& reg) {
  if (window_) reg.unbind_window(*window_);
  window_ = w;
  if (window_) reg.bind_window(*window_, *this);
}

void Surface::forget_stale_handles(Registry& reg) {
  IHost& host = reg.host();
  if (window_ && !host.window_valid(*window_)) set_window(std::nullopt, reg);
  if (tab_ && !host.tab_valid(*tab_)) tab_.reset();
  if (content_ && !host.content_valid(*content_)) {
    content_.reset();
    process_.reset();
  }
}

Status Surface::plan_window(const PresentationConfig& cfg, const IHost& host, WindowPlan& plan) const {
  TermSize sz = host.screen_size();
  plan.mode = mode_of(cfg);
  if (const auto* f = std::get_if<FloatingConfig>(&cfg)) {
    return compute_floating(*f, sz.cols, sz.rows, plan.rect);
  }
  if (const auto* s = std::get_if<SplitConfig>(&cfg)) {
    SplitGeometry g;
    if (Status st = compute_split(s->direction, s->size, sz.cols, sz.rows, g); !st) return st;
    plan.direction = s->direction;
    plan.split_size = g.absolute_size;
  }
  return Status::ok();
}

Status Surface::create_window(const WindowPlan& plan, const PresentationConfig& cfg, Registry& reg) {
  IHost& host = reg.host();
  std::string m;
  WindowHandle w;
  switch (plan.mode) {
    case PresentationMode::Floating:
      if (!host.open_floating(*content_, plan.rect, w, m)) return host_failed("open floating window", m);
      break;
    case PresentationMode::Split:
      if (!host.open_split(*content_, plan.direction, plan.split_size, w, m)) return host_failed("open split", m);
      break;
    case PresentationMode::Tab: {
      TabHandle t;
      if (!host.open_tab(*content_, t, w, m)) return host_failed("open tab", m);
      tab_ = t;
    } break;
  }
  if (plan.mode != PresentationMode::Tab) tab_.reset();
  mode_ = plan.mode;
  last_config_ = cfg;
  set_window(w, reg);
  host.focus_window(w);
  reg.set_cursor(name_);
  return Status::ok();
}

Status Surface::resolve_command(Registry& reg, std::string& out) const {
  const std::string& cmd = *spec_.cmd;
  if (!spec_.session) { out = cmd; return Status::ok(); }
  ISessionProvider* provider = reg.sessions().find(*spec_.session);
  if (!provider) {
    return Status::error(ErrorCode::ConfigurationError, "unknown session provider '" + *spec_.session + "'");
  }
  std::string id = session_id_for(reg.settings().session_prefix, name_);
  Status st = provider->create_or_attach(id, cmd, out);
  if (!st && st.code == ErrorCode::SessionBackendUnavailable && reg.settings().session_fallback) {
    reg.notify(name_ + ": " + st.msg + ", running command without a session");
    out = cmd;
    return Status::ok();
  }
  return st;
}

Status Surface::cold_start(const PresentationConfig& cfg, Registry& reg) {
  IHost& host = reg.host();
  // everything that can fail without host side effects goes first
  WindowPlan plan;
  if (Status st = plan_window(cfg, host, plan); !st) return st;
  std::string resolved;
  if (is_process_backed()) {
    if (Status st = resolve_command(reg, resolved); !st) return st;
  }

  std::string m;
  ContentHandle c;
  if (!host.create_content(name_, c, m)) return host_failed("create content", m);
  content_ = c;

  if (Status st = create_window(plan, cfg, reg); !st) {
    host.destroy_content(c);
    content_.reset();
    return st;
  }

  if (is_process_backed()) {
    ProcessHandle p;
    if (!host.start_process(c, resolved, p, m)) {
      std::string close_msg;
      if (window_ && !host.close_window(*window_, close_msg)) reg.notify(name_ + ": close window: " + close_msg);
      set_window(std::nullopt, reg);
      tab_.reset();
      reg.clear_cursor_if(name_);
      host.destroy_content(c);
      content_.reset();
      return host_failed("start process", m);
    }
    process_ = p;
    backing_command_ = resolved;
    last_exit_code_.reset();
  } else if (!spec_.lines.empty()) {
    host.set_content_lines(c, spec_.lines);
  }

  if (spec_.init) spec_.init(*this, reg);
  return Status::ok();
}

Status Surface::focus_existing(Registry& reg) {
  IHost& host = reg.host();
  if (mode_ == PresentationMode::Tab && tab_) {
    if (!host.switch_to_tab(*tab_)) return host_failed("switch to tab", "");
  }
  if (window_ && host.window_valid(*window_)) host.focus_window(*window_);
  reg.set_cursor(name_);
  return Status::ok();
}

Status Surface::open(const PresentationConfig& cfg, Registry& reg) {
  if (busy_) return reentrant("open");
  BusyScope guard(*this);
  IHost& host = reg.host();

  if (is_open(host)) return focus_existing(reg);
  forget_stale_handles(reg);

  // a process-backed surface whose process is gone restarts from scratch
  bool stale = is_process_backed() && !process_;
  if (has_live_content(host) && !stale) {
    WindowPlan plan;
    if (Status st = plan_window(cfg, host, plan); !st) return st;
    return create_window(plan, cfg, reg);
  }
  if (content_) release_content(reg);
  return cold_start(cfg, reg);
}

Status Surface::toggle(const PresentationConfig* cfg, Registry& reg) {
  if (!cfg) return hide(reg);
  if (busy_) return reentrant("toggle");
  IHost& host = reg.host();
  if (!is_open(host)) return open(*cfg, reg);

  BusyScope guard(*this);
  const auto* f = std::get_if<FloatingConfig>(cfg);
  if (mode_ == PresentationMode::Floating && f) {
    TermSize sz = host.screen_size();
    Rect r;
    if (Status st = compute_floating(*f, sz.cols, sz.rows, r); !st) return st;
    std::string m;
    if (!host.set_window_rect(*window_, r, m)) return host_failed("update floating window", m);
    last_config_ = *cfg;
  }
  return focus_existing(reg);
}

Status Surface::hide(Registry& reg) {
  if (busy_) return reentrant("hide");
  BusyScope guard(*this);
  IHost& host = reg.host();

  if (mode_ == PresentationMode::Tab && tab_ && host.tab_valid(*tab_)) {
    auto cur = host.current_tab();
    if (cur && *cur == *tab_) {
      std::vector<TabHandle> tabs = host.list_tabs();
      for (size_t i = 0; i < tabs.size(); ++i) {
        if (tabs[i] != *tab_) continue;
        if (i > 0) host.switch_to_tab(tabs[i - 1]);
        else if (tabs.size() > 1) host.switch_to_tab(tabs[1]);
        break;
      }
    }
    reg.clear_cursor_if(name_);
    return Status::ok();
  }

  if (!(window_ && host.window_valid(*window_))) {
    forget_stale_handles(reg);
    return Status::ok();
  }
  std::string m;
  if (!host.close_window(*window_, m)) return host_failed("close window", m);
  set_window(std::nullopt, reg);
  reg.clear_cursor_if(name_);
  if (spec_.ephemeral) release_content(reg);
  return Status::ok();
}

Status Surface::destroy(Registry& reg) {
  if (busy_) return reentrant("kill");
  BusyScope guard(*this);
  IHost& host = reg.host();
  if (window_ && host.window_valid(*window_)) {
    std::string m;
    if (!host.close_window(*window_, m)) return host_failed("close window", m);
  }
  set_window(std::nullopt, reg);
  tab_.reset();
  reg.clear_cursor_if(name_);
  release_content(reg);
  return Status::ok();
}

Status Surface::replace_split(const SplitConfig& cfg, Registry& reg) {
  if (busy_) return reentrant("reposition");
  BusyScope guard(*this);
  IHost& host = reg.host();
  if (!window_ || !content_) return Status::ok();

  WindowPlan plan;
  if (Status st = plan_window(cfg, host, plan); !st) return st;
  std::string m;
  if (!host.close_window(*window_, m)) return host_failed("close split", m);
  set_window(std::nullopt, reg);
  if (Status st = create_window(plan, cfg, reg); !st) {
    reg.clear_cursor_if(name_);
    return st;
  }
  return Status::ok();
}

void Surface::run_setup(Registry& reg) {
  if (busy_) return;
  BusyScope guard(*this);
  if (reg.settings().always) reg.settings().always(*this, reg);
  if (spec_.setup) spec_.setup(*this, reg);
}

void Surface::release_content(Registry& reg) {
  if (content_) reg.host().destroy_content(*content_);
  content_.reset();
  process_.reset();
  reg.cancel_sends(name_);
}

void Surface::on_process_exit(const ProcessExitEvent& ev, Registry& reg) {
  if (!process_ || *process_ != ev.process) return;
  process_.reset();
  last_exit_code_ = ev.exit_code;
  reg.cancel_sends(name_);
  if (!spec_.ephemeral) return;

  IHost& host = reg.host();
  if (window_ && host.window_valid(*window_)) {
    std::string m;
    if (!host.close_window(*window_, m)) reg.notify(name_ + ": close window after exit: " + m);
  }
  set_window(std::nullopt, reg);
  tab_.reset();
  reg.clear_cursor_if(name_);
  release_content(reg);
}
