#pragma once
/*
 * Registry
 *
 * Purpose: every surface by name (insertion order kept for next/prev), the
 * reverse index from live window to surface, the navigation cursor, deferred
 * sends and process-exit delivery.
 * Design: an explicit object handed to each operation; several registries can
 * coexist (tests build one per case).
 * Invariant: by_window_ and the surfaces' window handles always agree;
 * check_consistency() verifies it.
 */
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "host.hpp"
#include "presentation.hpp"
#include "session_provider.hpp"
#include "settings.hpp"
#include "status.hpp"
#include "surface.hpp"
#include "window_ops.hpp"

struct SurfaceInfo {
  std::string name;
  PresentationMode mode = PresentationMode::Floating;
  std::optional<WindowHandle> window;
  std::optional<ProcessHandle> process;
  std::optional<std::string> command;
  bool is_open = false;
  bool has_content = false;
  bool is_current = false;
};

class Registry {
public:
  using Clock = std::chrono::steady_clock;
  using Notify = std::function<void(const std::string&)>;

  Registry(IHost& host, SessionProviderRegistry& sessions, Settings settings = {});
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  IHost& host() { return host_; }
  const IHost& host() const { return host_; }
  SessionProviderRegistry& sessions() { return sessions_; }
  Settings& settings() { return settings_; }
  const Settings& settings() const { return settings_; }
  void set_notify(Notify n) { notify_ = std::move(n); }
  void notify(const std::string& m) const { if (notify_) notify_(m); }

  // caller-facing operations
  Status open(const SurfaceSpec& spec, const WinOpts& opts);
  Status open(const std::string& name, const PresentationConfig& cfg);
  // opts == nullptr hides
  Status toggle(const SurfaceSpec& spec, const WinOpts* opts);
  Status toggle(const std::string& name, const PresentationConfig* cfg);
  Status hide(const std::string& name);
  Status resize(const std::string& name, const ResizeOpts& opts);
  Status reposition(const std::string& name, const RepositionOpts& opts);
  Status next();
  Status prev();
  Status goto_surface(const std::string& name);
  Status toggle_current();
  Status hide_current();
  Status resize_current(const ResizeOpts& opts);
  Status reposition_current(const RepositionOpts& opts);
  Status kill(const std::string& name);
  Status send(const std::string& name, const std::string& bytes, Clock::time_point now);
  std::vector<SurfaceInfo> list() const;

  // lookup
  Surface* define(const SurfaceSpec& spec, Status& st);
  Surface* find(const std::string& name);
  const Surface* find(const std::string& name) const;
  Surface* find_by_window(WindowHandle w);
  // surface owning the host's focused window
  Surface* focused_surface();
  std::optional<std::string> cursor_name() const;
  std::size_t size() const { return order_.size(); }

  // asynchronous edges
  void handle_process_exit(const ProcessExitEvent& ev);
  void pump_host_events();
  void run_due_sends(Clock::time_point now);
  std::optional<Clock::time_point> next_send_due() const;
  std::size_t pending_send_count() const { return pending_.size(); }

  bool check_consistency(std::string& msg) const;

  // surface bookkeeping
  void bind_window(WindowHandle w, Surface& s);
  void unbind_window(WindowHandle w);
  void set_cursor(const std::string& name);
  void clear_cursor_if(const std::string& name);
  void cancel_sends(const std::string& name);
  void prune_stale_windows();

private:
  struct PendingSend {
    std::string surface;
    ProcessHandle target;
    std::string payload;
    std::string last_chunk;
    Clock::time_point due;
  };

  Status cycle(int step);
  Status show(Surface& s);
  std::vector<std::size_t> navigable() const;

  IHost& host_;
  SessionProviderRegistry& sessions_;
  Settings settings_;
  Notify notify_;
  std::vector<std::unique_ptr<Surface>> order_;
  std::unordered_map<std::string, std::size_t> by_name_;
  std::unordered_map<WindowHandle, Surface*, WindowHandleHash> by_window_;
  std::optional<std::size_t> cursor_;
  std::optional<std::size_t> last_hidden_;
  std::vector<PendingSend> pending_;
};
