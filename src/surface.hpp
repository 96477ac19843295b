#pragma once
/*
 * Surface
 *
 * Purpose: one named, toggleable unit of content bound to a floating window,
 * a docked split or a dedicated tab.
 * States: Closed -> Open(mode) -> Closed; a tab surface that was hidden stays
 * Open-but-unfocused (tab and window kept, host switched away).
 * Invariant: every change of the window handle goes through set_window(), which
 * keeps the registry's window index in step.
 */
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "host.hpp"
#include "presentation.hpp"
#include "status.hpp"

class Registry;
class Surface;

struct SurfaceSpec {
  std::string name;                       // defaults to cmd when empty
  std::optional<std::string> cmd;         // process-backed when set
  std::vector<std::string> lines;         // static text content
  std::optional<std::string> session;     // session provider name (tmux, abduco)
  bool ephemeral = false;                 // content and process go away on hide
  std::optional<int> send_delay_ms;
  std::function<void(Surface&, Registry&)> init;   // once per content container
  std::function<void(Surface&, Registry&)> setup;  // after every show
};

class Surface {
public:
  explicit Surface(SurfaceSpec spec);

  const std::string& name() const { return name_; }
  const SurfaceSpec& spec() const { return spec_; }
  PresentationMode mode() const { return mode_; }
  const PresentationConfig& last_config() const { return last_config_; }
  std::optional<WindowHandle> window() const { return window_; }
  std::optional<TabHandle> tab() const { return tab_; }
  std::optional<ContentHandle> content() const { return content_; }
  std::optional<ProcessHandle> process() const { return process_; }
  const std::optional<std::string>& backing_command() const { return backing_command_; }
  std::optional<int> last_exit_code() const { return last_exit_code_; }
  bool is_process_backed() const { return spec_.cmd.has_value(); }
  bool busy() const { return busy_; }

  // hooks may be replaced on a later reference to the same name; content may not
  void refresh_hooks(const SurfaceSpec& spec);

  // tab: tab still exists; floating/split: window still valid
  bool is_open(const IHost& host) const;
  bool has_live_content(const IHost& host) const;

  Status open(const PresentationConfig& cfg, Registry& reg);
  // cfg == nullptr hides
  Status toggle(const PresentationConfig* cfg, Registry& reg);
  Status hide(Registry& reg);
  // close everything, drop content; the name stays registered
  Status destroy(Registry& reg);

  // always + setup hooks, guarded against re-entry
  void run_setup(Registry& reg);

  void on_process_exit(const ProcessExitEvent& ev, Registry& reg);

  // registry housekeeping: the host closed our window or tab behind our back
  void forget_stale_handles(Registry& reg);

  // used by window operations
  void set_last_config(const PresentationConfig& cfg) { last_config_ = cfg; }
  Status replace_split(const SplitConfig& cfg, Registry& reg);

  class BusyScope {
  public:
    explicit BusyScope(Surface& s) : s_(s) { s_.busy_ = true; }
    ~BusyScope() { s_.busy_ = false; }
    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;
  private:
    Surface& s_;
  };

private:
  struct WindowPlan {
    PresentationMode mode = PresentationMode::Floating;
    Rect rect{};
    SplitDirection direction = SplitDirection::Bottom;
    int split_size = 0;
  };

  Status plan_window(const PresentationConfig& cfg, const IHost& host, WindowPlan& plan) const;
  Status create_window(const WindowPlan& plan, const PresentationConfig& cfg, Registry& reg);
  Status cold_start(const PresentationConfig& cfg, Registry& reg);
  Status resolve_command(Registry& reg, std::string& out) const;
  Status focus_existing(Registry& reg);
  void set_window(std::optional<WindowHandle> w, Registry& reg);
  void release_content(Registry& reg);
  Status reentrant(const char* op) const;

  std::string name_;
  SurfaceSpec spec_;
  PresentationMode mode_ = PresentationMode::Floating;
  PresentationConfig last_config_ = FloatingConfig{};
  std::optional<ContentHandle> content_;
  std::optional<WindowHandle> window_;
  std::optional<TabHandle> tab_;
  std::optional<ProcessHandle> process_;
  std::optional<std::string> backing_command_;
  std::optional<int> last_exit_code_;
  bool busy_ = false;
};
