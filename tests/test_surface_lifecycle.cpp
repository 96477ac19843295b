#include "headless_host.hpp"
#include "registry.hpp"
#include <cassert>
#include <string>
#include <vector>

class FakeRunner : public ICommandRunner {
public:
  bool runnable = true;
  int exit_code = 1;
  bool run(const std::vector<std::string>&, int& code, std::string& msg) override {
    if (!runnable) { msg = "tmux not found"; return false; }
    code = exit_code;
    return true;
  }
};

static SurfaceSpec term_spec(const std::string& name, const std::string& cmd) {
  SurfaceSpec s;
  s.name = name;
  s.cmd = cmd;
  return s;
}

static WinOpts centered(const char* w, const char* h) {
  WinOpts o;
  o.position = "center";
  o.width = w;
  o.height = h;
  return o;
}

static void expect_consistent(const Registry& reg) {
  std::string msg;
  bool ok = reg.check_consistency(msg);
  assert(ok && msg.empty());
}

static void test_cold_start_floating() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  assert(reg.open(term_spec("htop", "htop"), centered("80%", "60%")).is_ok());
  Surface* s = reg.find("htop");
  assert(s);
  assert(s->mode() == PresentationMode::Floating);
  assert(s->is_open(host));
  assert(host.rect_of(*s->window()) == (Rect{8, 12, 24, 96}));
  assert(host.current_window() == s->window());
  assert(reg.cursor_name() == "htop");
  assert(host.command_of(*s->process()) == "htop");
  assert(s->backing_command() == "htop");

  const auto& calls = host.calls();
  assert(calls.size() == 3);
  assert(calls[0] == "create_content htop");
  assert(calls[1] == "open_floating 96x24+8+12");
  assert(calls[2] == "start_process htop");
  expect_consistent(reg);
}

static void test_name_defaults_to_cmd() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  SurfaceSpec s;
  s.cmd = "lazygit";
  assert(reg.open(s, WinOpts{}).is_ok());
  assert(reg.find("lazygit"));

  Status st = reg.open(SurfaceSpec{}, WinOpts{});
  assert(st.code == ErrorCode::ConfigurationError);
  assert(reg.size() == 1);
}

static void test_rollback_on_host_failure() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  SurfaceSpec spec = term_spec("logs", "tail -f app.log");

  host.fail_next(HostCall::OpenWindow);
  Status st = reg.open(spec, WinOpts{});
  assert(st.code == ErrorCode::HostOperationFailed);
  assert(st.msg.find("injected failure") != std::string::npos);
  Surface* s = reg.find("logs");
  assert(s && !s->content() && !s->window());
  assert(host.content_count() == 0);
  assert(host.window_count() == 0);
  expect_consistent(reg);

  host.fail_next(HostCall::StartProcess);
  st = reg.open(spec, WinOpts{});
  assert(st.code == ErrorCode::HostOperationFailed);
  assert(host.content_count() == 0);
  assert(host.window_count() == 0);
  assert(!s->process());
  assert(!reg.cursor_name());
  expect_consistent(reg);

  host.fail_next(HostCall::CreateContent);
  assert(reg.open(spec, WinOpts{}).code == ErrorCode::HostOperationFailed);
  assert(host.window_count() == 0);

  // faults are one-shot
  assert(reg.open(spec, WinOpts{}).is_ok());
  assert(s->is_open(host));
  assert(host.running_processes() == 1);
  expect_consistent(reg);
}

static void test_invalid_geometry_touches_nothing() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  WinOpts bad;
  bad.width = "huge";
  assert(reg.open(term_spec("x", "sh"), bad).code == ErrorCode::InvalidUnitToken);
  assert(host.calls().empty());

  WinOpts anchor;
  anchor.position = "middle";
  assert(reg.open(term_spec("x", "sh"), anchor).code == ErrorCode::ConfigurationError);
  reg.settings().lenient_position = true;
  assert(reg.open(term_spec("x", "sh"), anchor).is_ok());
  assert(std::get<FloatingConfig>(reg.find("x")->last_config()).position == Anchor::Center);
}

static void test_hide_and_reopen_reuses_content() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  SurfaceSpec spec = term_spec("shell", "bash");

  assert(reg.open(spec, WinOpts{}).is_ok());
  Surface* s = reg.find("shell");
  ContentHandle c = *s->content();
  ProcessHandle p = *s->process();

  assert(reg.hide("shell").is_ok());
  assert(!s->is_open(host));
  assert(!s->window());
  assert(host.window_count() == 0);
  assert(host.content_valid(c));
  assert(host.running_processes() == 1);
  assert(!reg.cursor_name());
  expect_consistent(reg);

  // hiding twice is fine
  assert(reg.hide("shell").is_ok());

  assert(reg.open(spec, WinOpts{}).is_ok());
  assert(s->is_open(host));
  assert(*s->content() == c);
  assert(*s->process() == p);
  assert(host.call_count("create_content") == 1);
  assert(host.call_count("start_process") == 1);
  assert(host.call_count("open_floating") == 2);
  expect_consistent(reg);
}

static void test_toggle_updates_open_floating() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  SurfaceSpec spec = term_spec("top", "top");

  WinOpts first = centered("80%", "60%");
  assert(reg.toggle(spec, &first).is_ok());
  Surface* s = reg.find("top");
  WindowHandle w = *s->window();

  WinOpts smaller = centered("50%", "50%");
  assert(reg.toggle(spec, &smaller).is_ok());
  assert(*s->window() == w);
  assert(host.rect_of(w) == (Rect{10, 30, 20, 60}));
  assert(std::get<FloatingConfig>(s->last_config()).width == "50%");

  assert(reg.toggle(spec, nullptr).is_ok());
  assert(!s->is_open(host));
  assert(host.content_valid(*s->content()));

  // a name-only toggle reopens with the remembered config
  PresentationConfig cfg = s->last_config();
  assert(reg.toggle("top", &cfg).is_ok());
  assert(host.rect_of(*s->window()) == (Rect{10, 30, 20, 60}));
  assert(reg.toggle("missing", &cfg).code == ErrorCode::SurfaceNotFound);
}

static void test_ephemeral() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  std::vector<std::string> notes;
  reg.set_notify([&](const std::string& m) { notes.push_back(m); });

  SurfaceSpec spec = term_spec("scratch", "sh");
  spec.ephemeral = true;
  assert(reg.open(spec, WinOpts{}).is_ok());
  Surface* s = reg.find("scratch");
  assert(reg.hide("scratch").is_ok());
  assert(!s->content() && !s->process());
  assert(host.content_count() == 0);
  assert(host.running_processes() == 0);

  // the hangup exit belongs to released content and is ignored
  reg.pump_host_events();
  assert(notes.empty());

  assert(reg.open(spec, WinOpts{}).is_ok());
  assert(host.call_count("create_content") == 2);
  assert(host.call_count("start_process") == 2);

  // an ephemeral surface closes with its process
  ProcessHandle p = *s->process();
  assert(host.simulate_exit(p, 3));
  reg.pump_host_events();
  assert(!s->window() && !s->content());
  assert(host.window_count() == 0);
  assert(s->last_exit_code() == 3);
  assert(notes.size() == 1 && notes[0] == "scratch: process exited with code 3");
  expect_consistent(reg);
}

static void test_tab_hide_keeps_tab() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  SurfaceSpec spec;
  spec.name = "notes";
  spec.lines = {"first", "second"};
  WinOpts tab;
  tab.type = "tab";
  assert(reg.open(spec, tab).is_ok());
  Surface* s = reg.find("notes");
  TabHandle t = *s->tab();
  assert(s->mode() == PresentationMode::Tab);
  assert(host.tab_count() == 2);
  assert(host.current_tab() == t);
  assert(*host.content_lines(*s->content()) == spec.lines);

  assert(reg.hide("notes").is_ok());
  assert(host.current_tab() == host.main_tab());
  assert(host.tab_valid(t));
  assert(!reg.cursor_name());

  assert(reg.open(spec, tab).is_ok());
  assert(host.current_tab() == t);
  assert(*s->tab() == t);
  assert(host.call_count("open_tab") == 1);
  assert(reg.cursor_name() == "notes");
  expect_consistent(reg);
}

static void test_split_open() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  WinOpts o;
  o.position = "split-bottom";
  assert(reg.open(term_spec("build", "make"), o).is_ok());
  Surface* s = reg.find("build");
  assert(s->mode() == PresentationMode::Split);
  assert(host.call_count("open_split bottom 16") == 1);
  assert(host.rect_of(*s->window()) == (Rect{24, 0, 16, 120}));
  assert(!host.window_is_floating(*s->window()));
}

static void test_restart_after_exit() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  std::vector<std::string> notes;
  reg.set_notify([&](const std::string& m) { notes.push_back(m); });

  SurfaceSpec spec = term_spec("job", "make test");
  assert(reg.open(spec, WinOpts{}).is_ok());
  Surface* s = reg.find("job");
  ProcessHandle first = *s->process();
  ContentHandle old_content = *s->content();

  assert(host.simulate_exit(first, 0));
  reg.pump_host_events();
  assert(!s->process());
  assert(s->last_exit_code() == 0);
  assert(notes.empty());
  // output stays visible
  assert(s->is_open(host));
  assert(host.content_valid(old_content));

  assert(reg.hide("job").is_ok());
  assert(reg.open(spec, WinOpts{}).is_ok());
  assert(s->process());
  assert(*s->process() != first);
  assert(!host.content_valid(old_content));
  assert(host.call_count("start_process") == 2);
  assert(!s->last_exit_code());

  // the old handle no longer names anything
  assert(!host.simulate_exit(first, 1));
  expect_consistent(reg);
}

static void test_hooks() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  std::vector<std::string> seen;
  Settings settings;
  settings.always = [&](Surface& s, Registry&) { seen.push_back("always " + s.name()); };
  Registry reg(host, sessions, settings);

  SurfaceSpec spec = term_spec("w", "watch ls");
  spec.init = [&](Surface&, Registry&) { seen.push_back("init"); };
  spec.setup = [&](Surface&, Registry&) { seen.push_back("setup"); };

  assert(reg.open(spec, WinOpts{}).is_ok());
  assert(reg.hide("w").is_ok());
  assert(reg.open(spec, WinOpts{}).is_ok());
  assert((seen == std::vector<std::string>{"init", "always w", "setup", "always w", "setup"}));
}

static void test_reentrancy_guard() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  Status inner;
  int calls = 0;
  SurfaceSpec spec = term_spec("guarded", "sh");
  spec.setup = [&](Surface& s, Registry& r) {
    ++calls;
    inner = r.hide(s.name());
  };
  assert(reg.open(spec, WinOpts{}).is_ok());
  assert(calls == 1);
  assert(inner.code == ErrorCode::ReentrantOperation);
  assert(reg.find("guarded")->is_open(host));
  assert(!reg.find("guarded")->busy());
  expect_consistent(reg);
}

static void test_session_backed() {
  HeadlessHost host;
  FakeRunner runner;
  SessionProviderRegistry sessions;
  register_default_providers(sessions, runner);
  Registry reg(host, sessions);
  std::vector<std::string> notes;
  reg.set_notify([&](const std::string& m) { notes.push_back(m); });

  SurfaceSpec spec = term_spec("mon", "htop");
  spec.session = "tmux";
  assert(reg.open(spec, WinOpts{}).is_ok());
  Surface* s = reg.find("mon");
  assert(host.command_of(*s->process()) == "tmux new-session -s 'mfling-mon' 'htop'");
  assert(s->backing_command() == "tmux new-session -s 'mfling-mon' 'htop'");

  SurfaceSpec other = term_spec("other", "htop");
  other.session = "screen";
  assert(reg.open(other, WinOpts{}).code == ErrorCode::ConfigurationError);

  runner.runnable = false;
  SurfaceSpec down = term_spec("down", "htop");
  down.session = "tmux";
  std::size_t before = host.calls().size();
  assert(reg.open(down, WinOpts{}).code == ErrorCode::SessionBackendUnavailable);
  assert(host.calls().size() == before);

  reg.settings().session_fallback = true;
  assert(reg.open(down, WinOpts{}).is_ok());
  assert(host.command_of(*reg.find("down")->process()) == "htop");
  assert(notes.size() == 1);
  assert(notes[0].find("without a session") != std::string::npos);
}

int main() {
  test_cold_start_floating();
  test_name_defaults_to_cmd();
  test_rollback_on_host_failure();
  test_invalid_geometry_touches_nothing();
  test_hide_and_reopen_reuses_content();
  test_toggle_updates_open_floating();
  test_ephemeral();
  test_tab_hide_keeps_tab();
  test_split_open();
  test_restart_after_exit();
  test_hooks();
  test_reentrancy_guard();
  test_session_backed();
  return 0;
}
