#include "headless_host.hpp"
#include "registry.hpp"
#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

class FakeRunner : public ICommandRunner {
public:
  std::vector<std::vector<std::string>> seen;
  bool run(const std::vector<std::string>& argv, int& code, std::string&) override {
    seen.push_back(argv);
    code = 0;
    return true;
  }
};

static SurfaceSpec text_spec(const std::string& name) {
  SurfaceSpec s;
  s.name = name;
  s.lines = {name + " contents"};
  return s;
}

static SurfaceSpec term_spec(const std::string& name, const std::string& cmd) {
  SurfaceSpec s;
  s.name = name;
  s.cmd = cmd;
  return s;
}

static void expect_consistent(const Registry& reg) {
  std::string msg;
  bool ok = reg.check_consistency(msg);
  assert(ok && msg.empty());
}

static void test_cycle_order() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  assert(reg.next().code == ErrorCode::SurfaceNotFound);

  for (const char* n : {"A", "B", "C"}) assert(reg.open(text_spec(n), WinOpts{}).is_ok());
  assert(reg.hide("C").is_ok());
  expect_consistent(reg);

  std::vector<std::string> visited;
  for (int i = 0; i < 4; ++i) {
    assert(reg.next().is_ok());
    visited.push_back(*reg.cursor_name());
    expect_consistent(reg);
  }
  assert((visited == std::vector<std::string>{"A", "B", "C", "A"}));

  // cycling hides the surface it leaves
  assert(reg.find("A")->is_open(host));
  assert(!reg.find("C")->is_open(host));
  assert(host.current_window() == reg.find("A")->window());

  assert(reg.prev().is_ok());
  assert(reg.cursor_name() == "C");
  assert(!reg.find("A")->is_open(host));
  assert(reg.find("C")->is_open(host));
  expect_consistent(reg);
}

static void test_cycle_skips_surfaces_without_content() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  assert(reg.open(text_spec("A"), WinOpts{}).is_ok());
  assert(reg.open(text_spec("B"), WinOpts{}).is_ok());
  assert(reg.kill("A").is_ok());
  assert(reg.size() == 2);

  assert(reg.next().is_ok());
  assert(reg.cursor_name() == "B");
  assert(reg.next().is_ok());
  assert(reg.cursor_name() == "B");
  assert(reg.find("B")->is_open(host));
}

static void test_goto_and_current() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  WinOpts split;
  split.position = "split-right";
  assert(reg.open(text_spec("A"), WinOpts{}).is_ok());
  assert(reg.open(text_spec("B"), split).is_ok());
  assert(reg.hide("B").is_ok());

  assert(reg.goto_surface("B").is_ok());
  Surface* b = reg.find("B");
  assert(b->is_open(host));
  assert(b->mode() == PresentationMode::Split);
  assert(reg.cursor_name() == "B");
  assert(host.current_window() == b->window());

  assert(reg.goto_surface("nope").code == ErrorCode::SurfaceNotFound);

  assert(reg.toggle_current().is_ok());
  assert(!b->is_open(host));
  assert(!reg.cursor_name());
  assert(reg.toggle_current().is_ok());
  assert(b->is_open(host));
  assert(reg.cursor_name() == "B");

  assert(reg.hide_current().is_ok());
  assert(!b->is_open(host));
  // focus fell back to A
  assert(host.current_window() == reg.find("A")->window());
  assert(reg.hide_current().is_ok());
  assert(!reg.find("A")->is_open(host));
  assert(reg.hide_current().code == ErrorCode::SurfaceNotFound);

  assert(reg.kill("B").is_ok());
  assert(reg.goto_surface("B").code == ErrorCode::SurfaceNotFound);
  expect_consistent(reg);
}

static void test_stale_windows_pruned() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  assert(reg.open(term_spec("A", "sh"), WinOpts{}).is_ok());
  Surface* a = reg.find("A");
  WindowHandle w = *a->window();
  assert(host.close_window_externally(w));

  std::string msg;
  assert(!reg.check_consistency(msg));
  assert(!msg.empty());
  reg.prune_stale_windows();
  expect_consistent(reg);
  assert(!a->window());

  assert(reg.open(term_spec("A", "sh"), WinOpts{}).is_ok());
  assert(a->window());
  // same id comes back under a new generation
  assert(a->window()->id == w.id);
  assert(*a->window() != w);
  assert(host.call_count("create_content") == 1);
  assert(reg.find_by_window(*a->window()) == a);
  assert(!reg.find_by_window(w));
  expect_consistent(reg);
}

static void test_tab_closed_externally() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  WinOpts tab;
  tab.type = "tab";

  assert(reg.open(text_spec("T"), tab).is_ok());
  Surface* t = reg.find("T");
  assert(host.close_tab_externally(*t->tab()));
  assert(host.tab_count() == 1);
  assert(host.current_tab() == host.main_tab());

  assert(reg.open(text_spec("T"), tab).is_ok());
  assert(host.call_count("open_tab") == 2);
  assert(host.call_count("create_content") == 1);
  assert(host.current_tab() == t->tab());
  expect_consistent(reg);
}

static void test_kill() {
  HeadlessHost host;
  FakeRunner runner;
  SessionProviderRegistry sessions;
  register_default_providers(sessions, runner);
  Registry reg(host, sessions);
  std::vector<std::string> notes;
  reg.set_notify([&](const std::string& m) { notes.push_back(m); });

  SurfaceSpec spec = term_spec("srv", "npm start");
  spec.session = "tmux";
  assert(reg.open(spec, WinOpts{}).is_ok());
  runner.seen.clear();

  assert(reg.kill("srv").is_ok());
  Surface* s = reg.find("srv");
  assert(s);
  assert(!s->window() && !s->content() && !s->process());
  assert(host.window_count() == 0);
  assert(host.content_count() == 0);
  assert(host.running_processes() == 0);
  assert(runner.seen.size() == 1);
  assert((runner.seen[0] == std::vector<std::string>{"tmux", "kill-session", "-t", "mfling-srv"}));

  reg.pump_host_events();
  assert(notes.empty());
  assert(reg.kill("ghost").code == ErrorCode::SurfaceNotFound);

  // killed surfaces start over on the next open
  assert(reg.open(spec, WinOpts{}).is_ok());
  assert(host.call_count("create_content") == 2);
  expect_consistent(reg);
}

static void test_deferred_send() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  const auto t0 = Registry::Clock::time_point{} + 10s;

  assert(reg.open(term_spec("sh", "bash"), WinOpts{}).is_ok());
  ProcessHandle p = *reg.find("sh")->process();

  assert(reg.send("sh", "ls\n", t0).is_ok());
  assert(reg.pending_send_count() == 1);
  assert(reg.next_send_due() == t0 + 100ms);

  reg.run_due_sends(t0 + 50ms);
  assert(host.sent_to(p).empty());
  reg.run_due_sends(t0 + 100ms);
  assert(host.sent_to(p) == "ls\n");
  assert(reg.pending_send_count() == 0);
  assert(!reg.next_send_due());

  // one pending send per surface; repeats of the same payload are not stacked
  assert(reg.send("sh", "a", t0).is_ok());
  assert(reg.send("sh", "b", t0 + 10ms).is_ok());
  assert(reg.send("sh", "b", t0 + 20ms).is_ok());
  assert(reg.pending_send_count() == 1);
  reg.run_due_sends(t0 + 1s);
  assert(host.sent_to(p) == "ls\nab");

  assert(reg.send("nope", "x", t0).code == ErrorCode::SurfaceNotFound);
}

static void test_send_keeps_payloads_matching_the_pending_tail() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  const auto t0 = Registry::Clock::time_point{} + 10s;

  assert(reg.open(term_spec("sh", "bash"), WinOpts{}).is_ok());
  ProcessHandle p = *reg.find("sh")->process();
  assert(reg.send("sh", "echo hi\n", t0).is_ok());
  assert(reg.send("sh", "\n", t0).is_ok());
  assert(reg.send("sh", "i\n", t0).is_ok());
  assert(reg.pending_send_count() == 1);
  reg.run_due_sends(t0 + 1s);
  assert(host.sent_to(p) == "echo hi\n\ni\n");
}

static void test_send_delay_override_and_settings() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  const auto t0 = Registry::Clock::time_point{} + 10s;

  SurfaceSpec fast = term_spec("fast", "sh");
  fast.send_delay_ms = 0;
  assert(reg.open(fast, WinOpts{}).is_ok());
  assert(reg.send("fast", "now", t0).is_ok());
  reg.run_due_sends(t0);
  assert(host.sent_to(*reg.find("fast")->process()) == "now");

  reg.settings().send_delay_ms = 500;
  assert(reg.open(term_spec("slow", "sh"), WinOpts{}).is_ok());
  assert(reg.send("slow", "x", t0).is_ok());
  assert(reg.next_send_due() == t0 + 500ms);
}

static void test_send_dropped_on_exit() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);
  std::vector<std::string> notes;
  reg.set_notify([&](const std::string& m) { notes.push_back(m); });
  const auto t0 = Registry::Clock::time_point{} + 10s;

  assert(reg.open(term_spec("sh", "bash"), WinOpts{}).is_ok());
  Surface* s = reg.find("sh");
  ProcessHandle p = *s->process();
  assert(reg.send("sh", "echo hi\n", t0).is_ok());

  assert(host.simulate_exit(p, 2));
  reg.pump_host_events();
  assert(reg.pending_send_count() == 0);
  assert(notes.size() == 1 && notes[0] == "sh: process exited with code 2");
  reg.run_due_sends(t0 + 1s);
  assert(host.sent_to(p).empty());

  // no process, nothing to send to
  assert(reg.send("sh", "x", t0).code == ErrorCode::ConfigurationError);
  assert(reg.open(text_spec("doc"), WinOpts{}).is_ok());
  assert(reg.send("doc", "x", t0).code == ErrorCode::ConfigurationError);

  // a restart gets a fresh queue
  assert(reg.hide("sh").is_ok());
  assert(reg.open(term_spec("sh", "bash"), WinOpts{}).is_ok());
  assert(reg.send("sh", "pwd\n", t0).is_ok());
  reg.run_due_sends(t0 + 1s);
  assert(host.sent_to(*s->process()) == "pwd\n");
}

static void test_list() {
  HeadlessHost host;
  SessionProviderRegistry sessions;
  Registry reg(host, sessions);

  assert(reg.open(term_spec("A", "htop"), WinOpts{}).is_ok());
  assert(reg.open(text_spec("B"), WinOpts{}).is_ok());
  assert(reg.hide("B").is_ok());
  assert(reg.open(text_spec("C"), WinOpts{}).is_ok());
  assert(reg.kill("C").is_ok());

  std::vector<SurfaceInfo> all = reg.list();
  assert(all.size() == 3);
  assert(all[0].name == "A" && all[0].is_open && all[0].has_content);
  assert(all[0].command == "htop");
  assert(all[0].process);
  assert(all[1].name == "B" && !all[1].is_open && all[1].has_content);
  assert(!all[1].command);
  assert(all[2].name == "C" && !all[2].has_content);
  assert(!all[0].is_current && !all[1].is_current && !all[2].is_current);

  assert(reg.goto_surface("A").is_ok());
  all = reg.list();
  assert(all[0].is_current);
}

int main() {
  test_cycle_order();
  test_cycle_skips_surfaces_without_content();
  test_goto_and_current();
  test_stale_windows_pruned();
  test_tab_closed_externally();
  test_kill();
  test_deferred_send();
  test_send_keeps_payloads_matching_the_pending_tail();
  test_send_delay_override_and_settings();
  test_send_dropped_on_exit();
  test_list();
  return 0;
}
