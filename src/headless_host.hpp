#pragma once
/*
 * HeadlessHost
 *
 * Purpose: in-memory IHost for tests and scripted runs; records host calls,
 * simulates processes and can fail the next call of a given kind.
 * Note: processes never run; exits happen only through simulate_exit().
 */
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "host_model.hpp"

enum class HostCall { CreateContent, OpenWindow, OpenTab, StartProcess, CloseWindow, SetWidth, SetHeight };

class HeadlessHost : public HostModel {
public:
  explicit HeadlessHost(TermSize size = {40, 120});

  // fault injection: the next call of this kind fails with msg
  void fail_next(HostCall call, std::string msg = "injected failure");

  bool create_content(const std::string& name, ContentHandle& out, std::string& msg) override;
  bool open_floating(ContentHandle c, const Rect& r, WindowHandle& out, std::string& msg) override;
  bool open_split(ContentHandle c, SplitDirection dir, int size, WindowHandle& out, std::string& msg) override;
  bool close_window(WindowHandle w, std::string& msg) override;
  bool open_tab(ContentHandle c, TabHandle& tab, WindowHandle& win, std::string& msg) override;
  bool start_process(ContentHandle c, const std::string& command, ProcessHandle& out, std::string& msg) override;
  bool set_window_width(WindowHandle w, int width, std::string& msg) override;
  bool set_window_height(WindowHandle w, int height, std::string& msg) override;

  // the user closing things through the host, behind the registry's back
  bool close_window_externally(WindowHandle w);
  bool close_tab_externally(TabHandle t);
  // false when the handle no longer names a running process
  bool simulate_exit(ProcessHandle p, int exit_code);

  const std::vector<std::string>& calls() const { return calls_; }
  int call_count(const std::string& prefix) const;
  std::string sent_to(ProcessHandle p) const;
  std::optional<std::string> command_of(ProcessHandle p) const;
  std::size_t running_processes() const;
  std::optional<Rect> rect_of(WindowHandle w) const;

protected:
  bool launch(Content& c, const std::string& command, int& pid, std::string& msg) override;
  bool deliver(int pid, std::string_view bytes) override;
  void terminate(int pid) override;

private:
  struct SimProcess {
    std::string command;
    std::string received;
    bool alive = true;
  };

  bool take_fault(HostCall call, std::string& msg);

  std::map<HostCall, std::string> faults_;
  std::map<int, SimProcess> procs_;
  std::vector<std::string> calls_;
  int next_pid_ = 1000;
};
