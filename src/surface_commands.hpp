#pragma once
/*
 * SurfaceCommands
 *
 * Purpose: the ex-style command set driving a Registry (term, buff, tab, hide,
 * toggle, goto, next, prev, list, kill, resize, reposition, send, set, quit).
 * Args: `key=value` tokens. A token that is not a known key continues the
 * previous value, so `cmd=htop -d 5` keeps its spaces.
 */
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "cmd_registry.hpp"
#include "registry.hpp"
#include "status.hpp"

struct CommandArgs {
  std::map<std::string, std::string> kv;
  std::vector<std::string> bare;
  bool has(const std::string& k) const { return kv.count(k) != 0; }
};

CommandArgs parse_command_args(const std::vector<std::string>& args);

// what a command leaves for the user besides its Status
struct CommandOutput {
  std::string message;
  bool quit = false;
};

using NowFn = std::function<Registry::Clock::time_point()>;

void register_surface_commands(CommandRegistry& cmds, Registry& reg, CommandOutput& out, NowFn now = {});

// one line as typed after ':'; `set name=value` and `set name value` both work
Status execute_command_line(const CommandRegistry& cmds, const std::string& line);

// rc file lines: blanks and comments (#, ", //) skipped, a leading ':' stripped;
// failures are collected as "line N: <error>" and do not stop the run
void run_rc_lines(const CommandRegistry& cmds, const std::vector<std::string>& lines, std::vector<std::string>& errors);
bool load_rc_file(const CommandRegistry& cmds, const std::filesystem::path& path, std::vector<std::string>& errors, std::string& msg);

// "\n", "\r", "\t", "\\" and "\e" expanded
std::string unescape(const std::string& s);
