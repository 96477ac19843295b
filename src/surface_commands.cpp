#include "surface_commands.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <set>
#include <sstream>
#include "file_reader.hpp"

static const std::set<std::string>& known_keys() {
  static const std::set<std::string> keys = {
    "name", "cmd", "text", "file", "type", "position", "width", "height", "margin",
    "size", "direction", "session", "ephemeral", "delay", "row", "col",
  };
  return keys;
}

CommandArgs parse_command_args(const std::vector<std::string>& args) {
  CommandArgs out;
  std::string last;
  for (const auto& tok : args) {
    size_t eq = tok.find('=');
    if (eq != std::string::npos && eq > 0) {
      std::string key = tok.substr(0, eq);
      if (known_keys().count(key)) {
        out.kv[key] = tok.substr(eq + 1);
        last = key;
        continue;
      }
    }
    if (last == "cmd" || last == "text") { out.kv[last] += " " + tok; continue; }
    out.bare.push_back(tok);
  }
  return out;
}

std::string unescape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 == s.size()) { out.push_back(s[i]); continue; }
    char c = s[++i];
    switch (c) {
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'e': out.push_back('\x1b'); break;
      case '\\': out.push_back('\\'); break;
      default: out.push_back('\\'); out.push_back(c);
    }
  }
  return out;
}

static bool parse_switch(const std::string& v, bool& out) {
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

static bool parse_int(const std::string& v, int& out) {
  if (v.empty()) return false;
  auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  return ec == std::errc() && p == v.data() + v.size();
}

static Status usage(const std::string& text) {
  return Status::error(ErrorCode::ConfigurationError, "usage: " + text);
}

static WinOpts win_opts_from(const CommandArgs& a) {
  WinOpts o;
  auto take = [&](const char* key, std::optional<std::string>& field) {
    auto it = a.kv.find(key);
    if (it != a.kv.end()) field = it->second;
  };
  take("type", o.type);
  take("position", o.position);
  take("width", o.width);
  take("height", o.height);
  take("margin", o.margin);
  take("size", o.size);
  take("direction", o.direction);
  return o;
}

static Status spec_from(const CommandArgs& a, SurfaceSpec& spec) {
  if (auto it = a.kv.find("name"); it != a.kv.end()) spec.name = it->second;
  if (auto it = a.kv.find("cmd"); it != a.kv.end() && !it->second.empty()) spec.cmd = it->second;
  if (auto it = a.kv.find("session"); it != a.kv.end()) spec.session = it->second;
  if (auto it = a.kv.find("ephemeral"); it != a.kv.end()) {
    if (!parse_switch(it->second, spec.ephemeral)) {
      return Status::error(ErrorCode::ConfigurationError, "ephemeral must be on|off");
    }
  }
  if (auto it = a.kv.find("delay"); it != a.kv.end()) {
    int ms = 0;
    if (!parse_int(it->second, ms) || ms < 0) {
      return Status::error(ErrorCode::ConfigurationError, "delay must be a number of milliseconds");
    }
    spec.send_delay_ms = ms;
  }
  return Status::ok();
}

static std::string name_arg(const CommandArgs& a) {
  if (auto it = a.kv.find("name"); it != a.kv.end()) return it->second;
  return a.bare.empty() ? std::string() : a.bare.front();
}

static std::string describe_list(const std::vector<SurfaceInfo>& all) {
  std::vector<SurfaceInfo> shown;
  for (const auto& i : all) if (i.has_content) shown.push_back(i);
  if (shown.empty()) return "no open surfaces";
  std::sort(shown.begin(), shown.end(), [](const SurfaceInfo& x, const SurfaceInfo& y) { return x.name < y.name; });
  std::string out;
  for (const auto& i : shown) {
    if (!out.empty()) out += "  ";
    if (i.is_current) out += "*";
    out += i.is_open ? "[OPEN] " : "[HIDDEN] ";
    out += i.name + " (" + std::string(mode_name(i.mode));
    out += ", cmd: " + (i.command ? *i.command : std::string("none")) + ")";
  }
  return out;
}

void register_surface_commands(CommandRegistry& cmds, Registry& reg, CommandOutput& out, NowFn now) {
  if (!now) now = [] { return Registry::Clock::now(); };

  cmds.register_command("term", [&reg](const std::vector<std::string>& args) {
    CommandArgs a = parse_command_args(args);
    if (!a.has("cmd") || a.kv["cmd"].empty()) return usage("term [name=<n>] cmd=<command> [window options]");
    SurfaceSpec spec;
    if (Status st = spec_from(a, spec); !st) return st.context("term");
    WinOpts opts = win_opts_from(a);
    return reg.toggle(spec, &opts);
  });
  cmds.register_command("buff", [&reg](const std::vector<std::string>& args) {
    CommandArgs a = parse_command_args(args);
    SurfaceSpec spec;
    if (Status st = spec_from(a, spec); !st) return st.context("buff");
    if (auto it = a.kv.find("file"); it != a.kv.end()) {
      std::string m;
      if (!mmap_readlines(it->second, spec.lines, m)) return Status::error(ErrorCode::ConfigurationError, "buff: " + m);
    }
    if (auto it = a.kv.find("text"); it != a.kv.end()) {
      std::istringstream iss(unescape(it->second));
      for (std::string line; std::getline(iss, line);) spec.lines.push_back(line);
    }
    WinOpts opts = win_opts_from(a);
    return reg.toggle(spec, &opts);
  });
  cmds.register_command("tab", [&reg](const std::vector<std::string>& args) {
    CommandArgs a = parse_command_args(args);
    SurfaceSpec spec;
    if (Status st = spec_from(a, spec); !st) return st.context("tab");
    WinOpts opts;
    opts.type = "tab";
    return reg.toggle(spec, &opts);
  });
  cmds.register_command("hide", [&reg](const std::vector<std::string>& args) {
    std::string name = name_arg(parse_command_args(args));
    return name.empty() ? reg.hide_current() : reg.hide(name);
  });
  cmds.register_command("toggle", [&reg](const std::vector<std::string>& args) {
    std::string name = name_arg(parse_command_args(args));
    if (name.empty()) return reg.toggle_current();
    Surface* s = reg.find(name);
    if (s && s->is_open(reg.host())) return reg.toggle(name, nullptr);
    PresentationConfig cfg = s ? s->last_config() : PresentationConfig{FloatingConfig{}};
    return reg.toggle(name, &cfg);
  });
  cmds.register_command("goto", [&reg](const std::vector<std::string>& args) {
    std::string name = name_arg(parse_command_args(args));
    if (name.empty()) return usage("goto <name>");
    return reg.goto_surface(name);
  });
  cmds.register_command("next", [&reg](const std::vector<std::string>&) { return reg.next(); });
  cmds.register_command("prev", [&reg](const std::vector<std::string>&) { return reg.prev(); });
  cmds.register_command("list", [&reg, &out](const std::vector<std::string>&) {
    out.message = describe_list(reg.list());
    return Status::ok();
  });
  cmds.register_command("kill", [&reg](const std::vector<std::string>& args) {
    std::string name = name_arg(parse_command_args(args));
    if (name.empty()) return usage("kill <name>");
    return reg.kill(name);
  });
  cmds.register_command("resize", [&reg](const std::vector<std::string>& args) {
    CommandArgs a = parse_command_args(args);
    ResizeOpts o;
    if (auto it = a.kv.find("width"); it != a.kv.end()) o.width = it->second;
    if (auto it = a.kv.find("height"); it != a.kv.end()) o.height = it->second;
    // bare tokens fill width, then height
    for (const auto& b : a.bare) {
      if (!o.width) o.width = b;
      else if (!o.height) o.height = b;
    }
    if (!o.width && !o.height) return usage("resize [name=<n>] width=<tok> height=<tok>");
    if (auto it = a.kv.find("name"); it != a.kv.end()) return reg.resize(it->second, o);
    return reg.resize_current(o);
  });
  cmds.register_command("reposition", [&reg](const std::vector<std::string>& args) {
    CommandArgs a = parse_command_args(args);
    RepositionOpts o;
    if (auto it = a.kv.find("position"); it != a.kv.end()) o.position = it->second;
    if (auto it = a.kv.find("row"); it != a.kv.end()) o.row = it->second;
    if (auto it = a.kv.find("col"); it != a.kv.end()) o.col = it->second;
    if (auto it = a.kv.find("direction"); it != a.kv.end()) o.direction = it->second;
    if (!o.position && !a.bare.empty()) o.position = a.bare.front();
    if (!o.position && !o.row && !o.col && !o.direction) {
      return usage("reposition [name=<n>] position=<kw> row=<tok> col=<tok> direction=<dir>");
    }
    if (auto it = a.kv.find("name"); it != a.kv.end()) return reg.reposition(it->second, o);
    return reg.reposition_current(o);
  });
  cmds.register_command("send", [&reg, now](const std::vector<std::string>& args) {
    if (args.size() < 2) return usage("send <name> <text>");
    std::string text;
    for (size_t i = 1; i < args.size(); ++i) {
      if (i > 1) text += " ";
      text += args[i];
    }
    return reg.send(args[0], unescape(text), now());
  });

  cmds.register_command("set send_delay", [&reg, &out](const std::vector<std::string>& args) {
    if (args.empty()) { out.message = "send_delay=" + std::to_string(reg.settings().send_delay_ms); return Status::ok(); }
    int ms = 0;
    if (!parse_int(args[0], ms) || ms < 0) return usage("set send_delay <ms>");
    reg.settings().send_delay_ms = ms;
    out.message = "send_delay=" + args[0];
    return Status::ok();
  });
  cmds.register_command("set lenient_position", [&reg, &out](const std::vector<std::string>& args) {
    bool& v = reg.settings().lenient_position;
    if (args.empty()) { v = !v; }
    else if (!parse_switch(args[0], v)) return usage("set lenient_position on|off");
    out.message = v ? "lenient_position on" : "lenient_position off";
    return Status::ok();
  });
  cmds.register_command("set session_fallback", [&reg, &out](const std::vector<std::string>& args) {
    bool& v = reg.settings().session_fallback;
    if (args.empty()) { v = !v; }
    else if (!parse_switch(args[0], v)) return usage("set session_fallback on|off");
    out.message = v ? "session_fallback on" : "session_fallback off";
    return Status::ok();
  });
  cmds.register_command("set session_prefix", [&reg, &out](const std::vector<std::string>& args) {
    if (args.empty()) { out.message = "session_prefix=" + reg.settings().session_prefix; return Status::ok(); }
    reg.settings().session_prefix = args[0];
    out.message = "session_prefix=" + args[0];
    return Status::ok();
  });

  cmds.register_command("help", [&cmds, &out](const std::vector<std::string>&) {
    std::string list;
    for (const auto& n : cmds.names()) {
      if (!list.empty()) list += ", ";
      list += n;
    }
    out.message = "commands: " + list;
    return Status::ok();
  });
  cmds.register_command("quit", [&out](const std::vector<std::string>&) {
    out.quit = true;
    return Status::ok();
  });
  cmds.register_command("q", [&out](const std::vector<std::string>&) {
    out.quit = true;
    return Status::ok();
  });
}

Status execute_command_line(const CommandRegistry& cmds, const std::string& line) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  if (cmd.empty()) return Status::ok();
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  Status st;
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string name = opt;
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      name = opt.substr(0, eq);
      value = opt.substr(eq + 1);
    }
    std::string composite = std::string("set ") + name;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!cmds.execute(composite, subargs, st)) {
      return Status::error(ErrorCode::ConfigurationError, "unknown option: " + name);
    }
    return st;
  }
  if (!cmds.execute(cmd, args, st)) return Status::error(ErrorCode::ConfigurationError, "unknown command: " + cmd);
  return st;
}

void run_rc_lines(const CommandRegistry& cmds, const std::vector<std::string>& lines, std::vector<std::string>& errors) {
  int lineno = 0;
  for (std::string s : lines) {
    ++lineno;
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    Status st = execute_command_line(cmds, s);
    if (!st) errors.push_back("line " + std::to_string(lineno) + ": " + st.describe());
  }
}

bool load_rc_file(const CommandRegistry& cmds, const std::filesystem::path& path, std::vector<std::string>& errors, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  run_rc_lines(cmds, lines, errors);
  return true;
}
