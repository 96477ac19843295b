#include "window_ops.hpp"
#include <algorithm>
#include <string>
#include "geometry.hpp"
#include "registry.hpp"
#include "surface.hpp"
#include "unit_parser.hpp"

static Status host_failed(const std::string& what, const std::string& msg) {
  return Status::error(ErrorCode::HostOperationFailed, msg.empty() ? what : what + ": " + msg);
}

static bool has_live_window(const Surface& s, const IHost& host) {
  return s.window() && host.window_valid(*s.window());
}

static Status resize_floating(Surface& s, IHost& host, const ResizeOpts& opts) {
  Rect cur;
  if (!host.get_window_rect(*s.window(), cur)) return host_failed("read window geometry", "");
  TermSize sz = host.screen_size();
  Rect next = cur;
  if (opts.width) {
    if (Status st = parse_unit(*opts.width, sz.cols, cur.width, next.width); !st) return st.context("width");
  }
  if (opts.height) {
    if (Status st = parse_unit(*opts.height, sz.rows, cur.height, next.height); !st) return st.context("height");
  }
  next.width = clamp_extent(next.width, sz.cols);
  next.height = clamp_extent(next.height, sz.rows);
  clamp_on_screen(next, sz.cols, sz.rows);
  std::string m;
  if (!host.set_window_rect(*s.window(), next, m)) return host_failed("resize floating window", m);
  return Status::ok();
}

static Status resize_split(Surface& s, IHost& host, const ResizeOpts& opts) {
  Rect cur;
  if (!host.get_window_rect(*s.window(), cur)) return host_failed("read window geometry", "");
  TermSize sz = host.screen_size();
  // parse both before touching the host
  int height = cur.height, width = cur.width;
  if (opts.height) {
    if (Status st = parse_unit(*opts.height, sz.rows, cur.height, height); !st) return st.context("height");
  }
  if (opts.width) {
    if (Status st = parse_unit(*opts.width, sz.cols, cur.width, width); !st) return st.context("width");
  }
  std::string m;
  if (opts.height && !host.set_window_height(*s.window(), clamp_extent(height, sz.rows), m)) {
    return host_failed("set split height", m);
  }
  if (opts.width && !host.set_window_width(*s.window(), clamp_extent(width, sz.cols), m)) {
    Status st = host_failed("set split width", m);
    // both dimensions change or neither does
    std::string restore_msg;
    if (opts.height && !host.set_window_height(*s.window(), cur.height, restore_msg)) {
      st.msg += "; height not restored: " + restore_msg;
    }
    return st;
  }
  return Status::ok();
}

Status resize_window(Surface& s, Registry& reg, const ResizeOpts& opts) {
  if (s.busy()) return Status::error(ErrorCode::ReentrantOperation, "resize while another operation on this surface is running");
  IHost& host = reg.host();
  if (!has_live_window(s, host)) return Status::ok();
  switch (s.mode()) {
    case PresentationMode::Floating: return resize_floating(s, host, opts);
    case PresentationMode::Split: return resize_split(s, host, opts);
    case PresentationMode::Tab: break;
  }
  return Status::ok();
}

static Status reposition_floating(Surface& s, Registry& reg, const RepositionOpts& opts) {
  IHost& host = reg.host();
  Rect cur;
  if (!host.get_window_rect(*s.window(), cur)) return host_failed("read window geometry", "");
  TermSize sz = host.screen_size();
  Rect next = cur;
  Anchor a = Anchor::Center;

  if (opts.position) {
    if (!parse_anchor(*opts.position, a) && !reg.settings().lenient_position) {
      return Status::error(ErrorCode::ConfigurationError, "unknown position '" + *opts.position + "'");
    }
    std::string margin_tok = "2%";
    if (const auto* f = std::get_if<FloatingConfig>(&s.last_config())) margin_tok = f->margin;
    int margin = 0;
    if (Status st = parse_unit(margin_tok, std::min(sz.cols, sz.rows), std::nullopt, margin); !st) return st.context("margin");
    Rect placed = place_at_anchor(a, cur.width, cur.height, std::max(0, margin), sz.cols, sz.rows);
    next.row = placed.row;
    next.col = placed.col;
  }
  if (opts.row) {
    if (Status st = parse_unit(*opts.row, sz.rows, next.row, next.row); !st) return st.context("row");
  }
  if (opts.col) {
    if (Status st = parse_unit(*opts.col, sz.cols, next.col, next.col); !st) return st.context("col");
  }
  clamp_on_screen(next, sz.cols, sz.rows);

  std::string m;
  if (!host.set_window_rect(*s.window(), next, m)) return host_failed("move floating window", m);
  if (opts.position) {
    if (auto* f = std::get_if<FloatingConfig>(&s.last_config())) {
      FloatingConfig updated = *f;
      updated.position = a;
      s.set_last_config(updated);
    }
  }
  return Status::ok();
}

static Status reposition_split(Surface& s, Registry& reg, const RepositionOpts& opts) {
  SplitDirection dir = SplitDirection::Bottom;
  if (opts.direction) {
    if (!parse_direction(*opts.direction, dir)) {
      return Status::error(ErrorCode::ConfigurationError, "unknown split direction '" + *opts.direction + "'");
    }
  } else if (opts.position) {
    if (!parse_split_position(*opts.position, dir)) {
      return Status::error(ErrorCode::ConfigurationError, "'" + *opts.position + "' is not a split position");
    }
  } else {
    return Status::ok();
  }

  IHost& host = reg.host();
  SplitConfig next;
  next.direction = dir;
  next.size = default_split_size(dir);
  const auto* prev = std::get_if<SplitConfig>(&s.last_config());
  Rect cur;
  if (prev && is_horizontal(prev->direction) == is_horizontal(dir) && host.get_window_rect(*s.window(), cur)) {
    next.size = std::to_string(is_horizontal(dir) ? cur.height : cur.width);
  }
  if (prev && prev->direction == dir) return Status::ok();
  return s.replace_split(next, reg);
}

Status reposition_window(Surface& s, Registry& reg, const RepositionOpts& opts) {
  if (s.busy()) return Status::error(ErrorCode::ReentrantOperation, "reposition while another operation on this surface is running");
  IHost& host = reg.host();
  if (!has_live_window(s, host)) return Status::ok();
  switch (s.mode()) {
    case PresentationMode::Floating: return reposition_floating(s, reg, opts);
    case PresentationMode::Split: return reposition_split(s, reg, opts);
    case PresentationMode::Tab: break;
  }
  return Status::ok();
}
