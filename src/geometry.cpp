#include "geometry.hpp"
#include <algorithm>
#include "unit_parser.hpp"

int clamp_extent(int v, int screen_dim) {
  int hi = std::max(1, screen_dim - kScreenPadding);
  return std::clamp(v, 1, hi);
}

void clamp_on_screen(Rect& r, int screen_width, int screen_height) {
  r.row = std::max(0, std::min(r.row, screen_height - r.height));
  r.col = std::max(0, std::min(r.col, screen_width - r.width));
}

Rect place_at_anchor(Anchor a, int width, int height, int margin, int screen_width, int screen_height) {
  const int centered_row = (screen_height - height) / 2;
  const int centered_col = (screen_width - width) / 2;
  const int top = margin;
  const int bottom = screen_height - height - margin;
  const int left = margin;
  const int right = screen_width - width - margin;

  Rect r;
  r.width = width;
  r.height = height;
  switch (a) {
    case Anchor::Center:       r.row = centered_row; r.col = centered_col; break;
    case Anchor::TopLeft:      r.row = top;          r.col = left;         break;
    case Anchor::TopCenter:    r.row = top;          r.col = centered_col; break;
    case Anchor::TopRight:     r.row = top;          r.col = right;        break;
    case Anchor::BottomLeft:   r.row = bottom;       r.col = left;         break;
    case Anchor::BottomCenter: r.row = bottom;       r.col = centered_col; break;
    case Anchor::BottomRight:  r.row = bottom;       r.col = right;        break;
    case Anchor::LeftCenter:   r.row = centered_row; r.col = left;         break;
    case Anchor::RightCenter:  r.row = centered_row; r.col = right;        break;
  }
  clamp_on_screen(r, screen_width, screen_height);
  return r;
}

Status compute_floating(const FloatingConfig& cfg, int screen_width, int screen_height, Rect& out) {
  int width = 0, height = 0, margin = 0;
  if (Status st = parse_unit(cfg.width, screen_width, std::nullopt, width); !st) return st.context("width");
  if (Status st = parse_unit(cfg.height, screen_height, std::nullopt, height); !st) return st.context("height");
  if (Status st = parse_unit(cfg.margin, std::min(screen_width, screen_height), std::nullopt, margin); !st) {
    return st.context("margin");
  }
  width = clamp_extent(width, screen_width);
  height = clamp_extent(height, screen_height);
  margin = std::max(0, margin);
  out = place_at_anchor(cfg.position, width, height, margin, screen_width, screen_height);
  return Status::ok();
}

Status compute_split(SplitDirection dir, const std::string& size, int screen_width, int screen_height, SplitGeometry& out) {
  out.is_horizontal = is_horizontal(dir);
  int base = out.is_horizontal ? screen_height : screen_width;
  int v = 0;
  if (Status st = parse_unit(size, base, std::nullopt, v); !st) return st.context("size");
  out.absolute_size = clamp_extent(v, base);
  return Status::ok();
}
