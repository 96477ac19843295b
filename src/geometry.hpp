#pragma once
/*
 * Geometry
 *
 * Purpose: resolve floating placement and split extents into screen cells.
 * Constraint: results always fit the screen (width <= cols - 2, height <= rows - 2,
 * rect fully on screen). Advisory only: the host applies the rect.
 */
#include <string>
#include "presentation.hpp"
#include "status.hpp"

constexpr int kScreenPadding = 2;

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

inline bool operator==(const Rect& a, const Rect& b) {
  return a.row == b.row && a.col == b.col && a.height == b.height && a.width == b.width;
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

struct SplitGeometry {
  bool is_horizontal = true;  // top/bottom: extent counts rows
  int absolute_size = 0;
};

Status compute_floating(const FloatingConfig& cfg, int screen_width, int screen_height, Rect& out);
Status compute_split(SplitDirection dir, const std::string& size, int screen_width, int screen_height, SplitGeometry& out);

// place an already-sized rect at an anchor
Rect place_at_anchor(Anchor a, int width, int height, int margin, int screen_width, int screen_height);

// keep width/height within the padded screen, at least one cell
int clamp_extent(int v, int screen_dim);
// keep rect on screen without changing its size
void clamp_on_screen(Rect& r, int screen_width, int screen_height);
