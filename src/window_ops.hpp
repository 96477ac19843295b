#pragma once
/*
 * WindowOps
 *
 * Purpose: resize / reposition a live surface window.
 * Floating: one atomic rect update, clamped on screen.
 * Split: per-dimension setters; a direction change recreates the split.
 * Note: no-op when the surface has no window; tab windows are not resized.
 */
#include <optional>
#include <string>
#include "status.hpp"

class Surface;
class Registry;

struct ResizeOpts {
  std::optional<std::string> width;
  std::optional<std::string> height;
};

struct RepositionOpts {
  std::optional<std::string> position;   // anchor keyword, or split-<dir> for splits
  std::optional<std::string> row;
  std::optional<std::string> col;
  std::optional<std::string> direction;  // split only
};

Status resize_window(Surface& s, Registry& reg, const ResizeOpts& opts);
Status reposition_window(Surface& s, Registry& reg, const RepositionOpts& opts);
