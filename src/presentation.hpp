#pragma once
/*
 * Presentation
 *
 * Purpose: how a surface is shown (floating / split / tab) and the defaulting
 * of raw user options into one of those configs.
 * Design: tagged union resolved once at the API boundary; the lifecycle code
 * never sees a half-filled option table.
 */
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include "status.hpp"

enum class PresentationMode { Floating, Split, Tab };

enum class Anchor {
  Center,
  TopLeft, TopCenter, TopRight,
  BottomLeft, BottomCenter, BottomRight,
  LeftCenter, RightCenter,
};

enum class SplitDirection { Top, Bottom, Left, Right };

struct FloatingConfig {
  Anchor position = Anchor::TopCenter;
  std::string width = "80%";
  std::string height = "80%";
  std::string margin = "5%";
};

struct SplitConfig {
  SplitDirection direction = SplitDirection::Bottom;
  std::string size = "40%";
};

struct TabConfig {};

using PresentationConfig = std::variant<FloatingConfig, SplitConfig, TabConfig>;

// raw options as typed by the user; every field optional
struct WinOpts {
  std::optional<std::string> type;      // floating | split | tab
  std::optional<std::string> position;  // anchor keyword or split-<dir>
  std::optional<std::string> width;
  std::optional<std::string> height;
  std::optional<std::string> margin;
  std::optional<std::string> size;
  std::optional<std::string> direction;
};

PresentationMode mode_of(const PresentationConfig& cfg);
std::string_view mode_name(PresentationMode m);

bool parse_anchor(std::string_view s, Anchor& out);
std::string_view anchor_name(Anchor a);
bool parse_direction(std::string_view s, SplitDirection& out);
std::string_view direction_name(SplitDirection d);
bool is_horizontal(SplitDirection d);
// "split-bottom" -> Bottom
bool parse_split_position(std::string_view s, SplitDirection& out);

// default extent of a split when none was given: 40% for top/bottom, 30% for left/right
std::string default_split_size(SplitDirection d);

// lenient: unknown anchor keywords fall back to center instead of failing
Status resolve_presentation(const WinOpts& opts, bool lenient, PresentationConfig& out);

std::string describe(const PresentationConfig& cfg);
