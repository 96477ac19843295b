#include "presentation.hpp"
#include <array>
#include <utility>
#include "unit_parser.hpp"

static constexpr std::array<std::pair<std::string_view, Anchor>, 9> kAnchors{{
  {"center", Anchor::Center},
  {"top-left", Anchor::TopLeft},
  {"top-center", Anchor::TopCenter},
  {"top-right", Anchor::TopRight},
  {"bottom-left", Anchor::BottomLeft},
  {"bottom-center", Anchor::BottomCenter},
  {"bottom-right", Anchor::BottomRight},
  {"left-center", Anchor::LeftCenter},
  {"right-center", Anchor::RightCenter},
}};

static constexpr std::array<std::pair<std::string_view, SplitDirection>, 4> kDirections{{
  {"top", SplitDirection::Top},
  {"bottom", SplitDirection::Bottom},
  {"left", SplitDirection::Left},
  {"right", SplitDirection::Right},
}};

PresentationMode mode_of(const PresentationConfig& cfg) {
  if (std::holds_alternative<SplitConfig>(cfg)) return PresentationMode::Split;
  if (std::holds_alternative<TabConfig>(cfg)) return PresentationMode::Tab;
  return PresentationMode::Floating;
}

std::string_view mode_name(PresentationMode m) {
  switch (m) {
    case PresentationMode::Floating: return "floating";
    case PresentationMode::Split: return "split";
    case PresentationMode::Tab: return "tab";
  }
  return "floating";
}

bool parse_anchor(std::string_view s, Anchor& out) {
  for (const auto& [name, a] : kAnchors) {
    if (name == s) { out = a; return true; }
  }
  return false;
}

std::string_view anchor_name(Anchor a) {
  for (const auto& [name, v] : kAnchors) if (v == a) return name;
  return "center";
}

bool parse_direction(std::string_view s, SplitDirection& out) {
  for (const auto& [name, d] : kDirections) {
    if (name == s) { out = d; return true; }
  }
  return false;
}

std::string_view direction_name(SplitDirection d) {
  for (const auto& [name, v] : kDirections) if (v == d) return name;
  return "bottom";
}

bool is_horizontal(SplitDirection d) {
  return d == SplitDirection::Top || d == SplitDirection::Bottom;
}

bool parse_split_position(std::string_view s, SplitDirection& out) {
  constexpr std::string_view prefix = "split-";
  if (s.substr(0, prefix.size()) != prefix) return false;
  return parse_direction(s.substr(prefix.size()), out);
}

std::string default_split_size(SplitDirection d) {
  return is_horizontal(d) ? "40%" : "30%";
}

static Status check_token(const char* field, const std::string& tok) {
  if (is_valid_unit(tok)) return Status::ok();
  return Status::error(ErrorCode::InvalidUnitToken, std::string(field) + ": invalid unit token '" + tok + "'");
}

static Status resolve_split(const WinOpts& opts, SplitDirection dir, PresentationConfig& out) {
  SplitConfig sc;
  sc.direction = dir;
  if (opts.size) sc.size = *opts.size;
  else if (is_horizontal(dir) && opts.height) sc.size = *opts.height;
  else if (!is_horizontal(dir) && opts.width) sc.size = *opts.width;
  else sc.size = default_split_size(dir);
  if (Status st = check_token("size", sc.size); !st) return st;
  out = sc;
  return Status::ok();
}

Status resolve_presentation(const WinOpts& opts, bool lenient, PresentationConfig& out) {
  if (opts.size && (opts.width || opts.height)) {
    return Status::error(ErrorCode::ConfigurationError, "'size' and 'width'/'height' are mutually exclusive");
  }
  std::string type = opts.type.value_or("");
  if (!type.empty() && type != "floating" && type != "split" && type != "tab") {
    return Status::error(ErrorCode::ConfigurationError, "unknown window type '" + type + "'");
  }

  if (type == "tab") {
    out = TabConfig{};
    return Status::ok();
  }

  SplitDirection dir = SplitDirection::Bottom;
  SplitDirection given = SplitDirection::Bottom;
  if (opts.direction && !parse_direction(*opts.direction, given) && type != "floating") {
    return Status::error(ErrorCode::ConfigurationError, "unknown split direction '" + *opts.direction + "'");
  }
  if (opts.position && parse_split_position(*opts.position, dir)) {
    if (type == "floating") {
      return Status::error(ErrorCode::ConfigurationError, "position '" + *opts.position + "' is a split position");
    }
    if (opts.direction && given != dir) {
      return Status::error(ErrorCode::ConfigurationError, "direction '" + *opts.direction +
                                                              "' conflicts with position '" + *opts.position + "'");
    }
    return resolve_split(opts, dir, out);
  }
  if (type == "split" || (type.empty() && opts.direction)) {
    Anchor anchor;
    if (opts.position && parse_anchor(*opts.position, anchor)) {
      return Status::error(ErrorCode::ConfigurationError, "position '" + *opts.position + "' is a floating anchor");
    }
    if (opts.position && !lenient) {
      return Status::error(ErrorCode::ConfigurationError, "unknown position '" + *opts.position + "'");
    }
    return resolve_split(opts, opts.direction ? given : dir, out);
  }

  FloatingConfig fc;
  if (opts.position && !parse_anchor(*opts.position, fc.position)) {
    if (!lenient) {
      return Status::error(ErrorCode::ConfigurationError, "unknown position '" + *opts.position + "'");
    }
    fc.position = Anchor::Center;
  }
  if (opts.size) {
    fc.width = *opts.size;
    fc.height = *opts.size;
  }
  if (opts.width) fc.width = *opts.width;
  if (opts.height) fc.height = *opts.height;
  if (opts.margin) fc.margin = *opts.margin;
  if (Status st = check_token("width", fc.width); !st) return st;
  if (Status st = check_token("height", fc.height); !st) return st;
  if (Status st = check_token("margin", fc.margin); !st) return st;
  out = fc;
  return Status::ok();
}

std::string describe(const PresentationConfig& cfg) {
  if (const auto* f = std::get_if<FloatingConfig>(&cfg)) {
    return "floating " + std::string(anchor_name(f->position)) + " " + f->width + "x" + f->height;
  }
  if (const auto* s = std::get_if<SplitConfig>(&cfg)) {
    return "split-" + std::string(direction_name(s->direction)) + " " + s->size;
  }
  return "tab";
}
