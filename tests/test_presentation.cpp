#include "presentation.hpp"
#include <cassert>
#include <string>
#include <variant>

static PresentationConfig resolve(const WinOpts& o, bool lenient = false) {
  PresentationConfig cfg;
  Status st = resolve_presentation(o, lenient, cfg);
  assert(st.is_ok());
  return cfg;
}

static ErrorCode resolve_err(const WinOpts& o, bool lenient = false) {
  PresentationConfig cfg;
  Status st = resolve_presentation(o, lenient, cfg);
  assert(!st.is_ok());
  return st.code;
}

static void test_floating_defaults() {
  PresentationConfig cfg = resolve(WinOpts{});
  const auto* f = std::get_if<FloatingConfig>(&cfg);
  assert(f);
  assert(f->position == Anchor::TopCenter);
  assert(f->width == "80%");
  assert(f->height == "80%");
  assert(f->margin == "5%");
  assert(mode_of(cfg) == PresentationMode::Floating);
}

static void test_floating_overrides() {
  WinOpts o;
  o.position = "center";
  o.width = "80%";
  o.height = "60%";
  PresentationConfig cfg = resolve(o);
  const auto& f = std::get<FloatingConfig>(cfg);
  assert(f.position == Anchor::Center);
  assert(f.width == "80%");
  assert(f.height == "60%");
  assert(f.margin == "5%");

  WinOpts s;
  s.size = "50%";
  const FloatingConfig g = std::get<FloatingConfig>(resolve(s));
  assert(g.width == "50%" && g.height == "50%");
}

static void test_split_from_position() {
  WinOpts o;
  o.position = "split-right";
  PresentationConfig cfg = resolve(o);
  const auto& s = std::get<SplitConfig>(cfg);
  assert(s.direction == SplitDirection::Right);
  assert(s.size == "30%");

  WinOpts b;
  b.position = "split-bottom";
  b.height = "12";
  const SplitConfig sb = std::get<SplitConfig>(resolve(b));
  assert(sb.direction == SplitDirection::Bottom);
  assert(sb.size == "12");
}

static void test_split_position_agrees_with_direction() {
  WinOpts o;
  o.position = "split-left";
  o.direction = "left";
  o.type = "split";
  const SplitConfig s = std::get<SplitConfig>(resolve(o));
  assert(s.direction == SplitDirection::Left);
  assert(s.size == "30%");

  // an unknown position on a split is dropped when lenient
  WinOpts lax;
  lax.type = "split";
  lax.direction = "top";
  lax.position = "middle";
  assert(std::get<SplitConfig>(resolve(lax, true)).direction == SplitDirection::Top);
}

static void test_split_from_type_and_direction() {
  WinOpts o;
  o.type = "split";
  const SplitConfig s = std::get<SplitConfig>(resolve(o));
  assert(s.direction == SplitDirection::Bottom);
  assert(s.size == "40%");

  WinOpts d;
  d.direction = "top";
  d.size = "25%";
  const SplitConfig t = std::get<SplitConfig>(resolve(d));
  assert(t.direction == SplitDirection::Top);
  assert(t.size == "25%");

  WinOpts l;
  l.type = "split";
  l.direction = "left";
  l.width = "+5";
  const SplitConfig lw = std::get<SplitConfig>(resolve(l));
  assert(lw.size == "+5");
}

static void test_tab() {
  WinOpts o;
  o.type = "tab";
  o.width = "10";
  PresentationConfig cfg = resolve(o);
  assert(std::holds_alternative<TabConfig>(cfg));
  assert(mode_of(cfg) == PresentationMode::Tab);
}

static void test_errors() {
  WinOpts both;
  both.size = "50%";
  both.width = "10";
  assert(resolve_err(both) == ErrorCode::ConfigurationError);

  WinOpts bad_type;
  bad_type.type = "popup";
  assert(resolve_err(bad_type) == ErrorCode::ConfigurationError);

  WinOpts bad_anchor;
  bad_anchor.position = "middle";
  assert(resolve_err(bad_anchor) == ErrorCode::ConfigurationError);

  WinOpts bad_dir;
  bad_dir.type = "split";
  bad_dir.direction = "up";
  assert(resolve_err(bad_dir) == ErrorCode::ConfigurationError);

  WinOpts split_as_float;
  split_as_float.type = "floating";
  split_as_float.position = "split-left";
  assert(resolve_err(split_as_float) == ErrorCode::ConfigurationError);

  WinOpts anchor_on_split;
  anchor_on_split.type = "split";
  anchor_on_split.position = "center";
  assert(resolve_err(anchor_on_split) == ErrorCode::ConfigurationError);

  WinOpts anchor_with_direction;
  anchor_with_direction.direction = "left";
  anchor_with_direction.position = "top-left";
  assert(resolve_err(anchor_with_direction) == ErrorCode::ConfigurationError);

  WinOpts unknown_on_split;
  unknown_on_split.type = "split";
  unknown_on_split.position = "middle";
  assert(resolve_err(unknown_on_split) == ErrorCode::ConfigurationError);

  WinOpts conflicting;
  conflicting.position = "split-bottom";
  conflicting.direction = "left";
  assert(resolve_err(conflicting) == ErrorCode::ConfigurationError);

  WinOpts bad_unit;
  bad_unit.width = "lots";
  assert(resolve_err(bad_unit) == ErrorCode::InvalidUnitToken);

  WinOpts bad_size;
  bad_size.position = "split-top";
  bad_size.size = "1x";
  assert(resolve_err(bad_size) == ErrorCode::InvalidUnitToken);
}

static void test_lenient_anchor() {
  WinOpts o;
  o.position = "middle";
  const FloatingConfig f = std::get<FloatingConfig>(resolve(o, true));
  assert(f.position == Anchor::Center);
}

static void test_names() {
  Anchor a;
  assert(parse_anchor("bottom-right", a) && a == Anchor::BottomRight);
  assert(anchor_name(Anchor::LeftCenter) == "left-center");
  SplitDirection d;
  assert(parse_split_position("split-top", d) && d == SplitDirection::Top);
  assert(!parse_split_position("top", d));
  assert(!parse_split_position("split-", d));
  assert(default_split_size(SplitDirection::Top) == "40%");
  assert(default_split_size(SplitDirection::Left) == "30%");
  assert(describe(PresentationConfig{SplitConfig{}}) == "split-bottom 40%");
  assert(describe(PresentationConfig{TabConfig{}}) == "tab");
}

int main() {
  test_floating_defaults();
  test_floating_overrides();
  test_split_from_position();
  test_split_from_type_and_direction();
  test_split_position_agrees_with_direction();
  test_tab();
  test_errors();
  test_lenient_anchor();
  test_names();
  return 0;
}
