#include "unit_parser.hpp"
#include <cassert>
#include <climits>
#include <optional>

static int parse_ok(const char* tok, int base, std::optional<int> cur) {
  int v = -12345;
  Status st = parse_unit(tok, base, cur, v);
  assert(st.is_ok());
  return v;
}

static ErrorCode parse_err(const char* tok) {
  int v = 7;
  Status st = parse_unit(tok, 100, 50, v);
  assert(!st.is_ok());
  assert(v == 7);  // output untouched on failure
  return st.code;
}

int main() {
  // percentage of base
  assert(parse_ok("50%", 100, std::nullopt) == 50);
  assert(parse_ok("50%", 100, 20) == 50);
  assert(parse_ok("80%", 120, std::nullopt) == 96);
  assert(parse_ok("60%", 40, std::nullopt) == 24);
  assert(parse_ok("0%", 100, std::nullopt) == 0);

  // relative percentage grows the current value
  assert(parse_ok("+10%", 100, 50) == 55);
  assert(parse_ok("+10%", 120, 96) == 105);

  // relative offset
  assert(parse_ok("+10", 100, 50) == 60);
  assert(parse_ok("+0", 100, 50) == 50);

  // relative without a current value resolves to base
  assert(parse_ok("+10", 100, std::nullopt) == 100);
  assert(parse_ok("+10%", 80, std::nullopt) == 80);

  // absolute
  assert(parse_ok("30", 100, 50) == 30);
  assert(parse_ok("-3", 100, 50) == -3);
  assert(parse_ok(" 42 ", 100, std::nullopt) == 42);

  // saturation instead of overflow
  assert(parse_ok("99999999999", 100, std::nullopt) == INT_MAX);
  assert(parse_ok("99999999999999999%", 120, std::nullopt) == INT_MAX);
  assert(parse_ok("+99999999999999999%", 100, 50) == INT_MAX);
  assert(parse_ok("+99999999999999999", 100, 50) == INT_MAX);
  assert(parse_ok("99999999999999999999999", 100, std::nullopt) == INT_MAX);
  assert(parse_ok("-99999999999999999999999", 100, std::nullopt) == INT_MIN);
  assert(parse_ok("2000000000%", 1000, std::nullopt) == INT_MAX);
  assert(parse_ok("200%", 1000000000, std::nullopt) == 2000000000);

  // malformed
  assert(parse_err("abc") == ErrorCode::InvalidUnitToken);
  assert(parse_err("") == ErrorCode::InvalidUnitToken);
  assert(parse_err("%") == ErrorCode::InvalidUnitToken);
  assert(parse_err("+") == ErrorCode::InvalidUnitToken);
  assert(parse_err("1.5") == ErrorCode::InvalidUnitToken);
  assert(parse_err("10%%") == ErrorCode::InvalidUnitToken);
  assert(parse_err("+-5") == ErrorCode::InvalidUnitToken);
  assert(parse_err("-5%") == ErrorCode::InvalidUnitToken);

  assert(is_valid_unit("80%"));
  assert(is_valid_unit("+5"));
  assert(!is_valid_unit("wide"));
  return 0;
}
