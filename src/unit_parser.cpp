#include "unit_parser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <string>

static bool all_digits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

// digit strings past the long long range clamp to its limits
static bool to_int(std::string_view s, long long& v) {
  const char* b = s.data();
  const char* e = s.data() + s.size();
  auto [p, ec] = std::from_chars(b, e, v);
  if (ec == std::errc::result_out_of_range) {
    v = s.front() == '-' ? std::numeric_limits<long long>::min() : std::numeric_limits<long long>::max();
    return p == e;
  }
  return ec == std::errc() && p == e;
}

static int saturate(long long v) {
  if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
  if (v < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
  return static_cast<int>(v);
}

// v * n / 100 for n >= 0, pinned to the int range once it leaves it
static long long percent_of(long long v, long long n) {
  const long long imax = std::numeric_limits<int>::max();
  if (v == 0) return 0;
  long long mag = v < 0 ? -v : v;
  if (n / 100 > imax / mag) return v < 0 ? -imax - 1 : imax;
  return v * n / 100;
}

static Status bad_token(std::string_view token) {
  return Status::error(ErrorCode::InvalidUnitToken, "invalid unit token '" + std::string(token) + "'");
}

Status parse_unit(std::string_view token, int base, std::optional<int> current, int& out) {
  std::string_view t = token;
  while (!t.empty() && std::isspace(static_cast<unsigned char>(t.front()))) t.remove_prefix(1);
  while (!t.empty() && std::isspace(static_cast<unsigned char>(t.back()))) t.remove_suffix(1);
  if (t.empty()) return bad_token(token);

  bool relative = t.front() == '+';
  bool percent = t.back() == '%';
  std::string_view digits = t;
  if (relative) digits.remove_prefix(1);
  if (percent) digits.remove_suffix(1);

  if (relative || percent) {
    long long n = 0;
    if (!all_digits(digits) || !to_int(digits, n)) return bad_token(token);
    if (relative && !current) { out = base; return Status::ok(); }
    // any offset this large already saturates; keeps the sums below in range
    n = std::min<long long>(n, 4LL * std::numeric_limits<int>::max());
    if (relative && percent) {
      out = saturate(*current + percent_of(*current, n));
    } else if (relative) {
      out = saturate(static_cast<long long>(*current) + n);
    } else {
      out = saturate(percent_of(base, n));
    }
    return Status::ok();
  }

  // plain number, sign allowed
  std::string_view body = t;
  if (body.front() == '-') body.remove_prefix(1);
  long long v = 0;
  if (!all_digits(body) || !to_int(t, v)) return bad_token(token);
  out = saturate(v);
  return Status::ok();
}

bool is_valid_unit(std::string_view token) {
  int tmp = 0;
  return parse_unit(token, 100, 100, tmp).is_ok();
}
