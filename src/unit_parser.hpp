#pragma once
/*
 * UnitParser
 *
 * Purpose: turn size/position tokens into cells.
 * Forms: "30" absolute, "50%" of base, "+10%" grow current, "+10" offset current.
 * Note: pure; a relative token without a current value resolves to base.
 */
#include <optional>
#include <string_view>
#include "status.hpp"

Status parse_unit(std::string_view token, int base, std::optional<int> current, int& out);

// syntax check only (used when validating configs before touching the host)
bool is_valid_unit(std::string_view token);
