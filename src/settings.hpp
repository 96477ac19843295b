#pragma once
/*
 * Settings
 *
 * Purpose: process-wide knobs, set from defaults then from `set ...` lines
 * in the rc file.
 */
#include <functional>
#include <string>

class Surface;
class Registry;

struct Settings {
  int send_delay_ms = 100;          // wait before bytes reach a freshly opened process
  bool lenient_position = false;    // unknown anchor keywords fall back to center
  bool session_fallback = false;    // run the raw command when the session backend is missing
  std::string session_prefix = "mfling-";
  std::function<void(Surface&, Registry&)> always;  // after every show, before the surface's own setup
};
