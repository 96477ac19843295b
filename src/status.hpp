#pragma once
/*
 * Status
 *
 * Purpose: error code + message returned by every surface operation.
 * Usage: `Status st = reg.open(...); if (!st) message = st.describe();`
 */
#include <string>
#include <string_view>

enum class ErrorCode {
  None,
  ConfigurationError,
  InvalidUnitToken,
  HostOperationFailed,
  SessionBackendUnavailable,
  SurfaceNotFound,
  ReentrantOperation,
};

inline std::string_view error_name(ErrorCode c) {
  switch (c) {
    case ErrorCode::None: return "Ok";
    case ErrorCode::ConfigurationError: return "ConfigurationError";
    case ErrorCode::InvalidUnitToken: return "InvalidUnitToken";
    case ErrorCode::HostOperationFailed: return "HostOperationFailed";
    case ErrorCode::SessionBackendUnavailable: return "SessionBackendUnavailable";
    case ErrorCode::SurfaceNotFound: return "SurfaceNotFound";
    case ErrorCode::ReentrantOperation: return "ReentrantOperation";
  }
  return "Unknown";
}

struct Status {
  ErrorCode code = ErrorCode::None;
  std::string msg;

  static Status ok() { return {}; }
  static Status error(ErrorCode c, std::string m) { return Status{c, std::move(m)}; }

  bool is_ok() const { return code == ErrorCode::None; }
  explicit operator bool() const { return is_ok(); }

  // prefix the message with "<what>: ", keeps the code
  Status& context(const std::string& what) {
    if (!is_ok()) msg = msg.empty() ? what : what + ": " + msg;
    return *this;
  }

  std::string describe() const {
    if (is_ok()) return msg;
    return std::string(error_name(code)) + ": " + msg;
  }
};
