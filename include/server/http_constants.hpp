#pragma once

namespace sqlmcp::http {

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kHealthPath = "/health";

inline constexpr int kOk = 200;
inline constexpr int kAccepted = 202;
inline constexpr int kPayloadTooLarge = 413;

} // namespace sqlmcp::http
