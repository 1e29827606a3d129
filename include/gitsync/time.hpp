#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace gitsync::timeutil {

// Format ±HHMM from minutes (e.g., +180 -> "+0300", -420 -> "-0700")
auto tz_offset_string(int minutes) -> std::string;

// Build "Name <email> 1714412345 +0300"
auto make_signature(std::string_view name, std::string_view email, std::int64_t when,
                    int tz_minutes) -> std::string;

// Signature used for every synthetic commit: constant identity at the epoch, UTC.
auto sync_signature() -> std::string;

} // namespace gitsync::timeutil
