#include "gitsync/time.hpp"

#include "gitsync/consts.hpp"

#include <cstdio>

namespace gitsync::timeutil {

std::string tz_offset_string(int minutes) {
  char buf[8];
  char sign = minutes >= 0 ? '+' : '-';
  int m = minutes >= 0 ? minutes : -minutes;
  int hh = m / 60;
  int mm = m % 60;
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", sign, hh, mm);
  return std::string(buf);
}

std::string make_signature(std::string_view name, std::string_view email, std::int64_t when,
                           int tz_minutes) {
  std::string sig(name);
  sig += " <";
  sig += email;
  sig += "> ";
  sig += std::to_string(static_cast<long long>(when));
  sig += ' ';
  sig += tz_offset_string(tz_minutes);
  return sig;
}

std::string sync_signature() {
  return make_signature(consts::kSyncName, consts::kSyncEmail, consts::kSyncTime, 0);
}

} // namespace gitsync::timeutil
