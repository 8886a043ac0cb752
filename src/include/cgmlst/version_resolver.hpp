#pragma once

#include <cgmlst/scheme_detail.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace cgmlst {

  // Minute-resolution timestamp as rendered on the scheme pages.
  class change_time {
    int32_t year_ = 1970;
    uint8_t month_ = 1;
    uint8_t day_ = 1;
    uint8_t hour_ = 0;
    uint8_t minute_ = 0;

  public:
    change_time() = default;
    // Throws std::invalid_argument for an impossible calendar date or time.
    change_time(int32_t year, uint8_t month, uint8_t day, uint8_t hour,
                uint8_t minute);

    int32_t
    year() const;
    uint8_t
    month() const;
    uint8_t
    day() const;
    uint8_t
    hour() const;
    uint8_t
    minute() const;

    // YYYY-MM-DD-HH-MM
    std::string
    to_string() const;

    bool
    operator==(const change_time& other) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const change_time& t) {
      return os << t.to_string();
    }
  };

  // Accepts "Month D, YYYY H:MM" in the site's 24-hour or a.m./p.m. forms.
  // Returns nullopt for anything else.
  std::optional<change_time>
  parse_last_change(std::string_view text);

  struct version_info {
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> last_change_raw;
    std::optional<change_time> last_change;
  };

  // Never throws for missing or malformed fields.
  version_info
  resolve_version(const scheme_detail& detail);

} // namespace cgmlst
