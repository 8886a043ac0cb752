#include <cgmlst/version_resolver.hpp>

#include <array>
#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cgmlst {

  namespace {

    bool
    is_leap_year(int32_t year) {
      return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
    }

    uint8_t
    days_in_month(int32_t year, uint8_t month) {
      static constexpr uint8_t table[] = {0,  31, 28, 31, 30, 31, 30,
                                          31, 31, 30, 31, 30, 31};
      if (month < 1 || month > 12) {
        throw std::invalid_argument("days_in_month: invalid month");
      }
      if (month == 2 && is_leap_year(year)) { return 29; }
      return table[month];
    }

    bool
    valid_fields(int32_t year, int month, int day, int hour, int minute) {
      if (year < 1 || month < 1 || month > 12) return false;
      if (day < 1 || day > days_in_month(year, static_cast<uint8_t>(month)))
        return false;
      return hour >= 0 && hour <= 23 && minute >= 0 && minute <= 59;
    }

    void
    append_padded(std::string& out, int value, int width) {
      auto digits = std::to_string(value);
      for (auto i = static_cast<int>(digits.size()); i < width; ++i)
        out += '0';
      out += digits;
    }

    std::vector<std::string>
    tokenize(std::string_view text) {
      std::vector<std::string> tokens;
      std::string current;
      for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
          if (!current.empty()) tokens.push_back(std::move(current));
          current.clear();
          continue;
        }
        current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      if (!current.empty()) tokens.push_back(std::move(current));
      return tokens;
    }

    std::optional<int>
    parse_number(std::string_view s, std::size_t min_digits,
                 std::size_t max_digits) {
      if (s.size() < min_digits || s.size() > max_digits) return std::nullopt;
      int value = 0;
      for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        value = value * 10 + (c - '0');
      }
      return value;
    }

    std::optional<int>
    parse_month(std::string token) {
      static constexpr std::array<std::string_view, 12> names = {
          "january", "february", "march",     "april",   "may",      "june",
          "july",    "august",   "september", "october", "november", "december"};

      if (token.ends_with('.')) token.pop_back();
      if (token == "sept") token = "sep";
      if (token.size() < 3) return std::nullopt;
      for (std::size_t i = 0; i < names.size(); ++i) {
        if (token == names[i] || token == names[i].substr(0, 3))
          return static_cast<int>(i) + 1;
      }
      return std::nullopt;
    }

    enum class meridiem { none, am, pm };

    std::optional<meridiem>
    parse_meridiem(std::string_view token) {
      if (token == "a.m." || token == "am" || token == "a.m") return meridiem::am;
      if (token == "p.m." || token == "pm" || token == "p.m") return meridiem::pm;
      return std::nullopt;
    }

    struct clock_time {
      int hour;
      int minute;
    };

    // "H:MM", "H" or "H:MMam" style, with an optional meridiem token after.
    std::optional<clock_time>
    parse_clock(std::vector<std::string>::const_iterator it,
                std::vector<std::string>::const_iterator end) {
      if (it == end) return std::nullopt;
      std::string token = *it++;

      if (token == "noon" || token == "midnight") {
        if (it != end) return std::nullopt;
        return token == "noon" ? clock_time{12, 0} : clock_time{0, 0};
      }

      auto mer = meridiem::none;
      for (std::string_view suffix : {"a.m.", "p.m.", "am", "pm"}) {
        if (token.size() > suffix.size() && token.ends_with(suffix)) {
          mer = *parse_meridiem(suffix);
          token.erase(token.size() - suffix.size());
          break;
        }
      }
      if (mer == meridiem::none && it != end) {
        auto m = parse_meridiem(*it++);
        if (!m) return std::nullopt;
        mer = *m;
      }
      if (it != end) return std::nullopt;

      std::optional<int> hour;
      std::optional<int> minute = 0;
      auto colon = token.find(':');
      if (colon == std::string::npos) {
        // A bare hour only appears in the a.m./p.m. rendering.
        if (mer == meridiem::none) return std::nullopt;
        hour = parse_number(token, 1, 2);
      } else {
        hour = parse_number(std::string_view(token).substr(0, colon), 1, 2);
        minute = parse_number(std::string_view(token).substr(colon + 1), 2, 2);
      }
      if (!hour || !minute) return std::nullopt;

      if (mer != meridiem::none) {
        if (*hour < 1 || *hour > 12) return std::nullopt;
        if (*hour == 12) *hour = 0;
        if (mer == meridiem::pm) *hour += 12;
      }
      return clock_time{*hour, *minute};
    }

  } // namespace

  change_time::change_time(int32_t year, uint8_t month, uint8_t day,
                           uint8_t hour, uint8_t minute)
      : year_(year), month_(month), day_(day), hour_(hour), minute_(minute) {
    if (!valid_fields(year, month, day, hour, minute)) {
      throw std::invalid_argument("change_time: invalid date or time");
    }
  }

  int32_t
  change_time::year() const {
    return year_;
  }

  uint8_t
  change_time::month() const {
    return month_;
  }

  uint8_t
  change_time::day() const {
    return day_;
  }

  uint8_t
  change_time::hour() const {
    return hour_;
  }

  uint8_t
  change_time::minute() const {
    return minute_;
  }

  std::string
  change_time::to_string() const {
    std::string out;
    out.reserve(16);
    append_padded(out, year_, 4);
    out += '-';
    append_padded(out, month_, 2);
    out += '-';
    append_padded(out, day_, 2);
    out += '-';
    append_padded(out, hour_, 2);
    out += '-';
    append_padded(out, minute_, 2);
    return out;
  }

  std::optional<change_time>
  parse_last_change(std::string_view text) {
    auto tokens = tokenize(text);
    if (tokens.size() < 4) return std::nullopt;

    auto month = parse_month(tokens[0]);
    auto day = parse_number(tokens[1], 1, 2);
    auto year = parse_number(tokens[2], 4, 4);
    if (!month || !day || !year) return std::nullopt;

    auto clock = parse_clock(tokens.cbegin() + 3, tokens.cend());
    if (!clock) return std::nullopt;

    if (!valid_fields(*year, *month, *day, clock->hour, clock->minute))
      return std::nullopt;

    return change_time(*year, static_cast<uint8_t>(*month),
                       static_cast<uint8_t>(*day),
                       static_cast<uint8_t>(clock->hour),
                       static_cast<uint8_t>(clock->minute));
  }

  version_info
  resolve_version(const scheme_detail& detail) {
    version_info info;
    info.name = detail.get("Name");
    info.version = detail.get("Version");
    info.last_change_raw = detail.get("Last Change");
    if (info.last_change_raw) {
      info.last_change = parse_last_change(*info.last_change_raw);
    }
    return info;
  }

} // namespace cgmlst
