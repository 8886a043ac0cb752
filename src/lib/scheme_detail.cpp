#include <cgmlst/scheme_detail.hpp>

#include <cgmlst/errors.hpp>

#include <algorithm>
#include <string>

namespace cgmlst {

  void
  scheme_detail::add(const std::string& key, const std::string& value) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const entry& e) { return e.first == key; });
    if (it == entries_.end()) {
      entries_.emplace_back(key, value);
      return;
    }
    it->second += "; ";
    it->second += value;
  }

  std::optional<std::string>
  scheme_detail::get(std::string_view key) const {
    for (const auto& [k, v] : entries_) {
      if (k == key) return v;
    }
    return std::nullopt;
  }

  bool
  scheme_detail::contains(std::string_view key) const {
    return get(key).has_value();
  }

  std::size_t
  scheme_detail::size() const {
    return entries_.size();
  }

  bool
  scheme_detail::empty() const {
    return entries_.empty();
  }

  const std::vector<scheme_detail::entry>&
  scheme_detail::entries() const {
    return entries_;
  }

  std::string
  scheme_detail_url(std::string_view id) {
    return "https://www.cgmlst.org/ncs/scheme/scheme/" + std::string(id) + "/";
  }

  scheme_detail
  fold_detail_rows(const std::vector<table_row>& rows) {
    scheme_detail detail;
    std::string current;
    for (const auto& row : rows) {
      if (row.empty()) continue;
      if (!row[0].empty()) current = row[0];
      // A continuation row before any label has nothing to attach to.
      if (current.empty()) continue;
      detail.add(current, row.size() > 1 ? row[1] : std::string());
    }
    return detail;
  }

  scheme_detail
  parse_scheme_detail_page(std::string_view html) {
    return fold_detail_rows(extract_first_table(html).rows);
  }

  scheme_detail
  fetch_scheme_detail(const std::string& id, const transport_fn& transport) {
    auto url = scheme_detail_url(id);
    std::string html;
    try {
      html = transport(url);
    } catch (const std::exception& e) {
      throw detail_fetch_error("cannot fetch details of scheme '" + id +
                               "': " + e.what());
    }
    return parse_scheme_detail_page(html);
  }

} // namespace cgmlst
