#pragma once

#include <cgmlst/table_extractor.hpp>
#include <cgmlst/transport.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cgmlst {

  // Ordered key/value record of a scheme's detail page. Which keys exist
  // varies between schemes; a missing key is not an error.
  class scheme_detail {
  public:
    using entry = std::pair<std::string, std::string>;

    scheme_detail() = default;

    // Appends to an existing key with "; " or adds a new entry at the end.
    void
    add(const std::string& key, const std::string& value);

    std::optional<std::string>
    get(std::string_view key) const;

    bool
    contains(std::string_view key) const;

    std::size_t
    size() const;

    bool
    empty() const;

    const std::vector<entry>&
    entries() const;

  private:
    std::vector<entry> entries_;
  };

  std::string
  scheme_detail_url(std::string_view id);

  // Forward-fills blank labels, then groups values per label in row order.
  scheme_detail
  fold_detail_rows(const std::vector<table_row>& rows);

  scheme_detail
  parse_scheme_detail_page(std::string_view html);

  // Transport failures become detail_fetch_error.
  scheme_detail
  fetch_scheme_detail(const std::string& id, const transport_fn& transport);

} // namespace cgmlst
