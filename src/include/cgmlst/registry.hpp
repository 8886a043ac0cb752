#pragma once

#include <cgmlst/table_extractor.hpp>
#include <cgmlst/transport.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cgmlst {

  inline constexpr std::string_view registry_index_url =
      "https://www.cgmlst.org/ncs/scheme/";

  inline constexpr std::string_view scheme_link_prefix =
      "https://www.cgmlst.org/ncs/scheme/schema/";

  // Older index pages link straight to the allele schema.
  inline constexpr std::string_view schema_link_prefix =
      "https://www.cgmlst.org/ncs/schema/";

  struct scheme_summary {
    std::string id;
    std::string name;
    std::int64_t target_count = 0;
    std::int64_t ct_count = 0;
    std::string source_url;
    // Every column of the row, keyed by its underscored header name.
    std::vector<std::pair<std::string, std::string>> fields;

    std::string_view
    field(std::string_view key) const;
  };

  // "Target Count" -> "Target_Count"
  std::string
  field_name_for_header(std::string_view header);

  // Strip a link prefix, then a trailing digit run before the final slash,
  // then the slash itself. An all-digit segment keeps its digits.
  std::string
  derive_scheme_id(std::string_view href);

  // Blank or non-numeric text yields 0; thousands separators are ignored.
  std::int64_t
  parse_count(std::string_view text);

  // `base_url` resolves relative hrefs.
  std::vector<scheme_summary>
  parse_registry(const html_table& table,
                 const std::string& base_url = std::string(registry_index_url));

  std::vector<scheme_summary>
  parse_registry_page(std::string_view html);

  // Fetches the index page; transport failures become registry_fetch_error.
  std::vector<scheme_summary>
  list_schemes(const transport_fn& transport);

  const scheme_summary*
  find_scheme(const std::vector<scheme_summary>& schemes, std::string_view id);

  // Throws unknown_scheme_id when `id` is not listed.
  const scheme_summary&
  require_scheme(const std::vector<scheme_summary>& schemes,
                 std::string_view id);

} // namespace cgmlst
