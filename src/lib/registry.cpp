#include <cgmlst/registry.hpp>

#include <cgmlst/errors.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_set>

namespace cgmlst {

  namespace {

    std::optional<std::size_t>
    column_index(const table_row& header, std::string_view name) {
      for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return i;
      }
      return std::nullopt;
    }

    std::size_t
    require_column(const table_row& header, std::string_view name) {
      auto index = column_index(header, name);
      if (!index) {
        throw registry_format_error("registry table has no '" +
                                    std::string(name) + "' column");
      }
      return *index;
    }

    const std::string&
    cell_at(const table_row& row, std::size_t index) {
      static const std::string empty;
      return index < row.size() ? row[index] : empty;
    }

  } // namespace

  std::string_view
  scheme_summary::field(std::string_view key) const {
    for (const auto& [k, v] : fields) {
      if (k == key) return v;
    }
    return {};
  }

  std::string
  field_name_for_header(std::string_view header) {
    std::string name(header);
    std::replace(name.begin(), name.end(), ' ', '_');
    return name;
  }

  std::string
  derive_scheme_id(std::string_view href) {
    std::string id(href);
    for (auto prefix : {scheme_link_prefix, schema_link_prefix}) {
      if (id.starts_with(prefix)) {
        id.erase(0, prefix.size());
        break;
      }
    }

    if (id.ends_with('/')) {
      auto end = id.size() - 1;
      auto start = end;
      while (start > 0 && std::isdigit(static_cast<unsigned char>(id[start - 1])))
        --start;
      bool whole_segment = start == 0 || id[start - 1] == '/';
      if (start < end && !whole_segment) id.erase(start, end - start);
      id.pop_back();
    }
    return id;
  }

  std::int64_t
  parse_count(std::string_view text) {
    std::string digits;
    for (char c : text) {
      if (c == ',' || std::isspace(static_cast<unsigned char>(c))) continue;
      if (!std::isdigit(static_cast<unsigned char>(c))) return 0;
      digits += c;
    }
    if (digits.empty()) return 0;

    std::int64_t value = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{}) return 0;
    return value;
  }

  std::vector<scheme_summary>
  parse_registry(const html_table& table, const std::string& base_url) {
    if (table.rows.empty()) {
      throw registry_format_error("registry table has no header row");
    }

    table_row header;
    for (const auto& cell : table.rows.front())
      header.push_back(field_name_for_header(cell));

    auto scheme_col = require_column(header, "Scheme");
    auto target_col = require_column(header, "Target_Count");
    auto ct_col = require_column(header, "CT_Count");

    // Rows pair with links by position, so the counts must agree exactly.
    auto data_rows = table.rows.size() - 1;
    if (table.anchors.size() != data_rows) {
      throw registry_format_error(
          "registry table has " + std::to_string(data_rows) + " rows but " +
          std::to_string(table.anchors.size()) + " scheme links");
    }

    std::vector<scheme_summary> schemes;
    schemes.reserve(data_rows);
    std::unordered_set<std::string> seen;

    for (std::size_t i = 0; i < data_rows; ++i) {
      const auto& row = table.rows[i + 1];

      scheme_summary s;
      for (std::size_t c = 0; c < header.size(); ++c)
        s.fields.emplace_back(header[c], cell_at(row, c));
      s.name = cell_at(row, scheme_col);
      s.target_count = parse_count(cell_at(row, target_col));
      s.ct_count = parse_count(cell_at(row, ct_col));
      s.source_url = resolve_url(base_url, table.anchors[i]);
      s.id = derive_scheme_id(s.source_url);

      if (s.id.empty()) {
        throw registry_format_error("cannot derive a scheme id from link '" +
                                    table.anchors[i] + "'");
      }
      if (!seen.insert(s.id).second) {
        throw registry_format_error("duplicate scheme id '" + s.id + "'");
      }
      schemes.push_back(std::move(s));
    }
    return schemes;
  }

  std::vector<scheme_summary>
  parse_registry_page(std::string_view html) {
    return parse_registry(extract_first_table(html));
  }

  std::vector<scheme_summary>
  list_schemes(const transport_fn& transport) {
    std::string html;
    try {
      html = transport(std::string(registry_index_url));
    } catch (const std::exception& e) {
      throw registry_fetch_error(std::string("cannot fetch scheme registry: ") +
                                 e.what());
    }
    return parse_registry_page(html);
  }

  const scheme_summary*
  find_scheme(const std::vector<scheme_summary>& schemes, std::string_view id) {
    auto it = std::find_if(schemes.begin(), schemes.end(),
                           [&](const scheme_summary& s) { return s.id == id; });
    return it == schemes.end() ? nullptr : &*it;
  }

  const scheme_summary&
  require_scheme(const std::vector<scheme_summary>& schemes,
                 std::string_view id) {
    const auto* found = find_scheme(schemes, id);
    if (found == nullptr) throw unknown_scheme_id(std::string(id));
    return *found;
  }

} // namespace cgmlst
