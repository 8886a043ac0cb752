#include <cgmlst/table_extractor.hpp>

#include <cgmlst/errors.hpp>
#include <cgmlst/libxml2_html_reader.hpp>

#include <cctype>
#include <string>
#include <utility>

namespace cgmlst {

  namespace {

    bool
    is_cell(const std::string& name) {
      return name == "td" || name == "th";
    }

    // Elements whose boundaries separate words inside a cell. Cells and
    // rows only reach this check when they belong to a nested table.
    bool
    breaks_text(const std::string& name) {
      return name == "br" || name == "p" || name == "div" || name == "li" ||
             name == "tr" || is_cell(name);
    }

    struct row_builder {
      html_table& table;
      table_row row;
      std::string cell;
      bool in_row = false;
      bool in_cell = false;

      void
      open_row() {
        close_row();
        in_row = true;
      }

      void
      open_cell() {
        close_cell();
        if (!in_row) in_row = true;
        in_cell = true;
      }

      void
      close_cell() {
        if (!in_cell) return;
        row.push_back(normalize_cell_text(cell));
        cell.clear();
        in_cell = false;
      }

      void
      close_row() {
        close_cell();
        if (in_row && !row.empty()) table.rows.push_back(std::move(row));
        row.clear();
        in_row = false;
      }
    };

  } // namespace

  std::string
  normalize_cell_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char c : text) {
      if (std::isspace(static_cast<unsigned char>(c))) {
        pending_space = !out.empty();
        continue;
      }
      if (pending_space) out += ' ';
      pending_space = false;
      out += c;
    }
    return out;
  }

  html_table
  extract_first_table(html_reader& reader) {
    std::size_t table_depth = 0;
    bool found = false;
    while (reader.read()) {
      if (reader.node_type() == html_node_type::start_element &&
          reader.name() == "table") {
        table_depth = reader.depth();
        found = true;
        break;
      }
    }
    if (!found) throw no_table_found();

    html_table table;
    row_builder builder{table};
    // Tables nested inside a cell contribute text and anchors, not rows.
    std::size_t nested = 0;

    while (reader.read()) {
      switch (reader.node_type()) {
        case html_node_type::start_element: {
          const auto& name = reader.name();
          if (name == "a" && reader.has_attribute("href")) {
            table.anchors.emplace_back(reader.attribute_value("href"));
          }
          if (name == "table") {
            ++nested;
          } else if (nested == 0 && name == "tr") {
            builder.open_row();
          } else if (nested == 0 && is_cell(name)) {
            builder.open_cell();
          } else if (builder.in_cell && breaks_text(name)) {
            builder.cell += ' ';
          }
          break;
        }
        case html_node_type::end_element: {
          const auto& name = reader.name();
          if (name == "table") {
            if (nested == 0 && reader.depth() == table_depth) {
              builder.close_row();
              return table;
            }
            if (nested > 0) --nested;
          } else if (nested == 0 && name == "tr") {
            builder.close_row();
          } else if (nested == 0 && is_cell(name)) {
            builder.close_cell();
          } else if (builder.in_cell && breaks_text(name)) {
            builder.cell += ' ';
          }
          break;
        }
        case html_node_type::characters:
          if (builder.in_cell) builder.cell += reader.text();
          break;
      }
    }

    builder.close_row();
    return table;
  }

  html_table
  extract_first_table(std::string_view html) {
    libxml2_html_reader reader(html);
    return extract_first_table(reader);
  }

} // namespace cgmlst
