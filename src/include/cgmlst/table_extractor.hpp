#pragma once

#include <cgmlst/html_reader.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cgmlst {

  using table_row = std::vector<std::string>;

  // Contents of the first <table> of a page. Header rows are kept as
  // ordinary rows; anchors are every href inside the table in document order.
  struct html_table {
    std::vector<table_row> rows;
    std::vector<std::string> anchors;
  };

  // Throws no_table_found when the page has no <table>.
  html_table
  extract_first_table(html_reader& reader);

  html_table
  extract_first_table(std::string_view html);

  // Collapse whitespace runs to a single space and trim both ends.
  std::string
  normalize_cell_text(std::string_view text);

} // namespace cgmlst
