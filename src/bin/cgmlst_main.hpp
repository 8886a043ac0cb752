#pragma once

#include <cgmlst/registry.hpp>
#include <cgmlst/transport.hpp>
#include <cgmlst/version_resolver.hpp>

#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cgmlst_cli {

  inline constexpr int exit_success = 0;
  inline constexpr int exit_usage = 1;
  inline constexpr int exit_fetch = 2;
  inline constexpr int exit_parse = 3;
  inline constexpr int exit_archive = 4;

  enum class scheme_function { last_change, download };

  // Parsed once from argv and passed by value from then on.
  struct command {
    std::optional<std::string> function;
    std::optional<std::string> id;
    bool show_help = false;
    bool show_version = false;
  };

  class usage_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Throws usage_error for unknown options and missing flag values.
  command
  parse_args(int argc, const char* const argv[]);

  // Throws cgmlst::invalid_function_argument.
  scheme_function
  to_scheme_function(std::string_view value);

  void
  print_usage(std::ostream& os);

  void
  print_version(std::ostream& os);

  enum class align { left, right };

  // Pipe table in the markdown style of knitr::kable.
  std::string
  format_table(const std::vector<std::string>& headers,
               const std::vector<align>& alignment,
               const std::vector<std::vector<std::string>>& rows);

  std::string
  format_scheme_listing(const std::vector<cgmlst::scheme_summary>& schemes);

  // Only the fields present in `info` become columns.
  std::string
  format_last_change(const cgmlst::version_info& info);

  int
  run(const command& cmd, const cgmlst::transport_fn& transport,
      std::ostream& out, std::ostream& err,
      const std::filesystem::path& working_dir);

} // namespace cgmlst_cli
