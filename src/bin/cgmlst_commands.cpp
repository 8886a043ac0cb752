#include "cgmlst_main.hpp"

#include <cgmlst/archive_fetcher.hpp>
#include <cgmlst/errors.hpp>
#include <cgmlst/scheme_detail.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

namespace cgmlst_cli {

  namespace {

    // ---------------------------------------------------------------------------
    // Argument parsing
    // ---------------------------------------------------------------------------

    // Matches "-x", "--long" (value in the next argument) and "--long=value".
    bool
    take_value(const std::string& arg, const char* short_name,
               const char* long_name, int argc, const char* const argv[],
               int& i, std::optional<std::string>& target) {
      std::string long_eq = std::string(long_name) + "=";
      if (arg.starts_with(long_eq)) {
        target = arg.substr(long_eq.size());
        return true;
      }
      if (arg != short_name && arg != long_name) return false;
      if (i + 1 >= argc) {
        throw usage_error(arg + " requires an argument");
      }
      target = argv[++i];
      return true;
    }

    std::string
    current_time_string() {
      auto now = std::chrono::system_clock::now();
      auto t = std::chrono::system_clock::to_time_t(now);
      char time_buf[32];
      std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S",
                    std::localtime(&t));
      return time_buf;
    }

    // ---------------------------------------------------------------------------
    // Commands
    // ---------------------------------------------------------------------------

    int
    run_listing(const cgmlst::transport_fn& transport, std::ostream& out) {
      auto schemes = cgmlst::list_schemes(transport);
      out << "\nCurrent date and time: " << current_time_string() << "\n";
      out << "\nPrinting available cgMLST.org schemes with their IDs:\n\n";
      out << format_scheme_listing(schemes);
      return exit_success;
    }

    int
    run_last_change(const std::string& id,
                    const cgmlst::transport_fn& transport, std::ostream& out) {
      auto detail = cgmlst::fetch_scheme_detail(id, transport);
      auto info = cgmlst::resolve_version(detail);
      out << "\n" << format_last_change(info);
      return exit_success;
    }

    int
    run_download(const std::string& id, const cgmlst::transport_fn& transport,
                 std::ostream& out, const std::filesystem::path& working_dir) {
      auto detail = cgmlst::fetch_scheme_detail(id, transport);
      auto info = cgmlst::resolve_version(detail);

      cgmlst::fetch_options opts;
      opts.working_dir = working_dir;
      opts.progress = [&out](const std::string& line) { out << line << "\n"; };

      auto result = cgmlst::fetch_and_extract(id, info, transport, opts);
      if (result.status == cgmlst::extract_status::extracted) {
        out << "Extracted " << result.files.size() << " file(s) to "
            << result.directory.string() << "\n";
      }
      return exit_success;
    }

    int
    dispatch(const command& cmd, const cgmlst::transport_fn& transport,
             std::ostream& out, const std::filesystem::path& working_dir) {
      if (!cmd.function && !cmd.id) return run_listing(transport, out);

      if (!cmd.function) {
        out << "\nPlease provide function you want to perform using argument "
               "-f.\n";
        return exit_usage;
      }
      if (!cmd.id) {
        out << "\nPlease provide scheme_ID using argument -i\n";
        return exit_usage;
      }

      // Checked before any request is made.
      auto fn = scheme_function::last_change;
      try {
        fn = to_scheme_function(*cmd.function);
      } catch (const cgmlst::invalid_function_argument&) {
        out << "\nInvalid entry for -f. Please specify \"-f last_change\", or "
               "\"-f download\".\n";
        return exit_usage;
      }

      auto schemes = cgmlst::list_schemes(transport);
      try {
        cgmlst::require_scheme(schemes, *cmd.id);
      } catch (const cgmlst::unknown_scheme_id&) {
        out << "\nInvalid entry for -i. Please specify one of the existing "
               "scheme_ID.\n";
        out << "\nAvailable schemes and their scheme_ID are:\n\n";
        out << format_scheme_listing(schemes);
        return exit_usage;
      }

      switch (fn) {
        case scheme_function::last_change:
          return run_last_change(*cmd.id, transport, out);
        case scheme_function::download:
          return run_download(*cmd.id, transport, out, working_dir);
      }
      return exit_usage;
    }

  } // namespace

  command
  parse_args(int argc, const char* const argv[]) {
    command cmd;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        cmd.show_help = true;
        return cmd;
      }

      if (arg == "--version") {
        cmd.show_version = true;
        return cmd;
      }

      if (take_value(arg, "-f", "--function", argc, argv, i, cmd.function))
        continue;
      if (take_value(arg, "-i", "--id", argc, argv, i, cmd.id)) continue;

      if (!arg.empty() && arg[0] == '-') {
        throw usage_error("unknown option: " + arg);
      }
      throw usage_error("unexpected argument: " + arg);
    }

    return cmd;
  }

  scheme_function
  to_scheme_function(std::string_view value) {
    if (value == "last_change") return scheme_function::last_change;
    if (value == "download") return scheme_function::download;
    throw cgmlst::invalid_function_argument(std::string(value));
  }

  void
  print_usage(std::ostream& os) {
    os << "Usage: cgmlst-scraper [options]\n"
       << "\n"
       << "Without options, lists the schemes published on cgMLST.org.\n"
       << "\n"
       << "Options:\n"
       << "  -f, --function <name>  Function to perform:\n"
       << "                           last_change  show Name, Version and "
          "Last Change\n"
       << "                           download     download and unpack the "
          "allele archive\n"
       << "  -i, --id <scheme_ID>   Scheme ID on which to perform the "
          "function\n"
       << "  -h, --help             Show this help message\n"
       << "  --version              Show version information\n";
  }

  void
  print_version(std::ostream& os) {
    os << "cgmlst-scraper " << CGMLST_VERSION << "\n";
  }

  std::string
  format_table(const std::vector<std::string>& headers,
               const std::vector<align>& alignment,
               const std::vector<std::vector<std::string>>& rows) {
    std::vector<std::size_t> widths;
    for (const auto& h : headers)
      widths.push_back(std::max<std::size_t>(h.size(), 3));
    for (const auto& row : rows) {
      for (std::size_t c = 0; c < widths.size() && c < row.size(); ++c)
        widths[c] = std::max(widths[c], row[c].size());
    }

    auto align_of = [&](std::size_t c) {
      return c < alignment.size() ? alignment[c] : align::left;
    };

    auto pad = [&](const std::string& s, std::size_t c) {
      std::string fill(widths[c] - s.size(), ' ');
      return align_of(c) == align::right ? fill + s : s + fill;
    };

    std::ostringstream os;
    os << "|";
    for (std::size_t c = 0; c < headers.size(); ++c)
      os << pad(headers[c], c) << "|";
    os << "\n|";
    for (std::size_t c = 0; c < headers.size(); ++c) {
      if (align_of(c) == align::right)
        os << std::string(widths[c] - 1, '-') << ":|";
      else
        os << ":" << std::string(widths[c] - 1, '-') << "|";
    }
    os << "\n";
    for (const auto& row : rows) {
      os << "|";
      for (std::size_t c = 0; c < headers.size(); ++c)
        os << pad(c < row.size() ? row[c] : std::string(), c) << "|";
      os << "\n";
    }
    return os.str();
  }

  std::string
  format_scheme_listing(const std::vector<cgmlst::scheme_summary>& schemes) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(schemes.size());
    for (const auto& s : schemes) {
      rows.push_back({s.id, s.name, std::to_string(s.target_count),
                      std::to_string(s.ct_count)});
    }
    return format_table({"scheme_ID", "Scheme", "Target_Count", "CT_Count"},
                        {align::left, align::left, align::right, align::right},
                        rows);
  }

  std::string
  format_last_change(const cgmlst::version_info& info) {
    std::vector<std::string> headers;
    std::vector<std::string> row;
    if (info.name) {
      headers.push_back("Name");
      row.push_back(*info.name);
    }
    if (info.version) {
      headers.push_back("Version");
      row.push_back(*info.version);
    }
    if (info.last_change_raw) {
      headers.push_back("Last Change");
      row.push_back(*info.last_change_raw);
      headers.push_back("Last_Change");
      row.push_back(info.last_change ? info.last_change->to_string() : "NA");
    }
    if (headers.empty()) return "No version information available.\n";
    return format_table(headers, {}, {row});
  }

  int
  run(const command& cmd, const cgmlst::transport_fn& transport,
      std::ostream& out, std::ostream& err,
      const std::filesystem::path& working_dir) {
    if (cmd.show_help) {
      print_usage(out);
      return exit_success;
    }
    if (cmd.show_version) {
      print_version(out);
      return exit_success;
    }

    try {
      return dispatch(cmd, transport, out, working_dir);
    } catch (const cgmlst::registry_fetch_error& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_fetch;
    } catch (const cgmlst::detail_fetch_error& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_fetch;
    } catch (const cgmlst::download_error& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_fetch;
    } catch (const cgmlst::html_parse_error& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_parse;
    } catch (const cgmlst::no_table_found& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_parse;
    } catch (const cgmlst::registry_format_error& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_parse;
    } catch (const cgmlst::missing_version_info& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_archive;
    } catch (const cgmlst::extract_error& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_archive;
    } catch (const std::exception& e) {
      err << "cgmlst-scraper: " << e.what() << "\n";
      return exit_fetch;
    }
  }

} // namespace cgmlst_cli
