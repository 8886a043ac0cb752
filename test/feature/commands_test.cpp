#include "cgmlst_main.hpp"

#include <catch2/catch_test_macros.hpp>

#include <miniz.h>

#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using namespace cgmlst_cli;

namespace {

  const std::string index_url = "https://www.cgmlst.org/ncs/scheme/";
  const std::string detail_url =
      "https://www.cgmlst.org/ncs/scheme/scheme/Abaumannii/";
  const std::string alleles_url =
      "https://www.cgmlst.org/ncs/schema/Abaumannii/alleles/";

  const char* registry_page = R"(<html><body>
<table>
  <tr><th>Scheme</th><th>Target Count</th><th>CT Count</th></tr>
  <tr><td><a href="https://www.cgmlst.org/ncs/scheme/schema/Abaumannii1469/">Acinetobacter baumannii</a></td><td>2390</td><td>1234</td></tr>
  <tr><td><a href="https://www.cgmlst.org/ncs/scheme/schema/Efaecium1001/">Enterococcus faecium</a></td><td>1423</td><td>3786</td></tr>
</table>
</body></html>)";

  const char* detail_page = R"(<html><body><table>
  <tr><td>Name</td><td>Acinetobacter baumannii</td></tr>
  <tr><td>Version</td><td>1.0</td></tr>
  <tr><td>Last Change</td><td>January 5, 2024, 10:30</td></tr>
</table></body></html>)";

  const char* detail_page_without_change = R"(<html><body><table>
  <tr><td>Name</td><td>Acinetobacter baumannii</td></tr>
  <tr><td>Version</td><td>1.0</td></tr>
</table></body></html>)";

  std::string
  make_zip(const std::string& name, const std::string& data) {
    mz_zip_archive zip;
    std::memset(&zip, 0, sizeof(zip));
    REQUIRE(mz_zip_writer_init_heap(&zip, 0, 0));
    REQUIRE(mz_zip_writer_add_mem(&zip, name.c_str(), data.data(), data.size(),
                                  MZ_DEFAULT_COMPRESSION));
    void* buf = nullptr;
    std::size_t size = 0;
    REQUIRE(mz_zip_writer_finalize_heap_archive(&zip, &buf, &size));
    std::string bytes(static_cast<const char*>(buf), size);
    mz_free(buf);
    mz_zip_writer_end(&zip);
    return bytes;
  }

  // In-memory site that records every URL asked for.
  struct fake_site {
    std::unordered_map<std::string, std::string> pages;
    std::vector<std::string> requests;

    cgmlst::transport_fn
    transport() {
      return [this](const std::string& url) -> std::string {
        requests.push_back(url);
        auto it = pages.find(url);
        if (it == pages.end()) throw std::runtime_error("HTTP 404: " + url);
        return it->second;
      };
    }

    bool
    requested(const std::string& url) const {
      for (const auto& r : requests)
        if (r == url) return true;
      return false;
    }
  };

  fake_site
  full_site() {
    fake_site site;
    site.pages[index_url] = registry_page;
    site.pages[detail_url] = detail_page;
    site.pages[alleles_url] = make_zip("ACICU_00001.fasta", ">1\nACGT\n");
    return site;
  }

  fs::path
  make_tmp_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("cgmlst_commands_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
  }

  struct run_output {
    int rc;
    std::string out;
    std::string err;
  };

  run_output
  run_with(const command& cmd, fake_site& site,
           const fs::path& working_dir = fs::temp_directory_path()) {
    std::ostringstream out;
    std::ostringstream err;
    int rc = run(cmd, site.transport(), out, err, working_dir);
    return {rc, out.str(), err.str()};
  }

  command
  make_command(std::optional<std::string> function,
               std::optional<std::string> id) {
    command cmd;
    cmd.function = std::move(function);
    cmd.id = std::move(id);
    return cmd;
  }

} // namespace

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

TEST_CASE("parse_args with no arguments", "[commands]") {
  const char* argv[] = {"cgmlst-scraper"};
  auto cmd = parse_args(1, argv);
  CHECK_FALSE(cmd.function);
  CHECK_FALSE(cmd.id);
  CHECK_FALSE(cmd.show_help);
}

TEST_CASE("parse_args short and long forms", "[commands]") {
  SECTION("short flags") {
    const char* argv[] = {"cgmlst-scraper", "-f", "download", "-i",
                          "Abaumannii"};
    auto cmd = parse_args(5, argv);
    CHECK(cmd.function == "download");
    CHECK(cmd.id == "Abaumannii");
  }
  SECTION("long flags") {
    const char* argv[] = {"cgmlst-scraper", "--function", "last_change",
                          "--id", "Efaecium"};
    auto cmd = parse_args(5, argv);
    CHECK(cmd.function == "last_change");
    CHECK(cmd.id == "Efaecium");
  }
  SECTION("long flags with =") {
    const char* argv[] = {"cgmlst-scraper", "--function=download",
                          "--id=Abaumannii"};
    auto cmd = parse_args(3, argv);
    CHECK(cmd.function == "download");
    CHECK(cmd.id == "Abaumannii");
  }
  SECTION("help") {
    const char* argv[] = {"cgmlst-scraper", "-h"};
    CHECK(parse_args(2, argv).show_help);
  }
  SECTION("version") {
    const char* argv[] = {"cgmlst-scraper", "--version"};
    CHECK(parse_args(2, argv).show_version);
  }
}

TEST_CASE("parse_args rejects bad usage", "[commands]") {
  SECTION("missing value") {
    const char* argv[] = {"cgmlst-scraper", "-i"};
    CHECK_THROWS_AS(parse_args(2, argv), usage_error);
  }
  SECTION("unknown option") {
    const char* argv[] = {"cgmlst-scraper", "--verbose"};
    CHECK_THROWS_AS(parse_args(2, argv), usage_error);
  }
  SECTION("positional argument") {
    const char* argv[] = {"cgmlst-scraper", "Abaumannii"};
    CHECK_THROWS_AS(parse_args(2, argv), usage_error);
  }
}

TEST_CASE("to_scheme_function accepts the two functions", "[commands]") {
  CHECK(to_scheme_function("last_change") == scheme_function::last_change);
  CHECK(to_scheme_function("download") == scheme_function::download);
  CHECK_THROWS_AS(to_scheme_function("upload"),
                  cgmlst::invalid_function_argument);
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

TEST_CASE("format_table pads and aligns columns", "[commands]") {
  auto table =
      format_table({"a", "bb"}, {align::left, align::right}, {{"x", "1"}});
  CHECK(table == "|a  | bb|\n"
                 "|:--|--:|\n"
                 "|x  |  1|\n");
}

TEST_CASE("format_last_change shows only present fields", "[commands]") {
  cgmlst::version_info info;
  info.name = "Enterococcus faecium";
  info.version = "2";

  auto text = format_last_change(info);
  CHECK(text.find("Name") != std::string::npos);
  CHECK(text.find("Version") != std::string::npos);
  CHECK(text.find("Last Change") == std::string::npos);

  CHECK(format_last_change(cgmlst::version_info{}) ==
        "No version information available.\n");
}

TEST_CASE("format_last_change marks an unparsed timestamp", "[commands]") {
  cgmlst::version_info info;
  info.last_change_raw = "sometime";
  auto text = format_last_change(info);
  CHECK(text.find("sometime") != std::string::npos);
  CHECK(text.find("NA") != std::string::npos);
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

TEST_CASE("no flags prints the timestamp and the listing", "[commands]") {
  auto site = full_site();
  auto result = run_with(command{}, site);

  CHECK(result.rc == exit_success);
  CHECK(result.out.find("Current date and time: ") != std::string::npos);
  CHECK(result.out.find("|scheme_ID") != std::string::npos);
  CHECK(result.out.find("Abaumannii") != std::string::npos);
  CHECK(result.out.find("Efaecium") != std::string::npos);
  REQUIRE(site.requests.size() == 1);
  CHECK(site.requests[0] == index_url);
}

TEST_CASE("id without function asks for -f", "[commands]") {
  auto site = full_site();
  auto result = run_with(make_command(std::nullopt, "Abaumannii"), site);
  CHECK(result.rc == exit_usage);
  CHECK(result.out.find("using argument -f") != std::string::npos);
  CHECK(site.requests.empty());
}

TEST_CASE("function without id asks for -i", "[commands]") {
  auto site = full_site();
  auto result = run_with(make_command("download", std::nullopt), site);
  CHECK(result.rc == exit_usage);
  CHECK(result.out.find("using argument -i") != std::string::npos);
  CHECK(site.requests.empty());
}

TEST_CASE("unknown function is rejected without requests", "[commands]") {
  auto site = full_site();
  auto result = run_with(make_command("upload", "Abaumannii"), site);
  CHECK(result.rc == exit_usage);
  CHECK(result.out.find("Invalid entry for -f") != std::string::npos);
  CHECK(site.requests.empty());
}

TEST_CASE("unknown id reprints the listing", "[commands]") {
  auto site = full_site();
  auto result = run_with(make_command("download", "NotARealScheme"), site);

  CHECK(result.rc == exit_usage);
  CHECK(result.out.find("Invalid entry for -i") != std::string::npos);
  CHECK(result.out.find("Abaumannii") != std::string::npos);
  CHECK(result.out.find("Efaecium") != std::string::npos);
  REQUIRE(site.requests.size() == 1);
  CHECK(site.requests[0] == index_url);
}

TEST_CASE("last_change prints name, version and timestamp", "[commands]") {
  auto site = full_site();
  auto result = run_with(make_command("last_change", "Abaumannii"), site);

  CHECK(result.rc == exit_success);
  CHECK(result.out.find("Acinetobacter baumannii") != std::string::npos);
  CHECK(result.out.find("January 5, 2024, 10:30") != std::string::npos);
  CHECK(result.out.find("2024-01-05-10-30") != std::string::npos);
  CHECK(site.requested(detail_url));
  CHECK_FALSE(site.requested(alleles_url));
}

TEST_CASE("last_change without Last Change shows name and version",
          "[commands]") {
  auto site = full_site();
  site.pages[detail_url] = detail_page_without_change;
  auto result = run_with(make_command("last_change", "Abaumannii"), site);

  CHECK(result.rc == exit_success);
  CHECK(result.out.find("|Name") != std::string::npos);
  CHECK(result.out.find("Version") != std::string::npos);
  CHECK(result.out.find("Last Change") == std::string::npos);
}

TEST_CASE("download extracts once and then refuses", "[commands]") {
  auto dir = make_tmp_dir("download");
  auto site = full_site();

  auto first = run_with(make_command("download", "Abaumannii"), site, dir);
  CHECK(first.rc == exit_success);
  CHECK(first.out.find("Downloading: ") != std::string::npos);
  CHECK(fs::exists(dir / "Abaumannii_v1.0_LastChange_2024-01-05-10-30" /
                   "ACICU_00001.fasta"));

  site.requests.clear();
  auto second = run_with(make_command("download", "Abaumannii"), site, dir);
  CHECK(second.rc == exit_success);
  CHECK(second.out.find("Downloading aborted.") != std::string::npos);
  CHECK_FALSE(site.requested(alleles_url));

  fs::remove_all(dir);
}

TEST_CASE("download without a timestamp fails with missing info",
          "[commands]") {
  auto dir = make_tmp_dir("missing_info");
  auto site = full_site();
  site.pages[detail_url] = detail_page_without_change;

  auto result = run_with(make_command("download", "Abaumannii"), site, dir);
  CHECK(result.rc == exit_archive);
  CHECK(result.err.find("Last Change") != std::string::npos);
  CHECK_FALSE(site.requested(alleles_url));
  CHECK(fs::is_empty(dir));

  fs::remove_all(dir);
}

TEST_CASE("registry failures are reported on stderr", "[commands]") {
  fake_site site;
  auto result = run_with(command{}, site);
  CHECK(result.rc == exit_fetch);
  CHECK(result.err.find("cannot fetch scheme registry") != std::string::npos);
}

TEST_CASE("a registry page without a table is a format error",
          "[commands]") {
  fake_site site;
  site.pages[index_url] = "<html><body>Maintenance</body></html>";
  auto result = run_with(command{}, site);
  CHECK(result.rc == exit_parse);
  CHECK(result.err.find("no <table>") != std::string::npos);
}

TEST_CASE("a registry page with no markup is a format error", "[commands]") {
  fake_site site;
  site.pages[index_url] = " \n\t ";
  auto result = run_with(command{}, site);
  CHECK(result.rc == exit_parse);
  CHECK_FALSE(result.err.empty());
}
