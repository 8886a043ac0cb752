#pragma once

#include <cgmlst/transport.hpp>
#include <cgmlst/version_resolver.hpp>

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cgmlst {

  struct archive_destination {
    std::string base_name;
    bool zip_exists = false;
    bool dir_exists = false;
  };

  enum class extract_status { extracted, already_exists };

  struct extract_result {
    extract_status status = extract_status::extracted;
    std::string base_name;
    std::filesystem::path zip_path;
    std::filesystem::path directory;
    std::vector<std::filesystem::path> files;
  };

  struct fetch_options {
    std::filesystem::path working_dir = ".";
    // Progress lines; silent when empty.
    std::function<void(const std::string&)> progress;
  };

  std::string
  archive_url(std::string_view id);

  // "<id>_v<version>_LastChange_<YYYY-MM-DD-HH-MM>"; throws
  // missing_version_info without a version and a parsed timestamp.
  std::string
  archive_base_name(std::string_view id, const version_info& info);

  archive_destination
  compute_destination(std::string_view id, const version_info& info,
                      const std::filesystem::path& working_dir);

  // An existing `<base>.zip`, or any file or directory named `<base>`,
  // short-circuits before any request.
  extract_result
  fetch_and_extract(const std::string& id, const version_info& info,
                    const transport_fn& transport,
                    const fetch_options& opts = {});

} // namespace cgmlst
