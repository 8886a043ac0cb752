#pragma once

#include <filesystem>
#include <vector>

namespace cgmlst {

  // Extracts every entry of `zip_path` below `dest_dir`, creating
  // subdirectories as needed. Returns the files written. Throws
  // extract_error for unreadable archives and unsafe entry names.
  std::vector<std::filesystem::path>
  extract_zip(const std::filesystem::path& zip_path,
              const std::filesystem::path& dest_dir);

} // namespace cgmlst
