#include <cgmlst/zip_extractor.hpp>

#include <cgmlst/errors.hpp>

#include <miniz.h>

#include <cstring>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace cgmlst {

  namespace {

    class zip_archive_reader {
    public:
      explicit zip_archive_reader(const fs::path& path) {
        std::memset(&zip_, 0, sizeof(zip_));
        if (!mz_zip_reader_init_file(&zip_, path.string().c_str(), 0)) {
          throw extract_error("cannot open zip archive " + path.string() +
                              ": " + last_error());
        }
      }

      ~zip_archive_reader() {
        mz_zip_reader_end(&zip_);
      }

      zip_archive_reader(const zip_archive_reader&) = delete;
      zip_archive_reader&
      operator=(const zip_archive_reader&) = delete;

      mz_zip_archive*
      get() {
        return &zip_;
      }

      std::string
      last_error() {
        return mz_zip_get_error_string(mz_zip_get_last_error(&zip_));
      }

    private:
      mz_zip_archive zip_;
    };

    bool
    is_safe_entry_name(const std::string& name) {
      fs::path p(name);
      if (p.empty() || p.has_root_path()) return false;
      for (const auto& part : p) {
        if (part == "..") return false;
      }
      return true;
    }

  } // namespace

  std::vector<fs::path>
  extract_zip(const fs::path& zip_path, const fs::path& dest_dir) {
    zip_archive_reader zip(zip_path);
    std::vector<fs::path> written;

    mz_uint count = mz_zip_reader_get_num_files(zip.get());
    for (mz_uint i = 0; i < count; ++i) {
      mz_zip_archive_file_stat stat;
      if (!mz_zip_reader_file_stat(zip.get(), i, &stat)) {
        throw extract_error("cannot read entry " + std::to_string(i) + " of " +
                            zip_path.string() + ": " + zip.last_error());
      }

      std::string name = stat.m_filename;
      if (!is_safe_entry_name(name)) {
        throw extract_error("refusing unsafe archive entry '" + name + "'");
      }

      auto dest = dest_dir / fs::path(name);
      if (mz_zip_reader_is_file_a_directory(zip.get(), i)) {
        fs::create_directories(dest);
        continue;
      }

      if (dest.has_parent_path()) fs::create_directories(dest.parent_path());
      if (!mz_zip_reader_extract_to_file(zip.get(), i, dest.string().c_str(),
                                         0)) {
        throw extract_error("cannot extract '" + name + "': " +
                            zip.last_error());
      }
      written.push_back(std::move(dest));
    }
    return written;
  }

} // namespace cgmlst
