#include <cgmlst/archive_fetcher.hpp>

#include <cgmlst/errors.hpp>
#include <cgmlst/zip_extractor.hpp>

#include <fstream>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace cgmlst {

  namespace {

    void
    report(const fetch_options& opts, const std::string& line) {
      if (opts.progress) opts.progress(line);
    }

    void
    write_archive(const fs::path& part, const fs::path& zip_path,
                  const std::string& body) {
      {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out) throw download_error("cannot write: " + part.string());
        out.write(body.data(), static_cast<std::streamsize>(body.size()));
        out.close();
        if (!out) {
          std::error_code ec;
          fs::remove(part, ec);
          throw download_error("cannot write: " + part.string());
        }
      }

      // Only a complete download ever carries the final name.
      std::error_code ec;
      fs::rename(part, zip_path, ec);
      if (ec) {
        fs::remove(part, ec);
        throw download_error("cannot move " + part.string() + " to " +
                             zip_path.string());
      }
    }

  } // namespace

  std::string
  archive_url(std::string_view id) {
    return "https://www.cgmlst.org/ncs/schema/" + std::string(id) +
           "/alleles/";
  }

  std::string
  archive_base_name(std::string_view id, const version_info& info) {
    if (!info.version) {
      throw missing_version_info("scheme '" + std::string(id) +
                                 "' has no Version");
    }
    if (!info.last_change) {
      std::string msg =
          "scheme '" + std::string(id) + "' has no parseable Last Change";
      if (info.last_change_raw) msg += " ('" + *info.last_change_raw + "')";
      throw missing_version_info(msg);
    }
    auto base = std::string(id) + "_v" + *info.version + "_LastChange_" +
                info.last_change->to_string();
    // The name comes from remote text and must stay a single path component.
    if (base.find_first_of("/\\") != std::string::npos ||
        base.find("..") != std::string::npos) {
      throw missing_version_info("scheme '" + std::string(id) +
                                 "' has an unusable Version '" +
                                 *info.version + "'");
    }
    return base;
  }

  archive_destination
  compute_destination(std::string_view id, const version_info& info,
                      const fs::path& working_dir) {
    archive_destination dest;
    dest.base_name = archive_base_name(id, info);
    dest.zip_exists = fs::exists(working_dir / (dest.base_name + ".zip"));
    dest.dir_exists =
        fs::exists(fs::symlink_status(working_dir / dest.base_name));
    return dest;
  }

  extract_result
  fetch_and_extract(const std::string& id, const version_info& info,
                    const transport_fn& transport, const fetch_options& opts) {
    auto dest = compute_destination(id, info, opts.working_dir);

    extract_result result;
    result.base_name = dest.base_name;
    result.zip_path = opts.working_dir / (dest.base_name + ".zip");
    result.directory = opts.working_dir / dest.base_name;

    if (dest.zip_exists) {
      report(opts, dest.base_name + ".zip exists. Downloading aborted.");
      result.status = extract_status::already_exists;
      return result;
    }
    if (dest.dir_exists) {
      report(opts, dest.base_name + " exists. Downloading aborted.");
      result.status = extract_status::already_exists;
      return result;
    }

    report(opts, "Downloading: " + dest.base_name + ".zip");
    std::string body;
    try {
      body = transport(archive_url(id));
    } catch (const std::exception& e) {
      throw download_error("cannot download scheme '" + id + "': " + e.what());
    }

    auto part = result.zip_path;
    part += ".part";
    write_archive(part, result.zip_path, body);

    report(opts, "Unzipping and creating scheme dir: " + dest.base_name);
    // Only a directory made by this call is removed on failure.
    bool created = false;
    std::error_code ec;
    try {
      created = fs::create_directories(result.directory);
      result.files = extract_zip(result.zip_path, result.directory);
    } catch (const extract_error&) {
      if (created) fs::remove_all(result.directory, ec);
      throw;
    } catch (const fs::filesystem_error& e) {
      if (created) fs::remove_all(result.directory, ec);
      throw extract_error(std::string("cannot extract archive: ") + e.what());
    }

    result.status = extract_status::extracted;
    return result;
  }

} // namespace cgmlst
