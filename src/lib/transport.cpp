#include <cgmlst/transport.hpp>

#include <curl/curl.h>

#include <cstddef>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cgmlst {

  namespace {

    std::size_t
    append_body(char* data, std::size_t size, std::size_t count, void* body) {
      static_cast<std::string*>(body)->append(data, size * count);
      return size * count;
    }

    using curl_handle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    std::string
    curl_fetch(const std::string& url) {
      curl_handle curl(curl_easy_init(), &curl_easy_cleanup);
      if (!curl) throw std::runtime_error("cannot start a curl session");

      std::string body;
      char message[CURL_ERROR_SIZE] = {};
      curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
      curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
      curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, message);
      curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_USERAGENT,
                       "cgmlst-scraper/" CGMLST_VERSION);

      if (auto rc = curl_easy_perform(curl.get()); rc != CURLE_OK) {
        throw std::runtime_error(url + ": " +
                                 (message[0] ? message
                                             : curl_easy_strerror(rc)));
      }
      return body;
    }

    // "https://host" for web URLs, empty for local paths.
    std::string
    origin_of(const std::string& url) {
      if (!is_http_url(url)) return {};
      auto path_start = url.find('/', url.find("://") + 3);
      return path_start == std::string::npos ? url : url.substr(0, path_start);
    }

  } // namespace

  bool
  is_http_url(const std::string& s) {
    return s.starts_with("http://") || s.starts_with("https://");
  }

  std::string
  resolve_url(const std::string& base_url, const std::string& href) {
    if (is_http_url(href)) return href;
    if (href.starts_with("/")) return origin_of(base_url) + href;

    // Everything else is taken relative to the base's directory.
    auto origin = origin_of(base_url);
    auto dir_end = base_url.rfind('/');
    if (dir_end == std::string::npos || dir_end < origin.size())
      return origin + "/" + href;
    return base_url.substr(0, dir_end + 1) + href;
  }

  transport_fn
  make_transport() {
    return [](const std::string& url) -> std::string {
      if (is_http_url(url)) return curl_fetch(url);

      // Local filesystem
      std::ifstream in(url, std::ios::binary);
      if (!in) throw std::runtime_error("cannot open file: " + url);
      std::ostringstream ss;
      ss << in.rdbuf();
      return ss.str();
    };
  }

} // namespace cgmlst
