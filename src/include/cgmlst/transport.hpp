#pragma once

#include <functional>
#include <string>

namespace cgmlst {

  // Returns the body at `url` or throws on any failure.
  using transport_fn = std::function<std::string(const std::string& url)>;

  bool
  is_http_url(const std::string& s);

  // libcurl for http(s) URLs, plain file reads for anything else.
  transport_fn
  make_transport();

  // Join a link from a page onto that page's URL. Absolute URLs pass
  // through, root-relative links keep the host, other links are appended to
  // the base's directory. Dot segments are left as they are.
  std::string
  resolve_url(const std::string& base_url, const std::string& href);

} // namespace cgmlst
