#pragma once

#include <stdexcept>
#include <string>

namespace cgmlst {

  class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class registry_fetch_error : public error {
  public:
    using error::error;
  };

  // The index page was fetched but does not have the expected shape.
  class registry_format_error : public error {
  public:
    using error::error;
  };

  // libxml2 could not produce a document from the page.
  class html_parse_error : public error {
  public:
    using error::error;
  };

  class no_table_found : public error {
  public:
    no_table_found() : error("no <table> element found in page") {}
  };

  class detail_fetch_error : public error {
  public:
    using error::error;
  };

  class missing_version_info : public error {
  public:
    using error::error;
  };

  class download_error : public error {
  public:
    using error::error;
  };

  class extract_error : public error {
  public:
    using error::error;
  };

  class unknown_scheme_id : public error {
  public:
    explicit unknown_scheme_id(const std::string& id)
        : error("unknown scheme id: " + id), id_(id) {}

    const std::string&
    id() const {
      return id_;
    }

  private:
    std::string id_;
  };

  class invalid_function_argument : public error {
  public:
    explicit invalid_function_argument(const std::string& value)
        : error("invalid function: " + value) {}
  };

} // namespace cgmlst
