#pragma once

#include <cgmlst/html_reader.hpp>

#include <memory>
#include <string_view>

namespace cgmlst {

  class libxml2_html_reader : public html_reader {
  public:
    explicit libxml2_html_reader(std::string_view html);
    ~libxml2_html_reader() override;

    libxml2_html_reader(const libxml2_html_reader&) = delete;
    libxml2_html_reader&
    operator=(const libxml2_html_reader&) = delete;
    libxml2_html_reader(libxml2_html_reader&&) noexcept;
    libxml2_html_reader&
    operator=(libxml2_html_reader&&) noexcept;

    bool
    read() override;

    html_node_type
    node_type() const override;

    const std::string&
    name() const override;

    std::size_t
    attribute_count() const override;

    const std::string&
    attribute_name(std::size_t index) const override;

    std::string_view
    attribute_value(std::size_t index) const override;

    std::string_view
    attribute_value(std::string_view name) const override;

    bool
    has_attribute(std::string_view name) const override;

    std::string_view
    text() const override;

    std::size_t
    depth() const override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace cgmlst
