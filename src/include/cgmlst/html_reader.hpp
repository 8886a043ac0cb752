#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cgmlst {

  enum class html_node_type {
    start_element,
    end_element,
    characters,
  };

  class html_reader {
  public:
    virtual ~html_reader() = default;

    virtual bool
    read() = 0;

    virtual html_node_type
    node_type() const = 0;

    // Lower-case element name; empty for character events.
    virtual const std::string&
    name() const = 0;

    virtual std::size_t
    attribute_count() const = 0;

    virtual const std::string&
    attribute_name(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::size_t index) const = 0;

    virtual std::string_view
    attribute_value(std::string_view name) const = 0;

    virtual bool
    has_attribute(std::string_view name) const = 0;

    virtual std::string_view
    text() const = 0;

    virtual std::size_t
    depth() const = 0;
  };

} // namespace cgmlst
