#include <cgmlst/libxml2_html_reader.hpp>

#include <cgmlst/errors.hpp>

#include <libxml/HTMLparser.h>
#include <libxml/tree.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cgmlst {

  namespace {

    struct attribute {
      std::string name;
      std::string value;
    };

    struct event {
      html_node_type type;
      std::string name;
      std::string text;
      std::vector<attribute> attributes;
      std::size_t depth;
    };

    struct doc_deleter {
      void
      operator()(xmlDoc* doc) const {
        xmlFreeDoc(doc);
      }
    };

    using doc_ptr = std::unique_ptr<xmlDoc, doc_deleter>;

    std::string
    to_lower(const xmlChar* s) {
      std::string out = s ? reinterpret_cast<const char*>(s) : "";
      std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
      });
      return out;
    }

    std::string
    attribute_text(xmlDoc* doc, const xmlAttr* attr) {
      xmlChar* raw = xmlNodeListGetString(doc, attr->children, 1);
      if (raw == nullptr) return {};
      std::string value(reinterpret_cast<const char*>(raw));
      xmlFree(raw);
      return value;
    }

  } // namespace

  struct libxml2_html_reader::impl {
    std::vector<event> events;
    std::size_t cursor = 0;

    void
    append_text(const xmlChar* content, std::size_t depth) {
      if (content == nullptr) return;
      const char* s = reinterpret_cast<const char*>(content);

      // Coalesce adjacent character data into a single event
      if (!events.empty() &&
          events.back().type == html_node_type::characters) {
        events.back().text += s;
        return;
      }

      event ev;
      ev.type = html_node_type::characters;
      ev.text = s;
      ev.depth = depth;
      events.push_back(std::move(ev));
    }

    void
    walk(xmlDoc* doc, xmlNode* node, std::size_t depth) {
      for (; node != nullptr; node = node->next) {
        switch (node->type) {
          case XML_ELEMENT_NODE: {
            event start;
            start.type = html_node_type::start_element;
            start.name = to_lower(node->name);
            start.depth = depth + 1;
            for (xmlAttr* a = node->properties; a != nullptr; a = a->next) {
              start.attributes.push_back(
                  {to_lower(a->name), attribute_text(doc, a)});
            }
            std::string name = start.name;
            events.push_back(std::move(start));

            walk(doc, node->children, depth + 1);

            event end;
            end.type = html_node_type::end_element;
            end.name = std::move(name);
            end.depth = depth + 1;
            events.push_back(std::move(end));
            break;
          }
          case XML_TEXT_NODE:
          case XML_CDATA_SECTION_NODE:
            append_text(node->content, depth);
            break;
          default:
            break;
        }
      }
    }
  };

  libxml2_html_reader::libxml2_html_reader(std::string_view html)
      : impl_(std::make_unique<impl>()) {
    if (html.empty()) return;
    if (html.size() > static_cast<std::size_t>(INT_MAX)) {
      throw html_parse_error("HTML document too large");
    }

    doc_ptr doc(htmlReadMemory(html.data(), static_cast<int>(html.size()),
                               nullptr, "UTF-8",
                               HTML_PARSE_RECOVER | HTML_PARSE_NOERROR |
                                   HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
    if (!doc) {
      throw html_parse_error("HTML parse error: document could not be read");
    }

    impl_->walk(doc.get(), xmlDocGetRootElement(doc.get()), 0);
  }

  libxml2_html_reader::~libxml2_html_reader() = default;
  libxml2_html_reader::libxml2_html_reader(libxml2_html_reader&&) noexcept =
      default;
  libxml2_html_reader&
  libxml2_html_reader::operator=(libxml2_html_reader&&) noexcept = default;

  bool
  libxml2_html_reader::read() {
    if (impl_->cursor >= impl_->events.size()) {
      return false;
    }
    impl_->cursor++;
    return true;
  }

  html_node_type
  libxml2_html_reader::node_type() const {
    return impl_->events[impl_->cursor - 1].type;
  }

  const std::string&
  libxml2_html_reader::name() const {
    return impl_->events[impl_->cursor - 1].name;
  }

  std::size_t
  libxml2_html_reader::attribute_count() const {
    return impl_->events[impl_->cursor - 1].attributes.size();
  }

  const std::string&
  libxml2_html_reader::attribute_name(std::size_t index) const {
    return impl_->events[impl_->cursor - 1].attributes[index].name;
  }

  std::string_view
  libxml2_html_reader::attribute_value(std::size_t index) const {
    return impl_->events[impl_->cursor - 1].attributes[index].value;
  }

  std::string_view
  libxml2_html_reader::attribute_value(std::string_view attr_name) const {
    for (const auto& attr : impl_->events[impl_->cursor - 1].attributes) {
      if (attr.name == attr_name) {
        return attr.value;
      }
    }
    return {};
  }

  bool
  libxml2_html_reader::has_attribute(std::string_view attr_name) const {
    const auto& attrs = impl_->events[impl_->cursor - 1].attributes;
    return std::any_of(attrs.begin(), attrs.end(), [&](const attribute& a) {
      return a.name == attr_name;
    });
  }

  std::string_view
  libxml2_html_reader::text() const {
    return impl_->events[impl_->cursor - 1].text;
  }

  std::size_t
  libxml2_html_reader::depth() const {
    return impl_->events[impl_->cursor - 1].depth;
  }

} // namespace cgmlst
