#include <xso/ostream_writer.hpp>
#include <xso/xml_escape.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace xso {

  struct ostream_writer::impl {
    std::ostream& os;

    // Pending tag state: start_element() buffers its name;
    // namespace_declaration() and attribute() accumulate onto this buffer; the
    // tag is flushed (written) when child content arrives or end_element() is
    // called.
    bool tag_pending = false;
    std::string pending_name;

    struct pending_attr {
      std::string name;
      std::string value;
    };

    std::vector<pending_attr> pending_attrs;

    // Lexical names of the open elements, innermost last.
    std::vector<std::string> stack;

    explicit impl(std::ostream& os) : os(os) {}

    void
    check_stream() {
      if (!os) { throw std::runtime_error("ostream_writer: write failed"); }
    }

    // Write the buffered opening tag to the stream.
    void
    flush_pending_tag() {
      if (!tag_pending) { return; }
      tag_pending = false;

      os << '<' << pending_name;
      for (const auto& attr : pending_attrs) {
        os << ' ' << attr.name << "=\"";
        escape_attribute(os, attr.value);
        os << '"';
      }
      pending_attrs.clear();
    }

    // Ensure the most recent open tag is flushed and closed with '>'.
    // Called before writing any content.
    void
    flush_and_close_tag() {
      if (tag_pending) {
        flush_pending_tag();
        os << '>';
      }
    }

    void
    require_open_tag(const char* what) {
      if (!tag_pending) {
        throw std::logic_error(std::string("ostream_writer: ") + what +
                               " outside of a start tag");
      }
    }
  };

  ostream_writer::ostream_writer(std::ostream& os)
      : impl_(std::make_unique<impl>(os)) {}

  ostream_writer::~ostream_writer() = default;
  ostream_writer::ostream_writer(ostream_writer&&) noexcept = default;
  ostream_writer&
  ostream_writer::operator=(ostream_writer&&) noexcept = default;

  void
  ostream_writer::xml_declaration(std::string_view version,
                                  std::string_view encoding,
                                  std::optional<bool> standalone) {
    auto& os = impl_->os;
    os << "<?xml version=\"" << version << '"';
    if (!encoding.empty()) { os << " encoding=\"" << encoding << '"'; }
    if (standalone.has_value()) {
      os << " standalone=\"" << (*standalone ? "yes" : "no") << '"';
    }
    os << "?>";
    impl_->check_stream();
  }

  void
  ostream_writer::doctype(std::string_view root_name,
                          std::string_view system_id,
                          std::string_view public_id,
                          std::string_view internal_subset) {
    impl_->flush_and_close_tag();
    auto& os = impl_->os;
    os << "<!DOCTYPE " << root_name;
    if (!public_id.empty()) {
      os << " PUBLIC \"" << public_id << "\" \"" << system_id << '"';
    } else if (!system_id.empty()) {
      os << " SYSTEM \"" << system_id << '"';
    }
    if (!internal_subset.empty()) { os << " [" << internal_subset << ']'; }
    os << '>';
    impl_->check_stream();
  }

  void
  ostream_writer::start_element(const qname& name) {
    // Flush any previously open tag (it now has child content)
    impl_->flush_and_close_tag();

    impl_->stack.push_back(name.lexical());
    impl_->tag_pending = true;
    impl_->pending_name = impl_->stack.back();
    impl_->check_stream();
  }

  void
  ostream_writer::end_element() {
    if (impl_->stack.empty()) {
      throw std::logic_error("ostream_writer: end_element without an open "
                             "element");
    }
    auto name = std::move(impl_->stack.back());
    impl_->stack.pop_back();

    if (impl_->tag_pending) {
      // Self-closing: no child content was written
      impl_->flush_pending_tag();
      impl_->os << "/>";
    } else {
      impl_->os << "</" << name << '>';
    }
    impl_->check_stream();
  }

  void
  ostream_writer::attribute(const qname& name, std::string_view value) {
    impl_->require_open_tag("attribute");
    impl_->pending_attrs.push_back({name.lexical(), std::string(value)});
  }

  void
  ostream_writer::characters(std::string_view text) {
    impl_->flush_and_close_tag();
    escape_text(impl_->os, text);
    impl_->check_stream();
  }

  void
  ostream_writer::cdata(std::string_view text) {
    impl_->flush_and_close_tag();
    write_cdata_sections(impl_->os, text);
    impl_->check_stream();
  }

  void
  ostream_writer::comment(std::string_view text) {
    check_comment_text(text);
    impl_->flush_and_close_tag();
    impl_->os << "<!--" << text << "-->";
    impl_->check_stream();
  }

  void
  ostream_writer::entity_ref(std::string_view name) {
    impl_->flush_and_close_tag();
    impl_->os << '&' << name << ';';
    impl_->check_stream();
  }

  void
  ostream_writer::processing_instruction(std::string_view target,
                                         std::string_view data) {
    check_processing_instruction(target, data);
    impl_->flush_and_close_tag();
    impl_->os << "<?" << target;
    if (!data.empty()) { impl_->os << ' ' << data; }
    impl_->os << "?>";
    impl_->check_stream();
  }

  void
  ostream_writer::namespace_declaration(std::string_view prefix,
                                        std::string_view uri) {
    impl_->require_open_tag("namespace declaration");
    std::string name = prefix.empty() ? std::string("xmlns")
                                      : "xmlns:" + std::string(prefix);
    // Declarations precede attributes in the written tag
    auto it = impl_->pending_attrs.begin();
    while (it != impl_->pending_attrs.end() &&
           it->name.compare(0, 5, "xmlns") == 0) {
      ++it;
    }
    impl_->pending_attrs.insert(it, {std::move(name), std::string(uri)});
  }

  void
  ostream_writer::flush() {
    impl_->flush_and_close_tag();
    impl_->os.flush();
    impl_->check_stream();
  }

} // namespace xso
