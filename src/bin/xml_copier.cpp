#include "xml_copier.hpp"

#include <xso/buffered_fragment.hpp>
#include <xso/output_element.hpp>

#include <expat.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace xso_cli {

  namespace {

    // Expat triplet: "uri\nlocal\nprefix", "uri\nlocal" or "local".
    struct split_name {
      std::string uri;
      std::string local;
      std::string prefix;
      bool has_prefix = false;
    };

    split_name
    parse_expat_name(const char* expat_name) {
      split_name name;
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) {
        name.local = expat_name;
        return name;
      }
      name.uri.assign(expat_name, sep);
      const char* rest = sep + 1;
      const char* sep2 = std::strchr(rest, '\n');
      if (sep2 == nullptr) {
        name.local = rest;
        return name;
      }
      name.local.assign(rest, sep2);
      name.prefix = sep2 + 1;
      name.has_prefix = true;
      return name;
    }

    bool
    is_whitespace(const std::string& text) {
      return std::all_of(text.begin(), text.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
      });
    }

  } // namespace

  struct xml_copier::impl {
    std::shared_ptr<xso::output_document> doc;
    copy_options opts;
    copy_counts counts;

    XML_Parser parser = nullptr;
    std::exception_ptr failure;

    std::vector<std::shared_ptr<xso::output_element>> stack;
    std::shared_ptr<xso::buffered_fragment> summary;

    std::string text;
    bool in_cdata = false;

    // xmlns declarations reported ahead of the element that carries them
    std::vector<std::pair<std::string, std::string>> pending_decls;

    impl(std::shared_ptr<xso::output_document> d, copy_options o)
        : doc(std::move(d)), opts(o) {}

    ~impl() {
      if (parser != nullptr) { XML_ParserFree(parser); }
    }

    xso::output_container&
    current() {
      if (stack.empty()) { return *doc; }
      return *stack.back();
    }

    std::shared_ptr<const xso::output_namespace>
    namespace_for(const split_name& name) {
      if (name.uri.empty()) { return nullptr; }
      if (name.has_prefix) { return doc->get_namespace(name.uri, name.prefix); }
      return doc->get_namespace(name.uri, "");
    }

    void
    flush_text() {
      if (text.empty()) { return; }
      if (in_cdata) {
        current().add_cdata(text);
        ++counts.text_nodes;
      } else if (!(opts.strip_whitespace && is_whitespace(text))) {
        current().add_characters(text);
        ++counts.text_nodes;
      }
      text.clear();
    }

    // Handlers run inside expat, so exceptions are parked and the parser
    // stopped; feed() rethrows once control is back.
    template <typename F>
    void
    guarded(F&& f) {
      if (failure) { return; }
      try {
        f();
      } catch (...) {
        failure = std::current_exception();
        XML_StopParser(parser, XML_FALSE);
      }
    }

    void
    start_element(const char* raw_name, const char** atts) {
      flush_text();
      auto name = parse_expat_name(raw_name);
      bool is_root = stack.empty();

      auto element = current().add_element(namespace_for(name), name.local);
      ++counts.elements;
      stack.push_back(element);

      // Default namespace declarations come back with the names using them
      for (const auto& [prefix, uri] : pending_decls) {
        if (!prefix.empty() && !uri.empty()) {
          element->predeclare_namespace(doc->get_namespace(uri, prefix));
        }
      }
      pending_decls.clear();

      for (const char** p = atts; *p != nullptr; p += 2) {
        auto attr = parse_expat_name(p[0]);
        element->add_attribute(namespace_for(attr), attr.local, p[1]);
        ++counts.attributes;
      }

      if (is_root && opts.summary) {
        summary = element->add_buffered(element->create_buffered_fragment());
      }
    }

    void
    end_element() {
      flush_text();
      stack.pop_back();
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->guarded([&] { self->start_element(name, atts); });
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* /*name*/) {
      auto* self = static_cast<impl*>(user_data);
      self->guarded([&] { self->end_element(); });
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);
      self->text.append(s, static_cast<std::size_t>(len));
    }

    static void XMLCALL
    on_comment(void* user_data, const char* data) {
      auto* self = static_cast<impl*>(user_data);
      self->guarded([&] {
        self->flush_text();
        self->current().add_comment(data);
      });
    }

    static void XMLCALL
    on_processing_instruction(void* user_data, const char* target,
                              const char* data) {
      auto* self = static_cast<impl*>(user_data);
      self->guarded([&] {
        self->flush_text();
        self->current().add_processing_instruction(target,
                                                   data ? data : "");
      });
    }

    static void XMLCALL
    on_start_cdata(void* user_data) {
      auto* self = static_cast<impl*>(user_data);
      self->guarded([&] {
        self->flush_text();
        self->in_cdata = true;
      });
    }

    static void XMLCALL
    on_end_cdata(void* user_data) {
      auto* self = static_cast<impl*>(user_data);
      self->guarded([&] {
        // An empty section is still a section
        if (self->text.empty()) { self->current().add_cdata(""); }
        self->flush_text();
        self->in_cdata = false;
      });
    }

    static void XMLCALL
    on_start_namespace(void* user_data, const char* prefix, const char* uri) {
      auto* self = static_cast<impl*>(user_data);
      self->pending_decls.emplace_back(prefix ? prefix : "", uri ? uri : "");
    }

    static void XMLCALL
    on_start_doctype(void* user_data, const char* name, const char* sysid,
                     const char* pubid, int /*has_internal_subset*/) {
      auto* self = static_cast<impl*>(user_data);
      self->guarded([&] {
        self->doc->add_doctype_decl(name, sysid ? sysid : "",
                                    pubid ? pubid : "");
      });
    }

    void
    parse(const char* data, std::size_t size, bool final) {
      XML_Status status =
          XML_Parse(parser, data, static_cast<int>(size), final);
      if (failure) { std::rethrow_exception(std::exchange(failure, nullptr)); }
      if (status == XML_STATUS_ERROR) {
        std::string msg = "XML parse error at line ";
        msg += std::to_string(XML_GetCurrentLineNumber(parser));
        msg += ": ";
        msg += XML_ErrorString(XML_GetErrorCode(parser));
        throw parse_error(msg);
      }
    }
  };

  xml_copier::xml_copier(std::shared_ptr<xso::output_document> doc,
                         copy_options opts)
      : impl_(std::make_unique<impl>(std::move(doc), opts)) {
    // '\n' as the namespace separator, with prefixes reported as triplets
    impl_->parser = XML_ParserCreateNS(nullptr, '\n');
    if (impl_->parser == nullptr) {
      throw std::runtime_error("failed to create expat parser");
    }
    XML_Parser parser = impl_->parser;
    XML_SetReturnNSTriplet(parser, 1);
    XML_SetUserData(parser, impl_.get());
    XML_SetElementHandler(parser, impl::on_start_element, impl::on_end_element);
    XML_SetCharacterDataHandler(parser, impl::on_character_data);
    XML_SetCommentHandler(parser, impl::on_comment);
    XML_SetProcessingInstructionHandler(parser,
                                        impl::on_processing_instruction);
    XML_SetCdataSectionHandler(parser, impl::on_start_cdata,
                               impl::on_end_cdata);
    XML_SetStartNamespaceDeclHandler(parser, impl::on_start_namespace);
    XML_SetStartDoctypeDeclHandler(parser, impl::on_start_doctype);
  }

  xml_copier::~xml_copier() = default;

  void
  xml_copier::feed(std::string_view chunk) {
    impl_->parse(chunk.data(), chunk.size(), false);
  }

  void
  xml_copier::finish() {
    impl_->parse("", 0, true);
    impl_->flush_text();

    if (impl_->summary) {
      const auto& c = impl_->counts;
      impl_->summary->add_comment(
          " elements: " + std::to_string(c.elements) +
          ", attributes: " + std::to_string(c.attributes) +
          ", text nodes: " + std::to_string(c.text_nodes) + " ");
      impl_->summary->release();
    }
    impl_->doc->close();
  }

  const copy_counts&
  xml_copier::counts() const {
    return impl_->counts;
  }

} // namespace xso_cli
