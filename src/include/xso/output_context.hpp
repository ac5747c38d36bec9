#pragma once

#include <xso/output_config.hpp>
#include <xso/output_namespace.hpp>
#include <xso/simple_output.hpp>
#include <xso/xml_writer.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xso {

  // State shared by every node of one output tree: the sink, the namespace
  // table with the prefix bindings in scope, and indentation.
  //
  // The write_* members go straight to the sink and are only used once a
  // node is known to be in document order; the create_* members build
  // queued nodes for content that has to wait.
  class output_context {
    struct binding {
      std::string prefix;
      std::string uri;
    };

    // One scope per open element, plus the document level at index 0.
    struct scope {
      std::vector<binding> bindings;
      bool has_text = false;
      bool has_markup = false;
    };

    std::unique_ptr<xml_writer> owned_writer_;
    xml_writer& writer_;
    output_config config_;
    std::unordered_map<std::string, std::shared_ptr<output_namespace>>
        namespaces_;
    std::vector<scope> scopes_;
    std::size_t prefix_counter_ = 0;
    bool written_ = false;
    bool indent_written_ = false;
    std::uint64_t id_;

  public:
    explicit output_context(xml_writer& writer, output_config config = {});
    explicit output_context(std::unique_ptr<xml_writer> writer,
                            output_config config = {});

    output_context(const output_context&) = delete;
    output_context&
    operator=(const output_context&) = delete;

    const output_config&
    config() const {
      return config_;
    }

    // Unique per context for the life of the process.
    std::uint64_t
    id() const {
      return id_;
    }

    void
    set_indentation(std::string indent, std::size_t start_offset,
                    std::size_t step);

    // Number of elements whose start tag has been written and whose end tag
    // has not.
    std::size_t
    depth() const {
      return scopes_.size() - 1;
    }

    // ---------------------------------------------------------------------
    // Namespaces
    // ---------------------------------------------------------------------

    // Canonical handle for uri; null for the empty URI (no namespace).
    std::shared_ptr<const output_namespace>
    get_namespace(std::string_view uri);

    // As above; records preferred_prefix unless the namespace already has
    // one.
    std::shared_ptr<const output_namespace>
    get_namespace(std::string_view uri, std::string_view preferred_prefix);

    // Handle valid in this context for ns, which may come from another one.
    std::shared_ptr<const output_namespace>
    resolve(const std::shared_ptr<const output_namespace>& ns);

    // Prefix currently bound to uri, if any.
    std::optional<std::string>
    prefix_for(std::string_view uri) const;

    // ---------------------------------------------------------------------
    // Write-now primitives
    // ---------------------------------------------------------------------

    void
    write_xml_declaration();

    void
    write_doctype(std::string_view root_name, std::string_view system_id,
                  std::string_view public_id,
                  std::string_view internal_subset);

    void
    write_start_element(const output_namespace* ns,
                        std::string_view local_name);

    void
    write_attribute(const output_namespace* ns, std::string_view local_name,
                    std::string_view value);

    void
    write_namespace(const output_namespace& ns);

    void
    write_end_element();

    void
    write_characters(std::string_view text);

    void
    write_cdata(std::string_view text);

    void
    write_comment(std::string_view text);

    void
    write_entity_ref(std::string_view name);

    void
    write_processing_instruction(std::string_view target,
                                 std::string_view data);

    void
    flush();

    // ---------------------------------------------------------------------
    // Node factory
    // ---------------------------------------------------------------------

    std::shared_ptr<simple_output>
    create_characters(std::string_view text) const;

    std::shared_ptr<simple_output>
    create_cdata(std::string_view text) const;

    std::shared_ptr<simple_output>
    create_comment(std::string_view text) const;

    std::shared_ptr<simple_output>
    create_entity_ref(std::string_view name) const;

    std::shared_ptr<simple_output>
    create_processing_instruction(std::string_view target,
                                  std::string_view data) const;

    std::shared_ptr<simple_output>
    create_attribute(std::shared_ptr<const output_namespace> ns,
                     std::string_view local_name,
                     std::string_view value) const;

    std::shared_ptr<simple_output>
    create_namespace(std::shared_ptr<const output_namespace> ns) const;

    std::shared_ptr<simple_output>
    create_doctype(std::string_view root_name, std::string_view system_id,
                   std::string_view public_id,
                   std::string_view internal_subset) const;

  private:
    std::optional<std::string_view>
    bound_uri(std::string_view prefix) const;

    const std::string*
    visible_prefix(std::string_view uri, bool allow_default) const;

    std::string
    choose_prefix(const output_namespace& ns, bool for_element);

    void
    declare(std::string prefix, const std::string& uri);

    bool
    indenting() const {
      return !config_.indent.empty();
    }

    void
    write_indent(std::size_t level);

    void
    before_markup();

    void
    mark_written();

    void
    before_text();
  };

  inline bool
  output_namespace::is_valid_in(const output_context& ctx) const {
    return owner_id_ == ctx.id();
  }

} // namespace xso
