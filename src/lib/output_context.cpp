#include <xso/output_context.hpp>

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>

namespace xso {

  namespace {

    constexpr std::string_view xml_namespace_uri =
        "http://www.w3.org/XML/1998/namespace";

    bool
    is_reserved_prefix(std::string_view prefix) {
      return prefix == "xml" || prefix == "xmlns";
    }

    std::uint64_t
    next_context_id() {
      static std::atomic<std::uint64_t> counter{0};
      return ++counter;
    }

  } // namespace

  output_context::output_context(xml_writer& writer, output_config config)
      : writer_(writer), config_(std::move(config)), id_(next_context_id()) {
    scopes_.push_back({{{"xml", std::string(xml_namespace_uri)}}, false, false});
  }

  output_context::output_context(std::unique_ptr<xml_writer> writer,
                                 output_config config)
      : owned_writer_(std::move(writer)), writer_(*owned_writer_),
        config_(std::move(config)), id_(next_context_id()) {
    scopes_.push_back({{{"xml", std::string(xml_namespace_uri)}}, false, false});
  }

  void
  output_context::set_indentation(std::string indent,
                                  std::size_t start_offset, std::size_t step) {
    config_.indent = std::move(indent);
    config_.indent_offset = start_offset;
    config_.indent_step = step;
  }

  // ===== namespaces =====

  std::shared_ptr<const output_namespace>
  output_context::get_namespace(std::string_view uri) {
    if (uri.empty()) { return nullptr; }
    std::string key(uri);
    auto it = namespaces_.find(key);
    if (it != namespaces_.end()) { return it->second; }
    auto ns = std::make_shared<output_namespace>(key, std::nullopt, id_);
    namespaces_.emplace(std::move(key), ns);
    return ns;
  }

  std::shared_ptr<const output_namespace>
  output_context::get_namespace(std::string_view uri,
                                std::string_view preferred_prefix) {
    if (uri.empty()) { return nullptr; }
    get_namespace(uri);
    auto& ns = namespaces_.at(std::string(uri));
    if (!ns->preferred_prefix()) {
      ns->set_preferred_prefix(std::string(preferred_prefix));
    }
    return ns;
  }

  std::shared_ptr<const output_namespace>
  output_context::resolve(const std::shared_ptr<const output_namespace>& ns) {
    if (!ns || ns->is_valid_in(*this)) { return ns; }
    if (ns->preferred_prefix()) {
      return get_namespace(ns->uri(), *ns->preferred_prefix());
    }
    return get_namespace(ns->uri());
  }

  std::optional<std::string>
  output_context::prefix_for(std::string_view uri) const {
    if (const auto* prefix = visible_prefix(uri, true)) { return *prefix; }
    return std::nullopt;
  }

  std::optional<std::string_view>
  output_context::bound_uri(std::string_view prefix) const {
    for (auto s = scopes_.rbegin(); s != scopes_.rend(); ++s) {
      for (auto b = s->bindings.rbegin(); b != s->bindings.rend(); ++b) {
        if (b->prefix == prefix) { return std::string_view(b->uri); }
      }
    }
    return std::nullopt;
  }

  // A binding is only usable while no inner scope rebinds its prefix.
  const std::string*
  output_context::visible_prefix(std::string_view uri,
                                 bool allow_default) const {
    for (auto s = scopes_.rbegin(); s != scopes_.rend(); ++s) {
      for (auto b = s->bindings.rbegin(); b != s->bindings.rend(); ++b) {
        if (b->uri != uri || (!allow_default && b->prefix.empty())) {
          continue;
        }
        auto current = bound_uri(b->prefix);
        if (current && *current == uri) { return &b->prefix; }
      }
    }
    return nullptr;
  }

  // An element name is declared in the element's own fresh scope, so it may
  // shadow an outer binding (or the default namespace). Attributes and
  // predeclarations share the scope of an element whose name is already
  // written, so they only take prefixes that are not bound at all.
  std::string
  output_context::choose_prefix(const output_namespace& ns, bool for_element) {
    const auto& preferred = ns.preferred_prefix();
    if (preferred && !is_reserved_prefix(*preferred)) {
      if (for_element) { return *preferred; }
      if (!preferred->empty() && !bound_uri(*preferred)) {
        return *preferred;
      }
    }
    for (;;) {
      std::string candidate =
          config_.prefix_base + std::to_string(++prefix_counter_);
      if (!bound_uri(candidate)) { return candidate; }
    }
  }

  void
  output_context::declare(std::string prefix, const std::string& uri) {
    writer_.namespace_declaration(prefix, uri);
    scopes_.back().bindings.push_back({std::move(prefix), uri});
  }

  // ===== indentation =====

  void
  output_context::write_indent(std::size_t level) {
    std::size_t n = std::min(config_.indent.size(),
                             config_.indent_offset + level * config_.indent_step);
    if (n > 0) {
      writer_.characters(std::string_view(config_.indent).substr(0, n));
    }
  }

  // Mixed content is left alone: once an element holds text, nothing inside
  // it is indented. The indent stays written if the markup after it fails,
  // so a retry does not repeat it.
  void
  output_context::before_markup() {
    auto& current = scopes_.back();
    if (indenting() && written_ && !current.has_text && !indent_written_) {
      write_indent(depth());
      indent_written_ = true;
    }
    current.has_markup = true;
  }

  void
  output_context::mark_written() {
    written_ = true;
    indent_written_ = false;
  }

  void
  output_context::before_text() {
    scopes_.back().has_text = true;
  }

  // ===== write-now =====

  void
  output_context::write_xml_declaration() {
    writer_.xml_declaration(config_.version, config_.encoding,
                            config_.standalone);
    mark_written();
  }

  void
  output_context::write_doctype(std::string_view root_name,
                                std::string_view system_id,
                                std::string_view public_id,
                                std::string_view internal_subset) {
    before_markup();
    writer_.doctype(root_name, system_id, public_id, internal_subset);
    mark_written();
  }

  // The new scope is pushed only once the start tag is out, so a failed
  // write leaves the context as it was.
  void
  output_context::write_start_element(const output_namespace* ns,
                                      std::string_view local_name) {
    before_markup();

    std::string uri = ns ? ns->uri() : std::string();
    std::string prefix;
    bool needs_declaration = false;

    if (ns == nullptr) {
      // Undo a default namespace that would otherwise capture the name
      auto default_uri = bound_uri("");
      needs_declaration = default_uri && !default_uri->empty();
    } else if (const auto* bound = visible_prefix(uri, true)) {
      prefix = *bound;
    } else {
      prefix = choose_prefix(*ns, true);
      needs_declaration = true;
    }

    writer_.start_element(qname(uri, std::string(local_name), prefix));
    scopes_.emplace_back();
    mark_written();
    if (needs_declaration) { declare(prefix, uri); }
  }

  void
  output_context::write_attribute(const output_namespace* ns,
                                  std::string_view local_name,
                                  std::string_view value) {
    if (ns == nullptr) {
      writer_.attribute(qname("", std::string(local_name)), value);
      return;
    }
    std::string prefix;
    if (const auto* bound = visible_prefix(ns->uri(), false)) {
      prefix = *bound;
    } else {
      prefix = choose_prefix(*ns, false);
      declare(prefix, ns->uri());
    }
    writer_.attribute(qname(ns->uri(), std::string(local_name), prefix),
                      value);
  }

  void
  output_context::write_namespace(const output_namespace& ns) {
    if (visible_prefix(ns.uri(), true) != nullptr) { return; }
    declare(choose_prefix(ns, false), ns.uri());
  }

  void
  output_context::write_end_element() {
    if (depth() == 0) {
      throw std::logic_error("output_context: no open element to end");
    }
    const auto& current = scopes_.back();
    if (indenting() && current.has_markup && !current.has_text &&
        !indent_written_) {
      write_indent(depth() - 1);
      indent_written_ = true;
    }
    writer_.end_element();
    scopes_.pop_back();
    mark_written();
  }

  void
  output_context::write_characters(std::string_view text) {
    before_text();
    writer_.characters(text);
    mark_written();
  }

  void
  output_context::write_cdata(std::string_view text) {
    before_text();
    writer_.cdata(text);
    mark_written();
  }

  void
  output_context::write_comment(std::string_view text) {
    before_markup();
    writer_.comment(text);
    mark_written();
  }

  void
  output_context::write_entity_ref(std::string_view name) {
    before_text();
    writer_.entity_ref(name);
    mark_written();
  }

  void
  output_context::write_processing_instruction(std::string_view target,
                                               std::string_view data) {
    before_markup();
    writer_.processing_instruction(target, data);
    mark_written();
  }

  void
  output_context::flush() {
    writer_.flush();
  }

  // ===== node factory =====

  std::shared_ptr<simple_output>
  output_context::create_characters(std::string_view text) const {
    return std::make_shared<simple_output>(
        simple_output::characters{std::string(text)});
  }

  std::shared_ptr<simple_output>
  output_context::create_cdata(std::string_view text) const {
    return std::make_shared<simple_output>(
        simple_output::cdata{std::string(text)});
  }

  std::shared_ptr<simple_output>
  output_context::create_comment(std::string_view text) const {
    return std::make_shared<simple_output>(
        simple_output::comment{std::string(text)});
  }

  std::shared_ptr<simple_output>
  output_context::create_entity_ref(std::string_view name) const {
    return std::make_shared<simple_output>(
        simple_output::entity_ref{std::string(name)});
  }

  std::shared_ptr<simple_output>
  output_context::create_processing_instruction(std::string_view target,
                                                std::string_view data) const {
    return std::make_shared<simple_output>(simple_output::processing_instruction{
        std::string(target), std::string(data)});
  }

  std::shared_ptr<simple_output>
  output_context::create_attribute(std::shared_ptr<const output_namespace> ns,
                                   std::string_view local_name,
                                   std::string_view value) const {
    return std::make_shared<simple_output>(simple_output::attribute{
        std::move(ns), std::string(local_name), std::string(value)});
  }

  std::shared_ptr<simple_output>
  output_context::create_namespace(
      std::shared_ptr<const output_namespace> ns) const {
    return std::make_shared<simple_output>(
        simple_output::namespace_decl{std::move(ns)});
  }

  std::shared_ptr<simple_output>
  output_context::create_doctype(std::string_view root_name,
                                 std::string_view system_id,
                                 std::string_view public_id,
                                 std::string_view internal_subset) const {
    return std::make_shared<simple_output>(simple_output::doctype{
        std::string(root_name), std::string(system_id), std::string(public_id),
        std::string(internal_subset)});
  }

} // namespace xso
