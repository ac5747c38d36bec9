#include <xso/output_element.hpp>

#include <stdexcept>
#include <string>

namespace xso {

  output_element::output_element(std::shared_ptr<output_context> ctx,
                                 std::shared_ptr<const output_namespace> ns,
                                 std::string local_name)
      : output_container(std::move(ctx)), ns_(std::move(ns)),
        local_name_(std::move(local_name)) {
    if (local_name_.empty()) {
      throw std::invalid_argument("output_element: empty local name");
    }
  }

  void
  output_element::check_attribute_allowed(const char* what) const {
    if (state_ == output_state::closed) { throw_closed(); }
    if (has_content_) {
      throw std::logic_error(std::string("output_element: cannot add ") +
                             what + " to " + path() +
                             " after content was added");
    }
  }

  void
  output_element::add_attribute(std::shared_ptr<const output_namespace> ns,
                                std::string_view local_name,
                                std::string_view value) {
    check_attribute_allowed("an attribute");
    ns = context().resolve(ns);

    if (state_ == output_state::pending) {
      link_new_child(context().create_attribute(std::move(ns), local_name,
                                                value));
    } else {
      context().write_attribute(ns.get(), local_name, value);
    }
  }

  void
  output_element::add_attribute(std::string_view local_name,
                                std::string_view value) {
    add_attribute(nullptr, local_name, value);
  }

  void
  output_element::predeclare_namespace(
      std::shared_ptr<const output_namespace> ns) {
    check_attribute_allowed("a namespace declaration");
    ns = context().resolve(ns);
    if (!ns) { return; }

    if (state_ == output_state::pending) {
      link_new_child(context().create_namespace(std::move(ns)));
    } else {
      context().write_namespace(*ns);
    }
  }

  bool
  output_element::can_output_new_child() {
    if (state_ == output_state::closed) { throw_closed(); }
    has_content_ = true;

    // Blocked: the start tag itself is still waiting
    if (state_ == output_state::pending) { return false; }

    if (!close_and_output_children()) { return false; }
    state_ = output_state::children;
    return true;
  }

  void
  output_element::link_parent(const std::shared_ptr<output_container>& parent,
                              bool blocked) {
    output_container::link_parent(parent);
    if (!blocked) { write_start(); }
  }

  void
  output_element::write_start() {
    context().write_start_element(ns_.get(), local_name_);
    state_ = output_state::attributes;
  }

  void
  output_element::write_end() {
    context().write_end_element();
    state_ = output_state::closed;
  }

  bool
  output_element::do_output(output_context& /*ctx*/, bool can_close) {
    if (state_ == output_state::closed) { throw_closed(); }
    if (state_ == output_state::pending) { write_start(); }

    bool drained =
        can_close ? close_and_output_children() : close_all_but_last_child();
    if (!can_close || !drained) { return false; }

    write_end();
    return true;
  }

  void
  output_element::force_output(output_context& /*ctx*/) {
    if (state_ == output_state::closed) { return; }
    if (state_ == output_state::pending) { write_start(); }
    force_child_output();
    write_end();
  }

  std::string
  output_element::path_segment() const {
    std::string segment = "/";
    if (ns_) {
      if (auto prefix = context().prefix_for(ns_->uri());
          prefix && !prefix->empty()) {
        segment += *prefix + ':';
      } else if (ns_->preferred_prefix() && !ns_->preferred_prefix()->empty()) {
        segment += *ns_->preferred_prefix() + ':';
      }
    }
    return segment + local_name_;
  }

} // namespace xso
