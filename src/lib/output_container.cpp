#include <xso/buffered_element.hpp>
#include <xso/buffered_fragment.hpp>
#include <xso/output_container.hpp>
#include <xso/output_element.hpp>
#include <xso/xml_value.hpp>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace xso {

  output_container::output_container(std::shared_ptr<output_context> ctx)
      : context_(std::move(ctx)) {
    if (!context_) {
      throw std::invalid_argument("output_container: null output context");
    }
  }

  // Unlink the queue one node at a time so a long run of pending siblings
  // does not tear down recursively.
  output_container::~output_container() {
    while (first_child_) {
      auto next = std::move(first_child_->next_);
      first_child_ = std::move(next);
    }
  }

  void
  output_container::set_indentation(std::string indent,
                                    std::size_t start_offset,
                                    std::size_t step) {
    context_->set_indentation(std::move(indent), start_offset, step);
  }

  std::shared_ptr<const output_namespace>
  output_container::get_namespace(std::string_view uri) {
    return context_->get_namespace(uri);
  }

  std::shared_ptr<const output_namespace>
  output_container::get_namespace(std::string_view uri,
                                  std::string_view preferred_prefix) {
    return context_->get_namespace(uri, preferred_prefix);
  }

  // ===== simple content =====

  void
  output_container::add_characters(std::string_view text) {
    if (can_output_new_child()) {
      context_->write_characters(text);
    } else {
      link_new_child(context_->create_characters(text));
    }
  }

  void
  output_container::add_value(bool value) {
    add_characters(format(value));
  }

  void
  output_container::add_value(int32_t value) {
    add_characters(format(value));
  }

  void
  output_container::add_value(int64_t value) {
    add_characters(format(value));
  }

  void
  output_container::add_value(uint32_t value) {
    add_characters(format(value));
  }

  void
  output_container::add_value(uint64_t value) {
    add_characters(format(value));
  }

  void
  output_container::add_value(double value) {
    add_characters(format(value));
  }

  void
  output_container::add_cdata(std::string_view text) {
    if (can_output_new_child()) {
      context_->write_cdata(text);
    } else {
      link_new_child(context_->create_cdata(text));
    }
  }

  void
  output_container::add_comment(std::string_view text) {
    if (can_output_new_child()) {
      context_->write_comment(text);
    } else {
      link_new_child(context_->create_comment(text));
    }
  }

  void
  output_container::add_entity_ref(std::string_view name) {
    if (can_output_new_child()) {
      context_->write_entity_ref(name);
    } else {
      link_new_child(context_->create_entity_ref(name));
    }
  }

  void
  output_container::add_processing_instruction(std::string_view target,
                                               std::string_view data) {
    if (can_output_new_child()) {
      context_->write_processing_instruction(target, data);
    } else {
      link_new_child(context_->create_processing_instruction(target, data));
    }
  }

  // ===== elements and buffered content =====

  std::shared_ptr<output_element>
  output_container::add_element(std::shared_ptr<const output_namespace> ns,
                                std::string_view local_name) {
    ns = context_->resolve(ns);

    bool blocked = !can_output_new_child();
    auto element = std::make_shared<output_element>(context_, std::move(ns),
                                                    std::string(local_name));
    link_new_child(element);
    element->link_parent(shared_from_this(), blocked);
    return element;
  }

  std::shared_ptr<output_element>
  output_container::add_element(std::string_view local_name) {
    return add_element(nullptr, local_name);
  }

  std::shared_ptr<output_element>
  output_container::add_element_with_characters(
      std::shared_ptr<const output_namespace> ns, std::string_view local_name,
      std::string_view text) {
    auto element = add_element(std::move(ns), local_name);
    element->add_characters(text);
    return element;
  }

  void
  output_container::link_buffered(const std::shared_ptr<output_container>& node,
                                  bool buffered) {
    if (node->context_ != context_) {
      throw std::invalid_argument(
          "output_container: buffered node belongs to another output context");
    }
    // Drains the queue, and rejects a closed container
    can_output_new_child();

    node->link_parent(shared_from_this());
    link_new_child(node);

    std::size_t blocking = node->blocked_descendants_ + (buffered ? 1 : 0);
    if (blocking > 0) { add_blocked(blocking); }

    // Released before it was added: nothing else will report it
    if (!buffered) { node->cascade_release(); }
  }

  std::shared_ptr<buffered_fragment>
  output_container::create_buffered_fragment() const {
    return std::make_shared<buffered_fragment>(context_);
  }

  std::shared_ptr<buffered_element>
  output_container::create_buffered_element(
      std::shared_ptr<const output_namespace> ns,
      std::string_view local_name) const {
    return std::make_shared<buffered_element>(
        context_, context_->resolve(ns), std::string(local_name));
  }

  // ===== queue =====

  void
  output_container::link_new_child(std::shared_ptr<outputtable> child) {
    outputtable* raw = child.get();
    if (last_child_ == nullptr) {
      first_child_ = std::move(child);
    } else {
      last_child_->link_next(std::move(child));
    }
    last_child_ = raw;
  }

  void
  output_container::link_parent(const std::shared_ptr<output_container>& parent) {
    if (has_parent_) {
      throw std::logic_error("output_container: cannot re-set the parent of " +
                             path() + " once it has been set");
    }
    parent_ = parent;
    has_parent_ = true;
  }

  void
  output_container::pop_front() {
    auto done = std::move(first_child_);
    first_child_ = std::move(done->next_);
    if (!first_child_) { last_child_ = nullptr; }
  }

  // Algorithm A: close and write children from the front until one of them
  // is still blocked.
  bool
  output_container::close_and_output_children() {
    while (first_child_) {
      if (!first_child_->do_output(*context_, true)) { return false; }
      pop_front();
    }
    return true;
  }

  // Algorithm B: as above, but the last child is left open.
  bool
  output_container::close_all_but_last_child() {
    while (first_child_) {
      bool last = first_child_.get() == last_child_;
      if (!first_child_->do_output(*context_, !last)) { return false; }
      pop_front();
    }
    return true;
  }

  // A child is removed only once it has been written, so a failing sink
  // leaves it at the front and written siblings are never repeated.
  void
  output_container::force_child_output() {
    while (first_child_) {
      first_child_->force_output(*context_);
      pop_front();
    }
    blocked_descendants_ = 0;
  }

  // ===== release cascade =====

  void
  output_container::add_blocked(std::size_t count) {
    for (auto node = shared_from_this(); node; node = node->parent_.lock()) {
      node->blocked_descendants_ += count;
    }
  }

  void
  output_container::remove_blocked(std::size_t count) {
    for (auto node = shared_from_this(); node; node = node->parent_.lock()) {
      node->blocked_descendants_ -= std::min(count, node->blocked_descendants_);
    }
  }

  void
  output_container::notify_released() {
    auto parent = parent_.lock();
    if (!parent) { return; }
    parent->remove_blocked(1);
    cascade_release();
  }

  // Only the outermost container can tell whether the released content is
  // next in document order: walk up to it and let it drain from the front.
  // The drain recurses into the front child, so everything that became
  // writable (ancestors, later siblings) goes out in this one pass.
  void
  output_container::cascade_release() {
    std::shared_ptr<output_container> child = shared_from_this();
    std::shared_ptr<output_container> top = parent_.lock();
    if (!top) { return; }
    for (auto up = top->parent_.lock(); up; up = up->parent_.lock()) {
      child = top;
      top = up;
    }
    top->child_released(*child);
  }

  // Anything queued ahead of child is still blocked on its own, so only a
  // release below the front child can let the queue move.
  void
  output_container::child_released(const outputtable& child) {
    if (is_writing_through() && first_child_.get() == &child) {
      close_all_but_last_child();
    }
  }

  // ===== diagnostics =====

  std::string
  output_container::path() const {
    std::vector<std::string> segments{path_segment()};
    for (auto node = parent_.lock(); node; node = node->parent_.lock()) {
      segments.push_back(node->path_segment());
    }
    std::string result;
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
      result += *it;
    }
    return result.empty() ? "/" : result;
  }

  std::size_t
  output_container::pending_children() const {
    std::size_t count = 0;
    for (const outputtable* n = first_child_.get(); n != nullptr;
         n = n->next_.get()) {
      ++count;
    }
    return count;
  }

  void
  output_container::throw_closed() const {
    throw std::logic_error("output_container: illegal call when " + path() +
                           " is already closed");
  }

} // namespace xso
