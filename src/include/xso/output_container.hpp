#pragma once

#include <xso/bufferable.hpp>
#include <xso/output_context.hpp>
#include <xso/outputtable.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>

namespace xso {

  class buffered_element;
  class buffered_fragment;
  class output_element;

  // Output node that can hold children. Every add_* call either writes
  // straight through the context, when nothing before it in document order
  // is still pending, or creates a node and appends it to the queue of
  // pending children.
  //
  // Containers are always owned through std::shared_ptr: queued children are
  // owned by their container, the parent link is a weak reference.
  class output_container
      : public outputtable,
        public std::enable_shared_from_this<output_container> {
    std::shared_ptr<output_context> context_;
    std::weak_ptr<output_container> parent_;
    bool has_parent_ = false;

    // Pending children in document order; empty exactly when last_child_ is
    // null.
    std::shared_ptr<outputtable> first_child_;
    outputtable* last_child_ = nullptr;

    // Unreleased bufferable nodes queued anywhere below this container.
    std::size_t blocked_descendants_ = 0;

  public:
    ~output_container() override;

    output_context&
    context() const {
      return *context_;
    }

    const std::shared_ptr<output_context>&
    shared_context() const {
      return context_;
    }

    // Null for roots and for buffered nodes that have not been added yet.
    std::shared_ptr<output_container>
    parent() const {
      return parent_.lock();
    }

    void
    set_indentation(std::string indent, std::size_t start_offset,
                    std::size_t step);

    std::shared_ptr<const output_namespace>
    get_namespace(std::string_view uri);

    std::shared_ptr<const output_namespace>
    get_namespace(std::string_view uri, std::string_view preferred_prefix);

    // ---------------------------------------------------------------------
    // Simple content
    // ---------------------------------------------------------------------

    void
    add_characters(std::string_view text);

    void
    add_value(bool value);
    void
    add_value(int32_t value);
    void
    add_value(int64_t value);
    void
    add_value(uint32_t value);
    void
    add_value(uint64_t value);
    void
    add_value(double value);
    void
    add_value(const char*) = delete;

    void
    add_cdata(std::string_view text);

    void
    add_comment(std::string_view text);

    void
    add_entity_ref(std::string_view name);

    void
    add_processing_instruction(std::string_view target,
                               std::string_view data);

    // ---------------------------------------------------------------------
    // Elements and buffered content
    // ---------------------------------------------------------------------

    // A null namespace means no namespace. Namespaces obtained from another
    // context are re-resolved by URI.
    std::shared_ptr<output_element>
    add_element(std::shared_ptr<const output_namespace> ns,
                std::string_view local_name);

    std::shared_ptr<output_element>
    add_element(std::string_view local_name);

    std::shared_ptr<output_element>
    add_element_with_characters(std::shared_ptr<const output_namespace> ns,
                                std::string_view local_name,
                                std::string_view text);

    template <typename Buffered>
    std::shared_ptr<Buffered>
    add_buffered(std::shared_ptr<Buffered> buffered) {
      static_assert(std::is_base_of_v<bufferable, Buffered>,
                    "add_buffered takes a buffered fragment or element");
      link_buffered(buffered, buffered->is_buffered());
      return buffered;
    }

    template <typename Buffered>
    std::shared_ptr<Buffered>
    add_and_release_buffered(std::shared_ptr<Buffered> buffered) {
      add_buffered(buffered);
      buffered->release();
      return buffered;
    }

    std::shared_ptr<buffered_fragment>
    create_buffered_fragment() const;

    std::shared_ptr<buffered_element>
    create_buffered_element(std::shared_ptr<const output_namespace> ns,
                            std::string_view local_name) const;

    // Drain what can be drained; true when the queue is empty and new
    // content can go straight to the sink.
    virtual bool
    can_output_new_child() = 0;

    // ---------------------------------------------------------------------
    // Diagnostics
    // ---------------------------------------------------------------------

    // XPath-like location of this node, for error messages.
    std::string
    path() const;

    std::size_t
    pending_children() const;

  protected:
    explicit output_container(std::shared_ptr<output_context> ctx);

    // Location step of this node alone, e.g. "/ns1:item".
    virtual std::string
    path_segment() const = 0;

    // True while the start of this container has been written and its end
    // has not, so that children reaching the front of the queue may be
    // written.
    virtual bool
    is_writing_through() const = 0;

    // A bufferable node below this container was released; child is the
    // direct child on the path to it.
    void
    child_released(const outputtable& child);

    void
    link_new_child(std::shared_ptr<outputtable> child);

    void
    link_parent(const std::shared_ptr<output_container>& parent);

    bool
    close_and_output_children();

    bool
    close_all_but_last_child();

    void
    force_child_output();

    std::size_t
    blocked_descendants() const {
      return blocked_descendants_;
    }

    // Called by bufferable subclasses from release().
    void
    notify_released();

    [[noreturn]] void
    throw_closed() const;

  private:
    void
    link_buffered(const std::shared_ptr<output_container>& node,
                  bool buffered);

    void
    pop_front();

    void
    add_blocked(std::size_t count);

    void
    remove_blocked(std::size_t count);

    void
    cascade_release();
  };

} // namespace xso
