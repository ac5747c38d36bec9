#pragma once

#include <xso/output_container.hpp>
#include <xso/xml_value.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace xso {

  class output_element : public output_container {
    friend class output_container;

  protected:
    enum class output_state {
      pending,    // linked while blocked; nothing written yet
      attributes, // start tag written, attributes still accepted
      children,   // content added
      closed,     // end tag written
    };

    std::shared_ptr<const output_namespace> ns_;
    std::string local_name_;
    output_state state_ = output_state::pending;
    bool has_content_ = false;

  public:
    output_element(std::shared_ptr<output_context> ctx,
                   std::shared_ptr<const output_namespace> ns,
                   std::string local_name);

    const std::string&
    local_name() const {
      return local_name_;
    }

    const std::shared_ptr<const output_namespace>&
    ns() const {
      return ns_;
    }

    bool
    is_closed() const {
      return state_ == output_state::closed;
    }

    // Attributes have to be added before any content.
    void
    add_attribute(std::shared_ptr<const output_namespace> ns,
                  std::string_view local_name, std::string_view value);

    void
    add_attribute(std::string_view local_name, std::string_view value);

    // Typed attribute value in its XML Schema lexical form.
    template <typename T>
    void
    add_value_attribute(std::shared_ptr<const output_namespace> ns,
                        std::string_view local_name, T value) {
      add_attribute(std::move(ns), local_name, format(value));
    }

    // Bind ns on this element even if no name on it uses the namespace.
    void
    predeclare_namespace(std::shared_ptr<const output_namespace> ns);

    bool
    can_output_new_child() override;

  protected:
    void
    link_parent(const std::shared_ptr<output_container>& parent, bool blocked);

    bool
    do_output(output_context& ctx, bool can_close) override;

    void
    force_output(output_context& ctx) override;

    bool
    is_writing_through() const override {
      return state_ == output_state::attributes ||
             state_ == output_state::children;
    }

    std::string
    path_segment() const override;

    void
    write_start();

    void
    write_end();

  private:
    void
    check_attribute_allowed(const char* what) const;
  };

} // namespace xso
