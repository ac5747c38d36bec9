#pragma once

#include <xso/bufferable.hpp>
#include <xso/output_element.hpp>

namespace xso {

  // Element whose start tag, content and end tag are all held back until it
  // is released and nothing buffered remains inside it.
  class buffered_element final : public output_element, public bufferable {
    bool released_ = false;

  public:
    using output_element::output_element;

    void
    release() override;

    bool
    is_buffered() const override {
      return !released_;
    }

  protected:
    bool
    do_output(output_context& ctx, bool can_close) override;

    void
    force_output(output_context& ctx) override;
  };

} // namespace xso
