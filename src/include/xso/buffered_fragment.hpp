#pragma once

#include <xso/bufferable.hpp>
#include <xso/output_container.hpp>

#include <memory>
#include <string>

namespace xso {

  // Sequence of nodes without markup of its own, held back until released.
  // Once released and reached in document order it stays open, writing new
  // content straight through, until its parent moves on past it.
  class buffered_fragment final : public output_container, public bufferable {
    enum class output_state { pending, open, closed };

    output_state state_ = output_state::pending;
    bool released_ = false;

  public:
    explicit buffered_fragment(std::shared_ptr<output_context> ctx);

    void
    release() override;

    bool
    is_buffered() const override {
      return !released_;
    }

    bool
    is_closed() const {
      return state_ == output_state::closed;
    }

    bool
    can_output_new_child() override;

  protected:
    bool
    do_output(output_context& ctx, bool can_close) override;

    void
    force_output(output_context& ctx) override;

    bool
    is_writing_through() const override {
      return state_ == output_state::open;
    }

    std::string
    path_segment() const override {
      return "/{fragment}";
    }
  };

} // namespace xso
