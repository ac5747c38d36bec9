#pragma once

#include <xso/output_container.hpp>

#include <memory>
#include <string>

namespace xso {

  // Top-level container. Content added to it is written as soon as nothing
  // before it is buffered; close() writes out whatever is still pending.
  class root_fragment : public output_container {
    bool active_ = true;

  public:
    explicit root_fragment(std::shared_ptr<output_context> ctx);

    bool
    can_output_new_child() override;

    // Write all pending content, including unreleased buffers, and flush the
    // sink. Every later mutating call throws.
    virtual void
    close();

    bool
    is_closed() const {
      return !active_;
    }

  protected:
    bool
    do_output(output_context& ctx, bool can_close) override;

    void
    force_output(output_context& ctx) override;

    bool
    is_writing_through() const override {
      return active_;
    }

    std::string
    path_segment() const override {
      return {};
    }
  };

} // namespace xso
