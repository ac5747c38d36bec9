#pragma once

#include <memory>

namespace xso {

  class output_context;
  class output_container;

  // Unit of output placed in a container's queue of pending children.
  class outputtable {
    friend class output_container;

    std::shared_ptr<outputtable> next_;

  public:
    virtual ~outputtable() = default;

    outputtable(const outputtable&) = delete;
    outputtable&
    operator=(const outputtable&) = delete;

  protected:
    outputtable() = default;

    // Emit as much as can be emitted now. Returns true when this node and
    // everything it owns has been written. can_close is false for the last
    // pending child of a container, which must be left open.
    virtual bool
    do_output(output_context& ctx, bool can_close) = 0;

    // Emit this node and everything it owns, releasing any buffering.
    virtual void
    force_output(output_context& ctx) = 0;

    void
    link_next(std::shared_ptr<outputtable> next);
  };

} // namespace xso
