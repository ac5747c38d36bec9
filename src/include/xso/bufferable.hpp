#pragma once

namespace xso {

  // Output node that starts out blocked: it holds its content, and blocks
  // everything after it in document order, until released.
  class bufferable {
  public:
    virtual ~bufferable() = default;

    // Mark the content as complete. Repeated calls have no effect.
    virtual void
    release() = 0;

    virtual bool
    is_buffered() const = 0;
  };

} // namespace xso
