#include <xso/buffered_element.hpp>

namespace xso {

  void
  buffered_element::release() {
    if (released_) { return; }
    released_ = true;
    notify_released();
  }

  bool
  buffered_element::do_output(output_context& ctx, bool can_close) {
    // Nothing, not even the start tag, goes out while anything inside is
    // still buffered.
    if (state_ == output_state::pending &&
        (!released_ || blocked_descendants() > 0)) {
      return false;
    }
    return output_element::do_output(ctx, can_close);
  }

  void
  buffered_element::force_output(output_context& ctx) {
    released_ = true;
    output_element::force_output(ctx);
  }

} // namespace xso
