#include <xso/buffered_fragment.hpp>

namespace xso {

  buffered_fragment::buffered_fragment(std::shared_ptr<output_context> ctx)
      : output_container(std::move(ctx)) {}

  void
  buffered_fragment::release() {
    if (released_) { return; }
    released_ = true;
    notify_released();
  }

  bool
  buffered_fragment::can_output_new_child() {
    switch (state_) {
      case output_state::closed:
        throw_closed();
      case output_state::pending:
        return false;
      case output_state::open:
        break;
    }
    return close_and_output_children();
  }

  bool
  buffered_fragment::do_output(output_context& /*ctx*/, bool can_close) {
    if (state_ == output_state::closed) { throw_closed(); }
    if (state_ == output_state::pending) {
      if (!released_ || blocked_descendants() > 0) { return false; }
      state_ = output_state::open;
    }

    if (!can_close) {
      close_all_but_last_child();
      return false;
    }
    if (!close_and_output_children()) { return false; }
    state_ = output_state::closed;
    return true;
  }

  void
  buffered_fragment::force_output(output_context& /*ctx*/) {
    if (state_ == output_state::closed) { return; }
    released_ = true;
    state_ = output_state::open;
    force_child_output();
    state_ = output_state::closed;
  }

} // namespace xso
