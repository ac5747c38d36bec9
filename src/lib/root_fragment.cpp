#include <xso/root_fragment.hpp>

namespace xso {

  root_fragment::root_fragment(std::shared_ptr<output_context> ctx)
      : output_container(std::move(ctx)) {}

  bool
  root_fragment::can_output_new_child() {
    if (!active_) { throw_closed(); }
    return close_and_output_children();
  }

  void
  root_fragment::close() {
    force_output(context());
    context().flush();
  }

  bool
  root_fragment::do_output(output_context& /*ctx*/, bool can_close) {
    if (!active_) { throw_closed(); }
    if (!can_close) {
      close_all_but_last_child();
      return false;
    }
    if (!close_and_output_children()) { return false; }
    active_ = false;
    return true;
  }

  // active_ only drops once everything went out, so a close() that failed
  // in the sink can be attempted again.
  void
  root_fragment::force_output(output_context& /*ctx*/) {
    if (!active_) { throw_closed(); }
    force_child_output();
    active_ = false;
  }

} // namespace xso
