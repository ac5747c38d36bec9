#include <xso/outputtable.hpp>

#include <stdexcept>

namespace xso {

  void
  outputtable::link_next(std::shared_ptr<outputtable> next) {
    if (next_) {
      throw std::logic_error("outputtable: next sibling is already linked");
    }
    next_ = std::move(next);
  }

} // namespace xso
