#pragma once

#include <xso/root_fragment.hpp>

#include <memory>
#include <string_view>

namespace xso {

  // Root of a complete document: the XML declaration is written on
  // construction (unless disabled in the configuration).
  class output_document : public root_fragment {
  public:
    explicit output_document(std::shared_ptr<output_context> ctx);

    void
    add_doctype_decl(std::string_view root_name,
                     std::string_view system_id = {},
                     std::string_view public_id = {},
                     std::string_view internal_subset = {});
  };

} // namespace xso
