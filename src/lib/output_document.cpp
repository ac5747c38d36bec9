#include <xso/output_document.hpp>

namespace xso {

  output_document::output_document(std::shared_ptr<output_context> ctx)
      : root_fragment(std::move(ctx)) {
    if (context().config().xml_declaration) { context().write_xml_declaration(); }
  }

  void
  output_document::add_doctype_decl(std::string_view root_name,
                                    std::string_view system_id,
                                    std::string_view public_id,
                                    std::string_view internal_subset) {
    if (can_output_new_child()) {
      context().write_doctype(root_name, system_id, public_id,
                              internal_subset);
    } else {
      link_new_child(context().create_doctype(root_name, system_id, public_id,
                                              internal_subset));
    }
  }

} // namespace xso
