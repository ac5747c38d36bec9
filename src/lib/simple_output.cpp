#include <xso/output_context.hpp>
#include <xso/simple_output.hpp>

#include <type_traits>

namespace xso {

  bool
  simple_output::do_output(output_context& ctx, bool /*can_close*/) {
    force_output(ctx);
    return true;
  }

  void
  simple_output::force_output(output_context& ctx) {
    std::visit(
        [&ctx](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, characters>) {
            ctx.write_characters(v.text);
          } else if constexpr (std::is_same_v<T, cdata>) {
            ctx.write_cdata(v.text);
          } else if constexpr (std::is_same_v<T, comment>) {
            ctx.write_comment(v.text);
          } else if constexpr (std::is_same_v<T, entity_ref>) {
            ctx.write_entity_ref(v.name);
          } else if constexpr (std::is_same_v<T, processing_instruction>) {
            ctx.write_processing_instruction(v.target, v.data);
          } else if constexpr (std::is_same_v<T, attribute>) {
            ctx.write_attribute(v.ns.get(), v.local_name, v.value);
          } else if constexpr (std::is_same_v<T, namespace_decl>) {
            ctx.write_namespace(*v.ns);
          } else {
            ctx.write_doctype(v.root_name, v.system_id, v.public_id,
                              v.internal_subset);
          }
        },
        content_);
  }

} // namespace xso
