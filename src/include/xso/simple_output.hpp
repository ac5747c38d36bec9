#pragma once

#include <xso/output_namespace.hpp>
#include <xso/outputtable.hpp>

#include <memory>
#include <string>
#include <variant>

namespace xso {

  // Leaf content that was queued because its container was blocked. Once the
  // container reaches it, it is written in one step.
  class simple_output : public outputtable {
  public:
    struct characters {
      std::string text;
    };

    struct cdata {
      std::string text;
    };

    struct comment {
      std::string text;
    };

    struct entity_ref {
      std::string name;
    };

    struct processing_instruction {
      std::string target;
      std::string data;
    };

    struct attribute {
      std::shared_ptr<const output_namespace> ns;
      std::string local_name;
      std::string value;
    };

    struct namespace_decl {
      std::shared_ptr<const output_namespace> ns;
    };

    struct doctype {
      std::string root_name;
      std::string system_id;
      std::string public_id;
      std::string internal_subset;
    };

    using content = std::variant<characters, cdata, comment, entity_ref,
                                 processing_instruction, attribute,
                                 namespace_decl, doctype>;

    explicit simple_output(content c) : content_(std::move(c)) {}

    const content&
    value() const {
      return content_;
    }

  protected:
    bool
    do_output(output_context& ctx, bool can_close) override;

    void
    force_output(output_context& ctx) override;

  private:
    content content_;
  };

} // namespace xso
