#pragma once

#include <xso/output_config.hpp>
#include <xso/output_document.hpp>
#include <xso/root_fragment.hpp>
#include <xso/xml_writer.hpp>

#include <memory>
#include <ostream>

namespace xso {

  // Entry point: creates output roots with a fresh context each. The writer
  // or stream passed in must outlive the returned root.
  class output_factory {
    output_config config_;

  public:
    output_factory() = default;

    explicit output_factory(output_config config)
        : config_(std::move(config)) {}

    const output_config&
    config() const {
      return config_;
    }

    std::shared_ptr<output_document>
    create_output_document(xml_writer& writer) const;

    std::shared_ptr<output_document>
    create_output_document(std::ostream& os) const;

    std::shared_ptr<root_fragment>
    create_output_fragment(xml_writer& writer) const;

    std::shared_ptr<root_fragment>
    create_output_fragment(std::ostream& os) const;
  };

} // namespace xso
