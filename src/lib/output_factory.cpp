#include <xso/output_factory.hpp>
#include <xso/ostream_writer.hpp>

namespace xso {

  std::shared_ptr<output_document>
  output_factory::create_output_document(xml_writer& writer) const {
    return std::make_shared<output_document>(
        std::make_shared<output_context>(writer, config_));
  }

  std::shared_ptr<output_document>
  output_factory::create_output_document(std::ostream& os) const {
    return std::make_shared<output_document>(std::make_shared<output_context>(
        std::make_unique<ostream_writer>(os), config_));
  }

  std::shared_ptr<root_fragment>
  output_factory::create_output_fragment(xml_writer& writer) const {
    return std::make_shared<root_fragment>(
        std::make_shared<output_context>(writer, config_));
  }

  std::shared_ptr<root_fragment>
  output_factory::create_output_fragment(std::ostream& os) const {
    return std::make_shared<root_fragment>(std::make_shared<output_context>(
        std::make_unique<ostream_writer>(os), config_));
  }

} // namespace xso
