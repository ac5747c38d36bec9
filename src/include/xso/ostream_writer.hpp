#pragma once

#include <xso/xml_writer.hpp>

#include <memory>
#include <ostream>

namespace xso {

  class ostream_writer : public xml_writer {
  public:
    explicit ostream_writer(std::ostream& os);
    ~ostream_writer() override;

    ostream_writer(const ostream_writer&) = delete;
    ostream_writer&
    operator=(const ostream_writer&) = delete;
    ostream_writer(ostream_writer&&) noexcept;
    ostream_writer&
    operator=(ostream_writer&&) noexcept;

    void
    xml_declaration(std::string_view version, std::string_view encoding,
                    std::optional<bool> standalone) override;

    void
    doctype(std::string_view root_name, std::string_view system_id,
            std::string_view public_id,
            std::string_view internal_subset) override;

    void
    start_element(const qname& name) override;

    void
    end_element() override;

    void
    attribute(const qname& name, std::string_view value) override;

    void
    namespace_declaration(std::string_view prefix,
                          std::string_view uri) override;

    void
    characters(std::string_view text) override;

    void
    cdata(std::string_view text) override;

    void
    comment(std::string_view text) override;

    void
    entity_ref(std::string_view name) override;

    void
    processing_instruction(std::string_view target,
                           std::string_view data) override;

    void
    flush() override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xso
