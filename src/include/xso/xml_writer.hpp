#pragma once

#include <xso/qname.hpp>

#include <optional>
#include <string_view>

namespace xso {

  // Append-only sink. Implementations write every call in order and report
  // failures by throwing; the only state they keep is the open start tag,
  // which still accepts attribute() and namespace_declaration().
  class xml_writer {
  public:
    virtual ~xml_writer() = default;

    virtual void
    xml_declaration(std::string_view version, std::string_view encoding,
                    std::optional<bool> standalone) = 0;

    virtual void
    doctype(std::string_view root_name, std::string_view system_id,
            std::string_view public_id, std::string_view internal_subset) = 0;

    virtual void
    start_element(const qname& name) = 0;

    virtual void
    end_element() = 0;

    virtual void
    attribute(const qname& name, std::string_view value) = 0;

    virtual void
    namespace_declaration(std::string_view prefix, std::string_view uri) = 0;

    virtual void
    characters(std::string_view text) = 0;

    virtual void
    cdata(std::string_view text) = 0;

    virtual void
    comment(std::string_view text) = 0;

    virtual void
    entity_ref(std::string_view name) = 0;

    virtual void
    processing_instruction(std::string_view target, std::string_view data) = 0;

    virtual void
    flush() = 0;
  };

} // namespace xso
