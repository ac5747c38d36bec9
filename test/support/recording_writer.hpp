#pragma once

#include <xso/xml_writer.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace xso::test {

  // Sink that records each call as one line, e.g. "start p:item" or
  // "text hello". A call whose line equals fail_on throws instead.
  class recording_writer : public xml_writer {
  public:
    std::vector<std::string> events;
    std::optional<std::string> fail_on;

    void
    xml_declaration(std::string_view version, std::string_view /*encoding*/,
                    std::optional<bool> /*standalone*/) override {
      record("declaration " + std::string(version));
    }

    void
    doctype(std::string_view root_name, std::string_view /*system_id*/,
            std::string_view /*public_id*/,
            std::string_view /*internal_subset*/) override {
      record("doctype " + std::string(root_name));
    }

    void
    start_element(const qname& name) override {
      record("start " + name.lexical());
    }

    void
    end_element() override {
      record("end");
    }

    void
    attribute(const qname& name, std::string_view value) override {
      record("attr " + name.lexical() + "=" + std::string(value));
    }

    void
    namespace_declaration(std::string_view prefix,
                          std::string_view uri) override {
      record("xmlns " + std::string(prefix) + "=" + std::string(uri));
    }

    void
    characters(std::string_view text) override {
      record("text " + std::string(text));
    }

    void
    cdata(std::string_view text) override {
      record("cdata " + std::string(text));
    }

    void
    comment(std::string_view text) override {
      record("comment " + std::string(text));
    }

    void
    entity_ref(std::string_view name) override {
      record("entity " + std::string(name));
    }

    void
    processing_instruction(std::string_view target,
                           std::string_view data) override {
      record("pi " + std::string(target) + " " + std::string(data));
    }

    void
    flush() override {
      record("flush");
    }

  private:
    void
    record(std::string event) {
      if (fail_on && *fail_on == event) {
        throw std::runtime_error("recording_writer: write failed");
      }
      events.push_back(std::move(event));
    }
  };

} // namespace xso::test
