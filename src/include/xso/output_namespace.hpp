#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace xso {

  class output_context;

  // Canonical namespace handle. A context hands out exactly one instance per
  // URI, so handles from the same context compare by identity.
  class output_namespace {
    std::string uri_;
    std::optional<std::string> preferred_prefix_;
    std::uint64_t owner_id_;

  public:
    output_namespace(std::string uri,
                     std::optional<std::string> preferred_prefix,
                     std::uint64_t owner_id)
        : uri_(std::move(uri)), preferred_prefix_(std::move(preferred_prefix)),
          owner_id_(owner_id) {}

    const std::string&
    uri() const {
      return uri_;
    }

    // Unset: let the context generate a prefix. Empty: bind as the default
    // namespace where an element name uses it.
    const std::optional<std::string>&
    preferred_prefix() const {
      return preferred_prefix_;
    }

    void
    set_preferred_prefix(std::string prefix) {
      preferred_prefix_ = std::move(prefix);
    }

    // Defined with output_context.
    bool
    is_valid_in(const output_context& ctx) const;
  };

} // namespace xso
