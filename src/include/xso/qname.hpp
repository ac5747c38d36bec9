#pragma once

#include <compare>
#include <functional>
#include <ostream>
#include <string>

namespace xso {

  // Qualified name as handed to a sink. The prefix is the one bound by the
  // output context; an empty prefix writes the local name unqualified.
  class qname {
    std::string namespace_uri_;
    std::string local_name_;
    std::string prefix_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name,
          std::string prefix = {})
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)), prefix_(std::move(prefix)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    const std::string&
    prefix() const {
      return prefix_;
    }

    // Name as it appears in markup: "prefix:local" or "local".
    std::string
    lexical() const {
      if (prefix_.empty()) { return local_name_; }
      return prefix_ + ':' + local_name_;
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      if (q.namespace_uri_.empty()) { return os << q.local_name_; }
      return os << '{' << q.namespace_uri_ << '}' << q.lexical();
    }
  };

} // namespace xso

template <>
struct std::hash<xso::qname> {
  std::size_t
  operator()(const xso::qname& q) const noexcept {
    std::size_t h1 = std::hash<std::string>{}(q.namespace_uri());
    std::size_t h2 = std::hash<std::string>{}(q.local_name());
    std::size_t h3 = std::hash<std::string>{}(q.prefix());
    return h1 ^ (h2 << 1) ^ (h3 << 2);
  }
};
