#pragma once

#include <xso/output_document.hpp>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xso_cli {

  // Input was not well-formed XML.
  class parse_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  struct copy_counts {
    std::size_t elements = 0;
    std::size_t attributes = 0;
    std::size_t text_nodes = 0;
  };

  struct copy_options {
    // Drop text that is only whitespace, so indentation can take its place.
    bool strip_whitespace = false;
    // Reserve the first child of the root element for a count comment.
    bool summary = false;
  };

  // Feeds expat push-parser events into an output document as they arrive.
  class xml_copier {
    struct impl;
    std::unique_ptr<impl> impl_;

  public:
    xml_copier(std::shared_ptr<xso::output_document> doc, copy_options opts);
    ~xml_copier();

    xml_copier(const xml_copier&) = delete;
    xml_copier&
    operator=(const xml_copier&) = delete;

    // Parse the next chunk of input. Throws parse_error for malformed input
    // and lets errors from the output tree propagate.
    void
    feed(std::string_view chunk);

    // End of input: writes the summary, if any, and closes the document.
    void
    finish();

    const copy_counts&
    counts() const;
  };

} // namespace xso_cli
