#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace xso {

  struct output_config {
    bool xml_declaration = true;
    std::string version = "1.0";
    std::string encoding = "UTF-8";
    std::optional<bool> standalone;

    // Whitespace written before a node at nesting level n is the first
    // indent_offset + n * indent_step characters of indent, clamped to its
    // length: levels past the end of indent all get the whole string.
    // Empty disables.
    std::string indent;
    std::size_t indent_offset = 0;
    std::size_t indent_step = 0;

    // Stem of generated namespace prefixes: ns1, ns2, ...
    std::string prefix_base = "ns";
  };

  // Levels covered by with_space_indentation. Deeper nesting is indented as
  // the last covered level.
  inline constexpr std::size_t space_indent_levels = 32;
  inline constexpr std::size_t max_space_indent_width = 64;

  // Newline followed by `width` spaces per level.
  inline output_config
  with_space_indentation(output_config config, std::size_t width) {
    if (width > max_space_indent_width) {
      throw std::invalid_argument(
          "output_config: indent width " + std::to_string(width) +
          " exceeds " + std::to_string(max_space_indent_width));
    }
    config.indent = "\n" + std::string(width * space_indent_levels, ' ');
    config.indent_offset = 1;
    config.indent_step = width;
    return config;
  }

} // namespace xso
