#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xso {

  inline void
  escape_text(std::ostream& os, std::string_view text) {
    for (char c : text) {
      switch (c) {
        case '<':
          os << "&lt;";
          break;
        case '>':
          os << "&gt;";
          break;
        case '&':
          os << "&amp;";
          break;
        case '\r':
          os << "&#13;";
          break;
        default:
          os << c;
          break;
      }
    }
  }

  inline void
  escape_attribute(std::ostream& os, std::string_view text) {
    for (char c : text) {
      switch (c) {
        case '<':
          os << "&lt;";
          break;
        case '>':
          os << "&gt;";
          break;
        case '&':
          os << "&amp;";
          break;
        case '"':
          os << "&quot;";
          break;
        case '\n':
          os << "&#10;";
          break;
        case '\t':
          os << "&#9;";
          break;
        case '\r':
          os << "&#13;";
          break;
        default:
          os << c;
          break;
      }
    }
  }

  // "]]>" cannot appear inside a CDATA section; split it across two
  // sections so the "]]" ends one and ">" starts the next.
  inline void
  write_cdata_sections(std::ostream& os, std::string_view text) {
    os << "<![CDATA[";
    std::size_t start = 0;
    for (auto pos = text.find("]]>"); pos != std::string_view::npos;
         pos = text.find("]]>", start)) {
      os << text.substr(start, pos + 2 - start) << "]]><![CDATA[";
      start = pos + 2;
    }
    os << text.substr(start) << "]]>";
  }

  inline void
  check_comment_text(std::string_view text) {
    if (text.find("--") != std::string_view::npos ||
        (!text.empty() && text.back() == '-')) {
      throw std::invalid_argument("comment text cannot contain \"--\" or end "
                                  "with '-': " +
                                  std::string(text));
    }
  }

  inline void
  check_processing_instruction(std::string_view target, std::string_view data) {
    if (target.empty()) {
      throw std::invalid_argument("processing instruction target is empty");
    }
    if (data.find("?>") != std::string_view::npos) {
      throw std::invalid_argument(
          "processing instruction data cannot contain \"?>\": " +
          std::string(data));
    }
  }

} // namespace xso
