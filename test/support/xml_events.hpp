#pragma once

#include <expat.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace xso::test {

  namespace detail {

    struct event_collector {
      std::vector<std::string> events;
      std::string text;

      void
      flush_text() {
        if (text.empty()) return;
        events.push_back("text " + text);
        text.clear();
      }

      // Expat reports "uri|local" for namespaced names
      static std::string
      clark(const char* name) {
        std::string s(name);
        auto bar = s.find('|');
        if (bar == std::string::npos) return s;
        return "{" + s.substr(0, bar) + "}" + s.substr(bar + 1);
      }

      static void XMLCALL
      on_start(void* data, const char* name, const char** atts) {
        auto* self = static_cast<event_collector*>(data);
        self->flush_text();
        self->events.push_back("start " + clark(name));
        for (const char** p = atts; *p != nullptr; p += 2) {
          self->events.push_back("attr " + clark(p[0]) + "=" + p[1]);
        }
      }

      static void XMLCALL
      on_end(void* data, const char* name) {
        auto* self = static_cast<event_collector*>(data);
        self->flush_text();
        self->events.push_back("end " + clark(name));
      }

      static void XMLCALL
      on_text(void* data, const char* s, int len) {
        static_cast<event_collector*>(data)->text.append(
            s, static_cast<std::size_t>(len));
      }

      static void XMLCALL
      on_comment(void* data, const char* text) {
        auto* self = static_cast<event_collector*>(data);
        self->flush_text();
        self->events.push_back(std::string("comment ") + text);
      }
    };

  } // namespace detail

  // Re-parse serialized output into namespace-resolved events:
  // "start {uri}local", "attr name=value", "text ...", "comment ...",
  // "end {uri}local". Throws std::runtime_error if it is not well-formed.
  inline std::vector<std::string>
  parse_events(std::string_view xml) {
    XML_Parser parser = XML_ParserCreateNS(nullptr, '|');
    if (parser == nullptr) {
      throw std::runtime_error("failed to create expat parser");
    }
    detail::event_collector collector;
    XML_SetUserData(parser, &collector);
    XML_SetElementHandler(parser, detail::event_collector::on_start,
                          detail::event_collector::on_end);
    XML_SetCharacterDataHandler(parser, detail::event_collector::on_text);
    XML_SetCommentHandler(parser, detail::event_collector::on_comment);

    XML_Status status =
        XML_Parse(parser, xml.data(), static_cast<int>(xml.size()), XML_TRUE);
    if (status == XML_STATUS_ERROR) {
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser));
      XML_ParserFree(parser);
      throw std::runtime_error(msg);
    }
    XML_ParserFree(parser);
    return collector.events;
  }

} // namespace xso::test
