#include <xso/buffered_fragment.hpp>
#include <xso/output_element.hpp>
#include <xso/output_factory.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace xso;

TEST_CASE("document: default xml declaration", "[output_document]") {
  std::ostringstream os;
  auto doc = output_factory().create_output_document(os);

  doc->add_element("r");
  doc->close();

  CHECK(os.str() == R"(<?xml version="1.0" encoding="UTF-8"?><r/>)");
}

TEST_CASE("document: configured declaration", "[output_document]") {
  output_config config;
  config.encoding = "ISO-8859-1";
  config.standalone = true;
  std::ostringstream os;
  auto doc = output_factory(config).create_output_document(os);

  doc->close();

  CHECK(os.str() ==
        R"(<?xml version="1.0" encoding="ISO-8859-1" standalone="yes"?>)");
}

TEST_CASE("document: declaration disabled", "[output_document]") {
  output_config config;
  config.xml_declaration = false;
  std::ostringstream os;
  auto doc = output_factory(config).create_output_document(os);

  doc->add_element("r");
  doc->close();

  CHECK(os.str() == "<r/>");
}

TEST_CASE("document: doctype declaration", "[output_document]") {
  std::ostringstream os;
  auto doc = output_factory().create_output_document(os);

  SECTION("system id") {
    doc->add_doctype_decl("html", "about:legacy-compat");
    doc->add_element("html");
    doc->close();
    CHECK(os.str() == R"(<?xml version="1.0" encoding="UTF-8"?>)"
                      R"(<!DOCTYPE html SYSTEM "about:legacy-compat"><html/>)");
  }

  SECTION("public id") {
    doc->add_doctype_decl("html",
                          "http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd",
                          "-//W3C//DTD XHTML 1.0 Strict//EN");
    doc->close();
    CHECK(os.str() ==
          R"(<?xml version="1.0" encoding="UTF-8"?>)"
          R"(<!DOCTYPE html PUBLIC "-//W3C//DTD XHTML 1.0 Strict//EN" )"
          R"("http://www.w3.org/TR/xhtml1/DTD/xhtml1-strict.dtd">)");
  }
}

TEST_CASE("document: doctype queued behind buffered content",
          "[output_document]") {
  output_config config;
  config.xml_declaration = false;
  std::ostringstream os;
  auto doc = output_factory(config).create_output_document(os);

  auto frag = doc->add_buffered(doc->create_buffered_fragment());
  frag->add_comment("c");
  doc->add_doctype_decl("r");
  doc->add_element("r");
  CHECK(os.str().empty());

  frag->release();
  doc->close();
  CHECK(os.str() == "<!--c--><!DOCTYPE r><r/>");
}

TEST_CASE("document: indented output", "[output_document]") {
  std::ostringstream os;
  auto doc = output_factory(with_space_indentation({}, 2))
                 .create_output_document(os);

  auto a = doc->add_element("a");
  a->add_element("b");
  doc->close();

  CHECK(os.str() ==
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<a>\n  <b/>\n</a>");
}

TEST_CASE("document: close writes held content", "[output_document]") {
  output_config config;
  config.xml_declaration = false;
  std::ostringstream os;
  auto doc = output_factory(config).create_output_document(os);

  auto r = doc->add_element("r");
  auto frag = r->add_buffered(r->create_buffered_fragment());
  frag->add_characters("held");
  r->add_characters(" tail");
  CHECK(os.str().empty());

  doc->close();
  CHECK(os.str() == "<r>held tail</r>");
}

TEST_CASE("document: close twice throws", "[output_document]") {
  std::ostringstream os;
  auto doc = output_factory().create_output_document(os);

  doc->close();
  CHECK(doc->is_closed());
  CHECK_THROWS_AS(doc->close(), std::logic_error);
  CHECK_THROWS_AS(doc->add_doctype_decl("r"), std::logic_error);
}

TEST_CASE("fragment: several top-level elements and no declaration",
          "[root_fragment]") {
  std::ostringstream os;
  auto root = output_factory().create_output_fragment(os);

  root->add_element("a");
  root->add_element("b");
  root->close();

  CHECK(os.str() == "<a/><b/>");
}
