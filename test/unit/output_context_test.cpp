#include <xso/buffered_fragment.hpp>
#include <xso/output_context.hpp>
#include <xso/output_element.hpp>
#include <xso/output_factory.hpp>

#include <catch2/catch_test_macros.hpp>

#include "recording_writer.hpp"

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace xso;

namespace {

  output_config
  no_declaration() {
    output_config config;
    config.xml_declaration = false;
    return config;
  }

} // namespace

// ===== namespace table =====

TEST_CASE("context: one namespace instance per URI", "[output_context]") {
  test::recording_writer writer;
  output_context ctx(writer);

  auto a = ctx.get_namespace("urn:a");
  CHECK(a == ctx.get_namespace("urn:a"));
  CHECK(a != ctx.get_namespace("urn:b"));
  CHECK(a->uri() == "urn:a");
  CHECK_FALSE(a->preferred_prefix().has_value());
  CHECK(a->is_valid_in(ctx));
}

TEST_CASE("context: empty URI means no namespace", "[output_context]") {
  test::recording_writer writer;
  output_context ctx(writer);

  CHECK(ctx.get_namespace("") == nullptr);
  CHECK(ctx.get_namespace("", "p") == nullptr);
}

TEST_CASE("context: first preferred prefix sticks", "[output_context]") {
  test::recording_writer writer;
  output_context ctx(writer);

  auto ns = ctx.get_namespace("urn:a", "a");
  CHECK(ctx.get_namespace("urn:a", "other") == ns);
  REQUIRE(ns->preferred_prefix().has_value());
  CHECK(*ns->preferred_prefix() == "a");
}

TEST_CASE("context: namespace from another context is re-resolved",
          "[output_context]") {
  test::recording_writer writer1;
  test::recording_writer writer2;
  output_factory factory(no_declaration());
  auto root1 = factory.create_output_fragment(writer1);
  auto root2 = factory.create_output_fragment(writer2);

  auto foreign = root2->get_namespace("urn:shared", "s");
  CHECK_FALSE(foreign->is_valid_in(root1->context()));

  auto resolved = root1->context().resolve(foreign);
  CHECK(resolved != foreign);
  CHECK(resolved->is_valid_in(root1->context()));
  CHECK(resolved == root1->get_namespace("urn:shared"));

  auto element = root1->add_element(foreign, "item");
  CHECK(element->ns() == resolved);
  CHECK(writer1.events ==
        std::vector<std::string>{"start s:item", "xmlns s=urn:shared"});
  CHECK(writer2.events.empty());
}

// ===== prefix binding =====

TEST_CASE("context: prefixes are generated when none is preferred",
          "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);

  root->add_element(root->get_namespace("urn:a"), "a");
  root->close();

  CHECK(os.str() == R"(<ns1:a xmlns:ns1="urn:a"/>)");
}

TEST_CASE("context: generated prefixes use the configured stem",
          "[output_context]") {
  auto config = no_declaration();
  config.prefix_base = "gen";
  std::ostringstream os;
  auto root = output_factory(config).create_output_fragment(os);

  root->add_element(root->get_namespace("urn:a"), "a");
  root->close();

  CHECK(os.str() == R"(<gen1:a xmlns:gen1="urn:a"/>)");
}

TEST_CASE("context: generated prefixes skip bound ones", "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);

  auto a = root->add_element(root->get_namespace("urn:a", "ns1"), "a");
  a->add_element(root->get_namespace("urn:b"), "b");
  root->close();

  CHECK(os.str() ==
        R"(<ns1:a xmlns:ns1="urn:a"><ns2:b xmlns:ns2="urn:b"/></ns1:a>)");
}

TEST_CASE("context: empty preferred prefix binds the default namespace",
          "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);

  auto ns = root->get_namespace("urn:a", "");
  auto a = root->add_element(ns, "a");
  a->add_element(ns, "b");
  root->close();

  CHECK(os.str() == R"(<a xmlns="urn:a"><b/></a>)");
}

TEST_CASE("context: element in no namespace undoes the default namespace",
          "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);

  auto a = root->add_element(root->get_namespace("urn:a", ""), "a");
  a->add_element("b");
  root->close();

  CHECK(os.str() == R"(<a xmlns="urn:a"><b xmlns=""/></a>)");
}

TEST_CASE("context: attributes never use the default namespace",
          "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);

  auto a = root->add_element("a");
  a->add_attribute(root->get_namespace("urn:x", ""), "k", "v");
  root->close();

  CHECK(os.str() == R"(<a xmlns:ns1="urn:x" ns1:k="v"/>)");
}

TEST_CASE("context: attributes reuse the element's prefix",
          "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);

  auto ns = root->get_namespace("urn:p", "p");
  auto a = root->add_element(ns, "a");
  a->add_attribute(ns, "k", "v");
  root->close();

  CHECK(os.str() == R"(<p:a xmlns:p="urn:p" p:k="v"/>)");
}

TEST_CASE("context: bindings are scoped to elements", "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);

  auto ns1 = root->get_namespace("urn:1", "p");
  auto ns2 = root->get_namespace("urn:2", "p");
  auto a = root->add_element(ns1, "a");
  a->add_element(ns2, "b");
  a->add_element(ns1, "c");
  root->close();

  CHECK(
      os.str() ==
      R"(<p:a xmlns:p="urn:1"><p:b xmlns:p="urn:2"/><p:c/></p:a>)");
}

TEST_CASE("context: the xml prefix is always bound", "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);

  auto a = root->add_element("a");
  a->add_attribute(
      root->get_namespace("http://www.w3.org/XML/1998/namespace"), "lang",
      "en");
  root->close();

  CHECK(os.str() == R"(<a xml:lang="en"/>)");
}

// ===== indentation =====

TEST_CASE("context: indentation of nested markup", "[output_context]") {
  std::ostringstream os;
  auto config = with_space_indentation(no_declaration(), 2);
  auto root = output_factory(config).create_output_fragment(os);

  auto a = root->add_element("a");
  auto b = a->add_element("b");
  b->add_characters("t");
  a->add_element("c");
  root->close();

  CHECK(os.str() == "<a>\n  <b>t</b>\n  <c/>\n</a>");
}

TEST_CASE("context: mixed content is not indented", "[output_context]") {
  std::ostringstream os;
  auto config = with_space_indentation(no_declaration(), 2);
  auto root = output_factory(config).create_output_fragment(os);

  auto p = root->add_element("p");
  p->add_characters("one ");
  p->add_element("b")->add_characters("two");
  p->add_characters(" three");
  root->close();

  CHECK(os.str() == "<p>one <b>two</b> three</p>");
}

TEST_CASE("context: indentation past the covered levels stays at the last "
          "level",
          "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);
  root->set_indentation("\n  ", 1, 1);

  auto a = root->add_element("a");
  auto b = a->add_element("b");
  auto c = b->add_element("c");
  c->add_element("d");
  root->close();

  CHECK(os.str() == "<a>\n <b>\n  <c>\n  <d/>\n  </c>\n </b>\n</a>");
}

TEST_CASE("context: space indentation width is limited", "[output_context]") {
  CHECK_NOTHROW(with_space_indentation({}, max_space_indent_width));
  CHECK_THROWS_AS(with_space_indentation({}, max_space_indent_width + 1),
                  std::invalid_argument);
  CHECK_THROWS_AS(with_space_indentation({}, static_cast<std::size_t>(-1)),
                  std::invalid_argument);
}

TEST_CASE("context: failed start tag leaves depth and indentation intact",
          "[output_context]") {
  test::recording_writer writer;
  auto root = output_factory(no_declaration()).create_output_fragment(writer);
  root->set_indentation("\n    ", 1, 2);
  auto& ctx = root->context();

  auto a = root->add_element("a");
  auto frag = a->add_buffered(a->create_buffered_fragment());
  frag->add_element("b")->add_element("c");
  CHECK(ctx.depth() == 1);

  writer.fail_on = "start b";
  CHECK_THROWS_AS(root->close(), std::runtime_error);
  CHECK(ctx.depth() == 1);

  writer.fail_on.reset();
  root->close();
  CHECK(ctx.depth() == 0);
  CHECK(writer.events ==
        std::vector<std::string>{"start a", "text \n  ", "start b",
                                 "text \n    ", "start c", "end",
                                 "text \n  ", "end", "text \n", "end",
                                 "flush"});
}

TEST_CASE("context: namespace from a destroyed context is not valid in a new "
          "one",
          "[output_context]") {
  test::recording_writer writer;
  output_factory factory(no_declaration());

  std::shared_ptr<const output_namespace> stale;
  {
    auto root = factory.create_output_fragment(writer);
    stale = root->get_namespace("urn:a", "a");
    CHECK(stale->is_valid_in(root->context()));
  }

  auto root = factory.create_output_fragment(writer);
  CHECK_FALSE(stale->is_valid_in(root->context()));
  auto resolved = root->context().resolve(stale);
  CHECK(resolved != stale);
  CHECK(resolved->is_valid_in(root->context()));
}

TEST_CASE("context: custom indentation string", "[output_context]") {
  std::ostringstream os;
  auto root = output_factory(no_declaration()).create_output_fragment(os);
  root->set_indentation("\n\t\t\t", 1, 1);

  auto a = root->add_element("a");
  auto b = a->add_element("b");
  b->add_element("c");
  b->add_comment("x");
  root->close();

  CHECK(os.str() == "<a>\n\t<b>\n\t\t<c/>\n\t\t<!--x-->\n\t</b>\n</a>");
}

TEST_CASE("context: depth follows open elements", "[output_context]") {
  test::recording_writer writer;
  auto root = output_factory(no_declaration()).create_output_fragment(writer);
  auto& ctx = root->context();

  CHECK(ctx.depth() == 0);
  auto a = root->add_element("a");
  CHECK(ctx.depth() == 1);
  a->add_element("b");
  CHECK(ctx.depth() == 2);
  root->add_element("c");
  CHECK(ctx.depth() == 1);
  root->close();
  CHECK(ctx.depth() == 0);
  CHECK_THROWS_AS(ctx.write_end_element(), std::logic_error);
}
