#include <xso/qname.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <unordered_set>

using namespace xso;

TEST_CASE("qname: lexical form", "[qname]") {
  CHECK(qname("", "a").lexical() == "a");
  CHECK(qname("urn:x", "a").lexical() == "a");
  CHECK(qname("urn:x", "a", "x").lexical() == "x:a");
}

TEST_CASE("qname: equality includes the prefix", "[qname]") {
  CHECK(qname("urn:x", "a", "x") == qname("urn:x", "a", "x"));
  CHECK(qname("urn:x", "a", "x") != qname("urn:x", "a", "y"));
  CHECK(qname("urn:x", "a") < qname("urn:y", "a"));
}

TEST_CASE("qname: hashable and printable", "[qname]") {
  std::unordered_set<qname> names{qname("urn:x", "a"), qname("urn:x", "a"),
                                  qname("", "b")};
  CHECK(names.size() == 2);

  std::ostringstream os;
  os << qname("urn:x", "a", "x") << ' ' << qname("", "b");
  CHECK(os.str() == "{urn:x}x:a b");
}
