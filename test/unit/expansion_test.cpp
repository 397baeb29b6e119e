#include <expando/pattern.hpp>

#include <catch2/catch.hpp>

#include <iterator>
#include <string>
#include <utility>
#include <vector>

using namespace expando;

using strings = std::vector<std::string>;

namespace {

  strings
  expand_all(const std::string& text) {
    auto p = pattern::parse(text);
    strings out;
    for (const auto& s : p.expand())
      out.push_back(s);
    return out;
  }

  template <typename T>
  concept expandable = requires(T&& p) { std::forward<T>(p).expand(); };

} // namespace

TEST_CASE("expand: text without groups yields itself", "[expansion]") {
  for (const auto* text : {"Hello, World!", "a-b,c", "  spaced  ", "x"}) {
    CHECK(expand_all(text) == strings{text});
  }
}

TEST_CASE("expand: empty pattern yields one empty string", "[expansion]") {
  CHECK(expand_all("") == strings{""});
}

TEST_CASE("expand: one set", "[expansion]") {
  CHECK(expand_all("https://example.com/{a,b,c}/file") ==
        strings{
            "https://example.com/a/file",
            "https://example.com/b/file",
            "https://example.com/c/file",
        });
}

TEST_CASE("expand: set members are trimmed", "[expansion]") {
  CHECK(expand_all("{ a ,b , c}") == strings{"a", "b", "c"});
}

TEST_CASE("expand: two sets in row-major order", "[expansion]") {
  CHECK(expand_all("https://example.com/{a,b,c}/file/{x,y,z}") ==
        strings{
            "https://example.com/a/file/x",
            "https://example.com/a/file/y",
            "https://example.com/a/file/z",
            "https://example.com/b/file/x",
            "https://example.com/b/file/y",
            "https://example.com/b/file/z",
            "https://example.com/c/file/x",
            "https://example.com/c/file/y",
            "https://example.com/c/file/z",
        });
}

TEST_CASE("expand: zero-padded numeric range", "[expansion]") {
  auto out = expand_all("[080-120]");
  REQUIRE(out.size() == 41);
  CHECK(out.front() == "080");
  CHECK(out[1] == "081");
  CHECK(out[20] == "100");
  CHECK(out.back() == "120");
}

TEST_CASE("expand: composed numeric ranges", "[expansion]") {
  CHECK(expand_all("[1-2]/[099-101]") == strings{
                                             "1/099",
                                             "1/100",
                                             "1/101",
                                             "2/099",
                                             "2/100",
                                             "2/101",
                                         });
}

TEST_CASE("expand: alphabetic ranges", "[expansion]") {
  CHECK(expand_all("[A-C]") == strings{"A", "B", "C"});
  CHECK(expand_all("[ay-bc]") == strings{"ay", "az", "ba", "bb", "bc"});
  CHECK(expand_all("[y-ab]") == strings{"y", "z", "aa", "ab"});

  auto upper = expand_all("[AB-ZZ]");
  REQUIRE(upper.size() == 675);
  CHECK(upper.front() == "AB");
  CHECK(upper.back() == "ZZ");
}

TEST_CASE("expand: mixed groups", "[expansion]") {
  CHECK(expand_all("img-{s,l}-[a-b][1-2].png") == strings{
                                                       "img-s-a1.png",
                                                       "img-s-a2.png",
                                                       "img-s-b1.png",
                                                       "img-s-b2.png",
                                                       "img-l-a1.png",
                                                       "img-l-a2.png",
                                                       "img-l-b1.png",
                                                       "img-l-b2.png",
                                                   });
}

TEST_CASE("expand: empty range empties the product", "[expansion]") {
  CHECK(expand_all("[5-3]").empty());
  CHECK(expand_all("x{a,b}[5-3]y").empty());
  CHECK(expand_all("[c-a]{a,b}").empty());
}

TEST_CASE("expand: empty alternatives member", "[expansion]") {
  CHECK(expand_all("a{,b}c") == strings{"ac", "abc"});
}

TEST_CASE("expand: restartable", "[expansion]") {
  auto p = pattern::parse("{a,b}[1-3]");
  strings first(p.expand().begin(), p.expand().end());
  strings second(p.expand().begin(), p.expand().end());
  CHECK(first.size() == 6);
  CHECK(first == second);

  auto range = p.expand();
  strings third(range.begin(), range.end());
  strings fourth(range.begin(), range.end());
  CHECK(third == first);
  CHECK(fourth == first);
}

TEST_CASE("expand: independent iterators do not interfere", "[expansion]") {
  auto p = pattern::parse("[1-3]");
  auto range = p.expand();
  auto a = range.begin();
  auto b = range.begin();
  ++a;
  ++a;
  CHECK(*a == "3");
  CHECK(*b == "1");
  ++b;
  CHECK(*b == "2");
}

TEST_CASE("expand: early stop on a huge product", "[expansion]") {
  auto p = pattern::parse("[0-18446744073709551614]-[0-18446744073709551614]");
  strings head;
  for (const auto& s : p.expand()) {
    head.push_back(s);
    if (head.size() == 3) break;
  }
  CHECK(head == strings{"0-0", "0-1", "0-2"});
}

TEST_CASE("expand: iterator protocol", "[expansion]") {
  auto p = pattern::parse("{a,b}");
  auto range = p.expand();
  auto it = range.begin();
  CHECK(it != range.end());
  CHECK(it->size() == 1);
  auto old = it++;
  CHECK(*old == "a");
  CHECK(*it == "b");
  ++it;
  CHECK(it == range.end());
  ++it;
  CHECK(it == range.end());
  CHECK(std::distance(range.begin(), range.end()) == 2);
}

TEST_CASE("expand: only a named pattern can be expanded", "[expansion]") {
  static_assert(expandable<pattern&>);
  static_assert(expandable<const pattern&>);
  static_assert(!expandable<pattern>);
  static_assert(!expandable<const pattern>);

  const auto p = pattern::parse("https://example.com/{alpha,beta}/[1-2]");
  strings out;
  for (const auto& s : p.expand())
    out.push_back(s);
  CHECK(out == strings{
                   "https://example.com/alpha/1",
                   "https://example.com/alpha/2",
                   "https://example.com/beta/1",
                   "https://example.com/beta/2",
               });
}

TEST_CASE("expand: iterator exposes the chosen indices", "[expansion]") {
  auto p = pattern::parse("x{a,b}[1-3]");
  auto range = p.expand();
  auto it = range.begin();
  CHECK(it.indices() == std::vector<uint64_t>{0, 0, 0});
  ++it;
  ++it;
  ++it;
  CHECK(*it == "xb1");
  CHECK(it.indices() == std::vector<uint64_t>{0, 1, 0});
}
