#include <expando/alphabetic.hpp>
#include <expando/syntax_error.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>
#include <string>

using namespace expando;

TEST_CASE("to_alphabetic single letters", "[alphabetic]") {
  CHECK(to_alphabetic(1, letter_case::lower) == "a");
  CHECK(to_alphabetic(2, letter_case::lower) == "b");
  CHECK(to_alphabetic(26, letter_case::lower) == "z");
  CHECK(to_alphabetic(1, letter_case::upper) == "A");
  CHECK(to_alphabetic(26, letter_case::upper) == "Z");
}

TEST_CASE("to_alphabetic carries without a zero digit", "[alphabetic]") {
  CHECK(to_alphabetic(27, letter_case::lower) == "aa");
  CHECK(to_alphabetic(52, letter_case::lower) == "az");
  CHECK(to_alphabetic(53, letter_case::lower) == "ba");
  CHECK(to_alphabetic(702, letter_case::lower) == "zz");
  CHECK(to_alphabetic(703, letter_case::lower) == "aaa");
  CHECK(to_alphabetic(28, letter_case::upper) == "AB");
}

TEST_CASE("to_alphabetic rejects rank zero", "[alphabetic]") {
  CHECK_THROWS_AS(to_alphabetic(0, letter_case::lower), std::invalid_argument);
}

TEST_CASE("from_alphabetic computes bijective ranks", "[alphabetic]") {
  CHECK(from_alphabetic("a", letter_case::lower) == 1);
  CHECK(from_alphabetic("z", letter_case::lower) == 26);
  CHECK(from_alphabetic("aa", letter_case::lower) == 27);
  CHECK(from_alphabetic("ay", letter_case::lower) == 51);
  CHECK(from_alphabetic("bc", letter_case::lower) == 55);
  CHECK(from_alphabetic("ZZ", letter_case::upper) == 702);
}

TEST_CASE("from_alphabetic rejects characters of the wrong case",
          "[alphabetic]") {
  SECTION("upper in lower") {
    try {
      from_alphabetic("aBc", letter_case::lower);
      FAIL("expected syntax_error");
    } catch (const syntax_error& e) {
      CHECK(e.position() == 1);
      CHECK(std::string(e.what()).find("'B'") != std::string::npos);
    }
  }
  SECTION("lower in upper") {
    CHECK_THROWS_AS(from_alphabetic("Ab", letter_case::upper), syntax_error);
  }
  SECTION("digit") {
    CHECK_THROWS_AS(from_alphabetic("a1", letter_case::lower), syntax_error);
  }
  SECTION("empty") {
    CHECK_THROWS_AS(from_alphabetic("", letter_case::lower), syntax_error);
  }
}

TEST_CASE("from_alphabetic rejects ranks wider than 64 bits",
          "[alphabetic]") {
  CHECK_NOTHROW(from_alphabetic(std::string(13, 'z'), letter_case::lower));
  CHECK_THROWS_AS(from_alphabetic(std::string(14, 'z'), letter_case::lower),
                  syntax_error);
}

TEST_CASE("alphabetic conversions are inverse", "[alphabetic]") {
  for (uint64_t n = 1; n <= 10000; ++n) {
    REQUIRE(from_alphabetic(to_alphabetic(n, letter_case::lower),
                            letter_case::lower) == n);
    REQUIRE(from_alphabetic(to_alphabetic(n, letter_case::upper),
                            letter_case::upper) == n);
  }
}

TEST_CASE("case_of classifies letter strings", "[alphabetic]") {
  CHECK(case_of("abc") == letter_case::lower);
  CHECK(case_of("XYZ") == letter_case::upper);
  CHECK_FALSE(case_of("Az").has_value());
  CHECK_FALSE(case_of("a1").has_value());
  CHECK_FALSE(case_of("").has_value());
}

TEST_CASE("ASCII character class helpers", "[alphabetic]") {
  CHECK(is_ascii_digits("0123456789"));
  CHECK_FALSE(is_ascii_digits(""));
  CHECK_FALSE(is_ascii_digits("12a"));
  CHECK(is_ascii_alpha("aBc"));
  CHECK_FALSE(is_ascii_alpha(""));
  CHECK_FALSE(is_ascii_alpha("\xc3\xa9"));
}
