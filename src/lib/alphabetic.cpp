#include <expando/alphabetic.hpp>

#include <expando/syntax_error.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace expando {

  namespace {

    constexpr uint64_t radix = 26;

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

  } // namespace

  std::string
  to_alphabetic(uint64_t rank, letter_case letters) {
    if (rank == 0) {
      throw std::invalid_argument("to_alphabetic: rank must be positive");
    }
    const char base = letters == letter_case::upper ? 'A' : 'a';
    std::string out;
    while (rank != 0) {
      --rank;
      out.push_back(static_cast<char>(base + rank % radix));
      rank /= radix;
    }
    std::reverse(out.begin(), out.end());
    return out;
  }

  uint64_t
  from_alphabetic(std::string_view text, letter_case letters) {
    if (text.empty()) {
      throw syntax_error("from_alphabetic: empty string", 0);
    }
    const char base = letters == letter_case::upper ? 'A' : 'a';
    const auto in_case = letters == letter_case::upper ? is_upper : is_lower;

    uint64_t rank = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
      char c = text[i];
      if (!in_case(c)) {
        throw syntax_error(std::string("from_alphabetic: unexpected "
                                       "character '") +
                               c + "' at position " + std::to_string(i),
                           i);
      }
      uint64_t digit = static_cast<uint64_t>(c - base) + 1;
      if (rank > (std::numeric_limits<uint64_t>::max() - digit) / radix) {
        throw syntax_error("from_alphabetic: value out of range", i);
      }
      rank = rank * radix + digit;
    }
    return rank;
  }

  std::optional<letter_case>
  case_of(std::string_view text) {
    if (text.empty()) return std::nullopt;
    if (std::all_of(text.begin(), text.end(), is_lower))
      return letter_case::lower;
    if (std::all_of(text.begin(), text.end(), is_upper))
      return letter_case::upper;
    return std::nullopt;
  }

  bool
  is_ascii_alpha(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(),
                       [](char c) { return is_lower(c) || is_upper(c); });
  }

  bool
  is_ascii_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
      return c >= '0' && c <= '9';
    });
  }

} // namespace expando
