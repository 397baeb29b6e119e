#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace expando {

  enum class letter_case : uint8_t { lower, upper };

  // Bijective base-26: a=1 ... z=26, aa=27. There is no zero digit.
  std::string
  to_alphabetic(uint64_t rank, letter_case letters);

  uint64_t
  from_alphabetic(std::string_view text, letter_case letters);

  // Case shared by every character of text, or nullopt if text is empty,
  // mixes cases or contains anything besides ASCII letters.
  std::optional<letter_case>
  case_of(std::string_view text);

  bool
  is_ascii_alpha(std::string_view text);

  bool
  is_ascii_digits(std::string_view text);

} // namespace expando
