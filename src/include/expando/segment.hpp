#pragma once

#include <expando/alphabetic.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace expando {

  // ---------------------------------------------------------------------------
  // Segment node types
  // ---------------------------------------------------------------------------

  struct literal_segment {
    std::string text;

    bool
    operator==(const literal_segment&) const = default;
  };

  struct alternatives_segment {
    std::vector<std::string> values;

    bool
    operator==(const alternatives_segment&) const = default;
  };

  // Every integer in [low, high], left-padded with '0' to pad_width.
  struct numeric_range_segment {
    uint64_t low = 0;
    uint64_t high = 0;
    std::size_t pad_width = 1;

    bool
    operator==(const numeric_range_segment&) const = default;
  };

  // Every bijective base-26 rank in [low_rank, high_rank].
  struct alphabetic_range_segment {
    uint64_t low_rank = 1;
    uint64_t high_rank = 1;
    letter_case letters = letter_case::lower;

    bool
    operator==(const alphabetic_range_segment&) const = default;
  };

  // ---------------------------------------------------------------------------
  // Segment
  // ---------------------------------------------------------------------------

  class segment {
  public:
    using variant_type =
        std::variant<literal_segment, alternatives_segment,
                     numeric_range_segment, alphabetic_range_segment>;

    segment(variant_type v) : data_(std::move(v)) {}

    segment(literal_segment v) : data_(std::move(v)) {}

    segment(alternatives_segment v) : data_(std::move(v)) {}

    segment(numeric_range_segment v) : data_(std::move(v)) {}

    segment(alphabetic_range_segment v) : data_(std::move(v)) {}

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    // Number of values denoted. An inverted range denotes none. Throws
    // std::length_error for a range spanning all 2^64 values, which the
    // parser never produces.
    uint64_t
    size() const;

    // Appends the value at index (index < size()) to out.
    void
    append_value(std::string& out, uint64_t index) const;

    std::string
    value_at(uint64_t index) const;

    // Materializes every value. Only meant for small segments.
    std::vector<std::string>
    values() const;

    bool
    operator==(const segment&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const segment& s);

  private:
    variant_type data_;
  };

} // namespace expando
