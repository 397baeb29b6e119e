#include <expando/segment.hpp>

#include <limits>
#include <stdexcept>
#include <type_traits>

namespace expando {

  namespace {

    uint64_t
    span_size(uint64_t low, uint64_t high) {
      if (low > high) return 0;
      uint64_t span = high - low;
      if (span == std::numeric_limits<uint64_t>::max()) {
        throw std::length_error("segment: range of 2^64 values");
      }
      return span + 1;
    }

    void
    append_padded(std::string& out, uint64_t value, std::size_t width) {
      auto digits = std::to_string(value);
      if (digits.size() < width) out.append(width - digits.size(), '0');
      out += digits;
    }

    std::string
    padded(uint64_t value, std::size_t width) {
      std::string out;
      append_padded(out, value, width);
      return out;
    }

  } // namespace

  uint64_t
  segment::size() const {
    return std::visit(
        [](const auto& node) -> uint64_t {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, literal_segment>) {
            return 1;
          } else if constexpr (std::is_same_v<T, alternatives_segment>) {
            return node.values.size();
          } else if constexpr (std::is_same_v<T, numeric_range_segment>) {
            return span_size(node.low, node.high);
          } else {
            return span_size(node.low_rank, node.high_rank);
          }
        },
        data_);
  }

  void
  segment::append_value(std::string& out, uint64_t index) const {
    if (index >= size()) {
      throw std::out_of_range("segment: value index " + std::to_string(index) +
                              " out of range");
    }
    std::visit(
        [&](const auto& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, literal_segment>) {
            out += node.text;
          } else if constexpr (std::is_same_v<T, alternatives_segment>) {
            out += node.values[static_cast<std::size_t>(index)];
          } else if constexpr (std::is_same_v<T, numeric_range_segment>) {
            append_padded(out, node.low + index, node.pad_width);
          } else {
            out += to_alphabetic(node.low_rank + index, node.letters);
          }
        },
        data_);
  }

  std::string
  segment::value_at(uint64_t index) const {
    std::string out;
    append_value(out, index);
    return out;
  }

  std::vector<std::string>
  segment::values() const {
    std::vector<std::string> result;
    auto n = size();
    for (uint64_t i = 0; i < n; ++i)
      result.push_back(value_at(i));
    return result;
  }

  std::ostream&
  operator<<(std::ostream& os, const segment& s) {
    std::visit(
        [&](const auto& node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, literal_segment>) {
            os << "literal \"" << node.text << '"';
          } else if constexpr (std::is_same_v<T, alternatives_segment>) {
            os << "alternatives {";
            for (std::size_t i = 0; i < node.values.size(); ++i) {
              if (i > 0) os << ',';
              os << node.values[i];
            }
            os << '}';
          } else if constexpr (std::is_same_v<T, numeric_range_segment>) {
            os << "numeric [" << padded(node.low, node.pad_width) << '-'
               << padded(node.high, node.pad_width) << ']';
          } else {
            os << "alphabetic [" << to_alphabetic(node.low_rank, node.letters)
               << '-' << to_alphabetic(node.high_rank, node.letters) << ']';
          }
        },
        s.data_);
    return os;
  }

} // namespace expando
