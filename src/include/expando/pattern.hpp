#pragma once

#include <expando/segment.hpp>
#include <expando/syntax_error.hpp>

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ostream>
#include <string>
#include <vector>

namespace expando {

  // Lazy cartesian product over a segment sequence. The first segment varies
  // slowest. Holds only a reference to the segments, so the owning pattern
  // must outlive it. Each begin() starts a fresh enumeration.
  class expansion {
  public:
    class iterator {
    public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = std::string;
      using difference_type = std::ptrdiff_t;
      using pointer = const std::string*;
      using reference = const std::string&;

      iterator() = default;

      reference
      operator*() const {
        return current_;
      }

      pointer
      operator->() const {
        return &current_;
      }

      // Position of the current value within each segment.
      const std::vector<uint64_t>&
      indices() const {
        return indices_;
      }

      iterator&
      operator++();

      iterator
      operator++(int) {
        auto copy = *this;
        ++*this;
        return copy;
      }

      friend bool
      operator==(const iterator& a, const iterator& b) {
        if (a.done_ || b.done_) return a.done_ == b.done_;
        return a.segments_ == b.segments_ && a.indices_ == b.indices_;
      }

    private:
      friend class expansion;

      explicit iterator(const std::vector<segment>& segments);

      void
      compose();

      const std::vector<segment>* segments_ = nullptr;
      std::vector<uint64_t> indices_;
      std::string current_;
      bool done_ = true;
    };

    explicit expansion(const std::vector<segment>& segments)
        : segments_(&segments) {}

    iterator
    begin() const {
      return iterator(*segments_);
    }

    iterator
    end() const {
      return iterator();
    }

  private:
    const std::vector<segment>* segments_;
  };

  class pattern {
  public:
    // Throws syntax_error on malformed input.
    static pattern
    parse(std::string text);

    const std::string&
    as_text() const {
      return text_;
    }

    const std::vector<segment>&
    segments() const {
      return segments_;
    }

    expansion
    expand() const& {
      return expansion(segments_);
    }

    // The expansion borrows the segments, so a temporary cannot expand.
    void
    expand() const&& = delete;

    // Size of the product, saturating at UINT64_MAX. Range endpoints are
    // always below UINT64_MAX, so a single segment never saturates.
    uint64_t
    count() const;

    bool
    operator==(const pattern&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const pattern& p) {
      return os << p.text_;
    }

  private:
    pattern(std::string text, std::vector<segment> segments)
        : text_(std::move(text)), segments_(std::move(segments)) {}

    std::string text_;
    std::vector<segment> segments_;
  };

} // namespace expando
