#include <expando/pattern.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <optional>
#include <string_view>

namespace expando {

  namespace {

    // Endpoints stay below this so every range size fits in uint64_t.
    constexpr uint64_t max_endpoint = std::numeric_limits<uint64_t>::max();

    enum class parse_state {
      plain,
      in_alternatives,
      in_range_start, // after '[', before '-'
      in_range_end,   // after '-', before ']'
    };

    bool
    is_space(char c) {
      return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
             c == '\v';
    }

    std::string
    trim(std::string_view s) {
      auto first = std::find_if_not(s.begin(), s.end(), is_space);
      auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
      if (first >= last) return {};
      return std::string(first, last);
    }

    std::string
    quoted(char c) {
      return std::string("'") + c + "'";
    }

    // -----------------------------------------------------------------------
    // Parser
    // -----------------------------------------------------------------------

    class parser {
    public:
      explicit parser(const std::string& source) : src_(source) {}

      std::vector<segment>
      run() {
        for (pos_ = 0; pos_ < src_.size(); ++pos_) {
          char c = src_[pos_];
          switch (c) {
            case '{':
              if (state_ != parse_state::plain) unexpected(c);
              open_group(parse_state::in_alternatives);
              break;
            case '[':
              if (state_ != parse_state::plain) unexpected(c);
              open_group(parse_state::in_range_start);
              break;
            case '}':
              if (state_ != parse_state::in_alternatives) unexpected(c);
              pending_.push_back(trim(buffer_));
              segments_.emplace_back(
                  alternatives_segment{std::move(pending_)});
              close_group();
              break;
            case ']':
              if (state_ != parse_state::in_range_start &&
                  state_ != parse_state::in_range_end)
                unexpected(c);
              segments_.push_back(make_range(range_start_, trim(buffer_)));
              close_group();
              break;
            case ',':
              if (state_ == parse_state::in_alternatives) {
                pending_.push_back(trim(buffer_));
                buffer_.clear();
              } else if (state_ == parse_state::plain) {
                buffer_ += c;
              } else {
                unexpected(c);
              }
              break;
            case '-':
              if (state_ == parse_state::in_range_start) {
                range_start_ = trim(buffer_);
                buffer_.clear();
                state_ = parse_state::in_range_end;
              } else if (state_ == parse_state::in_range_end) {
                unexpected(c);
              } else {
                buffer_ += c;
              }
              break;
            default:
              buffer_ += c;
              break;
          }
        }

        if (state_ != parse_state::plain) {
          throw syntax_error("pattern: unterminated " +
                                 quoted(src_[group_start_]) + " at position " +
                                 std::to_string(group_start_),
                             group_start_);
        }
        flush_literal();
        return std::move(segments_);
      }

    private:
      const std::string& src_;
      std::size_t pos_ = 0;
      std::size_t group_start_ = 0;
      parse_state state_ = parse_state::plain;
      std::string buffer_;
      std::string range_start_;
      std::vector<std::string> pending_;
      std::vector<segment> segments_;

      [[noreturn]] void
      unexpected(char c) const {
        throw syntax_error("pattern: unexpected character " + quoted(c) +
                               " at position " + std::to_string(pos_),
                           pos_);
      }

      void
      flush_literal() {
        if (!buffer_.empty())
          segments_.emplace_back(literal_segment{std::move(buffer_)});
        buffer_.clear();
      }

      void
      open_group(parse_state next) {
        flush_literal();
        group_start_ = pos_;
        state_ = next;
      }

      void
      close_group() {
        buffer_.clear();
        range_start_.clear();
        pending_.clear();
        state_ = parse_state::plain;
      }

      std::string_view
      group_text() const {
        return std::string_view(src_).substr(group_start_,
                                             pos_ - group_start_ + 1);
      }

      [[noreturn]] void
      invalid_range(const std::string& what) const {
        throw syntax_error("pattern: " + what + " '" +
                               std::string(group_text()) + "' at position " +
                               std::to_string(group_start_),
                           group_start_);
      }

      std::optional<uint64_t>
      parse_unsigned(const std::string& digits) const {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(digits.data(),
                                         digits.data() + digits.size(), value);
        if (ec != std::errc() || ptr != digits.data() + digits.size())
          return std::nullopt;
        return value;
      }

      segment
      make_range(const std::string& start, const std::string& end) const {
        if (is_ascii_digits(start) && is_ascii_digits(end)) {
          auto low = parse_unsigned(start);
          auto high = parse_unsigned(end);
          if (!low || !high || *low == max_endpoint || *high == max_endpoint)
            invalid_range("invalid range");
          return numeric_range_segment{*low, *high,
                                       std::min(start.size(), end.size())};
        }

        if (is_ascii_alpha(start) && is_ascii_alpha(end)) {
          auto start_case = case_of(start);
          auto end_case = case_of(end);
          if (!start_case || !end_case || *start_case != *end_case)
            invalid_range("mixed-case alphabetic range");
          uint64_t low = 0;
          uint64_t high = 0;
          try {
            low = from_alphabetic(start, *start_case);
            high = from_alphabetic(end, *end_case);
          } catch (const syntax_error&) {
            invalid_range("invalid range");
          }
          if (low == max_endpoint || high == max_endpoint)
            invalid_range("invalid range");
          return alphabetic_range_segment{low, high, *start_case};
        }

        invalid_range("invalid range");
      }
    };

  } // namespace

  // -------------------------------------------------------------------------
  // pattern
  // -------------------------------------------------------------------------

  pattern
  pattern::parse(std::string text) {
    auto segments = parser(text).run();
    return pattern(std::move(text), std::move(segments));
  }

  uint64_t
  pattern::count() const {
    uint64_t total = 1;
    for (const auto& s : segments_) {
      auto n = s.size();
      if (n == 0) return 0;
      if (total > std::numeric_limits<uint64_t>::max() / n)
        total = std::numeric_limits<uint64_t>::max();
      else
        total *= n;
    }
    return total;
  }

  // -------------------------------------------------------------------------
  // expansion::iterator
  // -------------------------------------------------------------------------

  expansion::iterator::iterator(const std::vector<segment>& segments)
      : segments_(&segments), indices_(segments.size(), 0), done_(false) {
    for (const auto& s : segments) {
      if (s.size() == 0) {
        done_ = true;
        indices_.clear();
        return;
      }
    }
    compose();
  }

  void
  expansion::iterator::compose() {
    current_.clear();
    for (std::size_t i = 0; i < indices_.size(); ++i)
      (*segments_)[i].append_value(current_, indices_[i]);
  }

  expansion::iterator&
  expansion::iterator::operator++() {
    if (done_) return *this;
    // Odometer step: the last segment varies fastest.
    for (auto i = indices_.size(); i-- > 0;) {
      if (++indices_[i] < (*segments_)[i].size()) {
        compose();
        return *this;
      }
      indices_[i] = 0;
    }
    done_ = true;
    indices_.clear();
    current_.clear();
    return *this;
  }

} // namespace expando
