#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace expando {

  // Raised for every malformed pattern. position() is the 0-indexed byte
  // offset of the offending character in the original input.
  class syntax_error : public std::runtime_error {
  public:
    syntax_error(const std::string& what, std::size_t position)
        : std::runtime_error(what), position_(position) {}

    std::size_t
    position() const {
      return position_;
    }

  private:
    std::size_t position_;
  };

} // namespace expando
