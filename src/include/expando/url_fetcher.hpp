#pragma once

#include <expando/pattern.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace expando {

  using transport_fn = std::function<std::string(const std::string& url)>;

  struct fetched_document {
    std::string url;
    // Value taken from each non-literal segment, in segment order.
    std::vector<std::string> choices;
    std::string content;
  };

  using document_sink = std::function<void(const fetched_document&)>;

  struct fetch_options {
    bool fail_fast = false;
  };

  struct fetch_summary {
    std::size_t fetched = 0;
    std::size_t failed = 0;
  };

  // Fetches every expansion in order, handing each document to sink before
  // the next one is requested. Transport failures are counted and skipped
  // unless fail_fast is set; exceptions from sink always propagate.
  fetch_summary
  fetch_each(const pattern& p, const transport_fn& transport,
             const document_sink& sink, const fetch_options& opts = {});

  std::vector<fetched_document>
  fetch_all(const pattern& p, const transport_fn& transport,
            const fetch_options& opts = {});

  // Names documents after their choices ("{a,b}/img[1-2].png" gives
  // "a-1.png"). A name is always one path component that is neither "." nor
  // ".."; a pattern without groups gives "index". Repeated names get a ".N"
  // counter before the extension.
  class local_namer {
  public:
    std::string
    name_for(const fetched_document& doc);

  private:
    std::unordered_set<std::string> used_;
  };

} // namespace expando
