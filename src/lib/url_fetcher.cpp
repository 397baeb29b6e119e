#include <expando/url_fetcher.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace expando {

  namespace {

    constexpr std::size_t max_extension = 8;

    bool
    is_name_char(char c) {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
             (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    }

    // ".png" for ".../img1.png?size=2", empty if the last path component
    // has no short alphanumeric suffix.
    std::string
    url_extension(std::string_view url) {
      auto cut = url.find_first_of("?#");
      if (cut != std::string_view::npos) url = url.substr(0, cut);
      auto slash = url.rfind('/');
      auto last = slash == std::string_view::npos ? url : url.substr(slash + 1);
      auto dot = last.rfind('.');
      if (dot == std::string_view::npos || dot == 0) return {};
      auto ext = last.substr(dot + 1);
      if (ext.empty() || ext.size() > max_extension ||
          !std::all_of(ext.begin(), ext.end(), [](char c) {
            return is_name_char(c) && c != '.' && c != '-' && c != '_';
          }))
        return {};
      return "." + std::string(ext);
    }

    std::string
    sanitize(std::string name) {
      std::replace_if(
          name.begin(), name.end(), [](char c) { return !is_name_char(c); },
          '_');
      // No hidden files, and never "." or "..".
      for (auto& c : name) {
        if (c != '.') break;
        c = '_';
      }
      return name;
    }

  } // namespace

  fetch_summary
  fetch_each(const pattern& p, const transport_fn& transport,
             const document_sink& sink, const fetch_options& opts) {
    const auto& segments = p.segments();
    fetch_summary summary;
    auto range = p.expand();
    for (auto it = range.begin(); it != range.end(); ++it) {
      fetched_document doc;
      doc.url = *it;
      try {
        doc.content = transport(doc.url);
      } catch (const std::exception& e) {
        if (opts.fail_fast) throw;
        std::cerr << "expando fetch: warning: " << e.what() << "\n";
        ++summary.failed;
        continue;
      }
      const auto& indices = it.indices();
      for (std::size_t i = 0; i < segments.size(); ++i) {
        if (!segments[i].holds<literal_segment>())
          doc.choices.push_back(segments[i].value_at(indices[i]));
      }
      sink(doc);
      ++summary.fetched;
    }
    return summary;
  }

  std::vector<fetched_document>
  fetch_all(const pattern& p, const transport_fn& transport,
            const fetch_options& opts) {
    std::vector<fetched_document> results;
    fetch_each(
        p, transport,
        [&](const fetched_document& doc) { results.push_back(doc); }, opts);
    return results;
  }

  std::string
  local_namer::name_for(const fetched_document& doc) {
    std::string stem;
    for (const auto& choice : doc.choices) {
      if (!stem.empty()) stem += '-';
      stem += choice;
    }
    stem = sanitize(std::move(stem));

    auto ext = url_extension(doc.url);
    if (stem.size() > ext.size() &&
        stem.compare(stem.size() - ext.size(), ext.size(), ext) == 0)
      stem.erase(stem.size() - ext.size());
    if (stem.empty()) stem = "index";

    auto name = stem + ext;
    for (int n = 1; !used_.insert(name).second; ++n)
      name = stem + "." + std::to_string(n) + ext;
    return name;
  }

} // namespace expando
