#include <expando/pattern.hpp>
#include <expando/url_fetcher.hpp>

#ifdef EXPANDO_HAS_CURL
#include <curl/curl.h>
#endif

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

static constexpr int exit_success = 0;
static constexpr int exit_usage = 1;
static constexpr int exit_io = 2;
static constexpr int exit_syntax = 3;

struct cli_options {
  std::vector<std::string> patterns;
  bool count_only = false;
  bool show_segments = false;
  bool show_help = false;
  bool show_version = false;
};

static void
print_usage(std::ostream& os) {
  os << "Usage: expando [options] <pattern> [pattern ...]\n"
     << "       expando fetch [options] <pattern>\n"
     << "\n"
     << "Expands {a,b,c} alternatives and [1-10], [a-z] ranges into every\n"
     << "combination, one per line.\n"
     << "\n"
     << "Options:\n"
     << "  --count           Print the number of expansions of each pattern\n"
     << "  --parse           Print the parsed segments of each pattern\n"
     << "  -h, --help        Show this help message\n"
     << "  --version         Show version information\n";
}

static void
print_version(std::ostream& os) {
  os << "expando " << EXPANDO_VERSION << "\n";
}

static cli_options
parse_args(int argc, char* argv[]) {
  cli_options opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--version") {
      opts.show_version = true;
      return opts;
    }

    if (arg == "--count") {
      opts.count_only = true;
      continue;
    }

    if (arg == "--parse") {
      opts.show_segments = true;
      continue;
    }

    if (arg == "--") {
      for (++i; i < argc; ++i)
        opts.patterns.push_back(argv[i]);
      break;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "expando: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    opts.patterns.push_back(arg);
  }

  if (opts.count_only && opts.show_segments) {
    std::cerr << "expando: --count and --parse are mutually exclusive\n";
    std::exit(exit_usage);
  }

  return opts;
}

// Parse every pattern up front so a syntax error is reported before any
// output is produced.
static bool
parse_patterns(const std::vector<std::string>& texts,
               std::vector<expando::pattern>& out, const char* prefix) {
  for (const auto& text : texts) {
    try {
      out.push_back(expando::pattern::parse(text));
    } catch (const expando::syntax_error& e) {
      std::cerr << prefix << ": " << text << ": " << e.what() << "\n";
      return false;
    }
  }
  return true;
}

static int
run(const cli_options& opts) {
  std::vector<expando::pattern> patterns;
  if (!parse_patterns(opts.patterns, patterns, "expando")) return exit_syntax;

  for (const auto& p : patterns) {
    if (opts.count_only) {
      std::cout << p.count() << "\n";
    } else if (opts.show_segments) {
      std::cout << p << "\n";
      for (const auto& s : p.segments())
        std::cout << "  " << s << "\n";
    } else {
      for (const auto& line : p.expand())
        std::cout << line << "\n";
    }
  }

  std::cout.flush();
  if (!std::cout) {
    std::cerr << "expando: error writing output\n";
    return exit_io;
  }
  return exit_success;
}

// ---------------------------------------------------------------------------
// fetch subcommand
// ---------------------------------------------------------------------------

struct fetch_cli_options {
  std::string pattern;
  std::string output_dir = ".";
  bool fail_fast = false;
  bool show_help = false;
};

static void
print_fetch_usage(std::ostream& os) {
  os << "Usage: expando fetch <pattern> [options]\n"
     << "\n"
     << "Retrieves every URL or local path the pattern expands to. Each\n"
     << "document is saved under the values chosen for it, e.g.\n"
     << "'site/{en,de}/page[1-2].html' gives en-1.html ... de-2.html.\n"
     << "\n"
     << "Options:\n"
     << "  --output-dir <dir>     Output directory (default: current "
        "directory)\n"
     << "  --fail-fast            Stop on first fetch error (default: "
        "best-effort)\n"
     << "  -h, --help             Show this help message\n";
}

static fetch_cli_options
parse_fetch_args(int argc, char* argv[]) {
  fetch_cli_options opts;

  // argv[0] is "expando", argv[1] is "fetch", start at 2
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.show_help = true;
      return opts;
    }

    if (arg == "--output-dir") {
      if (i + 1 >= argc) {
        std::cerr << "expando fetch: --output-dir requires an argument\n";
        std::exit(exit_usage);
      }
      opts.output_dir = argv[++i];
      continue;
    }

    if (arg == "--fail-fast") {
      opts.fail_fast = true;
      continue;
    }

    if (arg[0] == '-') {
      std::cerr << "expando fetch: unknown option: " << arg << "\n";
      std::exit(exit_usage);
    }

    if (!opts.pattern.empty()) {
      std::cerr << "expando fetch: only one pattern may be given\n";
      std::exit(exit_usage);
    }
    opts.pattern = arg;
  }

  return opts;
}

static bool
is_http_url(const std::string& s) {
  return s.starts_with("http://") || s.starts_with("https://");
}

#ifdef EXPANDO_HAS_CURL
// One easy handle for the whole expansion, so consecutive URLs on the same
// host reuse the connection.
class curl_session {
public:
  curl_session() : handle_(curl_easy_init(), &curl_easy_cleanup) {
    if (!handle_) throw std::runtime_error("curl_easy_init failed");
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, &append_body);
    curl_easy_setopt(handle_.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_FAILONERROR, 1L);
  }

  std::string
  get(const std::string& url) {
    std::string body;
    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEDATA, &body);
    CURLcode res = curl_easy_perform(handle_.get());
    if (res != CURLE_OK) {
      throw std::runtime_error(url + ": " + curl_easy_strerror(res));
    }
    return body;
  }

private:
  static std::size_t
  append_body(char* ptr, std::size_t size, std::size_t nmemb, void* body) {
    static_cast<std::string*>(body)->append(ptr, size * nmemb);
    return size * nmemb;
  }

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle_;
};
#endif

static std::string
read_local(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open file: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static expando::transport_fn
make_transport() {
#ifdef EXPANDO_HAS_CURL
  auto session = std::make_shared<curl_session>();
  return [session](const std::string& url) {
    return is_http_url(url) ? session->get(url) : read_local(url);
  };
#else
  return [](const std::string& url) -> std::string {
    if (is_http_url(url)) {
      throw std::runtime_error(
          "HTTP fetch not available (built without curl): " + url);
    }
    return read_local(url);
  };
#endif
}

static int
run_fetch(const fetch_cli_options& opts) {
  std::vector<expando::pattern> patterns;
  if (!parse_patterns({opts.pattern}, patterns, "expando fetch"))
    return exit_syntax;

  std::error_code ec;
  fs::create_directories(opts.output_dir, ec);
  if (ec) {
    std::cerr << "expando fetch: cannot create " << opts.output_dir << ": "
              << ec.message() << "\n";
    return exit_io;
  }

  expando::fetch_options fetch_opts;
  fetch_opts.fail_fast = opts.fail_fast;

  expando::local_namer namer;
  auto save = [&](const expando::fetched_document& doc) {
    auto name = namer.name_for(doc);
    auto out_path = fs::path(opts.output_dir) / name;
    std::ofstream out(out_path, std::ios::binary);
    if (!(out << doc.content)) {
      throw std::runtime_error("cannot write: " + out_path.string());
    }
    std::cout << doc.url << " -> " << name << " (" << doc.content.size()
              << " bytes)\n";
  };

  expando::fetch_summary summary;
  try {
    summary = expando::fetch_each(patterns.front(), make_transport(), save,
                                  fetch_opts);
  } catch (const std::exception& e) {
    std::cerr << "expando fetch: " << e.what() << "\n";
    return exit_io;
  }

  if (summary.fetched == 0) {
    std::cerr << "expando fetch: nothing fetched\n";
    return exit_io;
  }

  std::cout << "Fetched " << summary.fetched << " document(s) to "
            << opts.output_dir;
  if (summary.failed > 0) std::cout << ", " << summary.failed << " failed";
  std::cout << "\n";
  return exit_success;
}

int
main(int argc, char* argv[]) {
  if (argc >= 2 && std::string(argv[1]) == "fetch") {
    auto opts = parse_fetch_args(argc, argv);

    if (opts.show_help) {
      print_fetch_usage(std::cerr);
      return exit_success;
    }

    if (opts.pattern.empty()) {
      std::cerr << "expando fetch: no pattern specified\n";
      print_fetch_usage(std::cerr);
      return exit_usage;
    }

#ifdef EXPANDO_HAS_CURL
    curl_global_init(CURL_GLOBAL_DEFAULT);
    int rc = run_fetch(opts);
    curl_global_cleanup();
    return rc;
#else
    return run_fetch(opts);
#endif
  }

  cli_options opts = parse_args(argc, argv);

  if (opts.show_help) {
    print_usage(std::cerr);
    return exit_success;
  }

  if (opts.show_version) {
    print_version(std::cerr);
    return exit_success;
  }

  if (opts.patterns.empty()) {
    std::cerr << "expando: no pattern given\n";
    print_usage(std::cerr);
    return exit_usage;
  }

  return run(opts);
}
