#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "config.hh"
#include "hasher.hh"
#include "options.hh"
#include "parse_size.hh"
#include "report.hh"
#include "uniq_dir.hh"

using namespace std::literals;

namespace {

void usage(std::ostream &os) {
  os << "usage: uniqdir [options] dir1 dir2 [dir...]\n"
        "  -c, --by-content       compare by file content instead of name\n"
        "  -l, --follow-symlinks  include symlinked files when comparing by "
        "name\n"
        "  -a, --hash ALGO        digest algorithm (default md5, xxh128, "
        "or any libcrypto digest)\n"
        "  -b, --chunk-size SIZE  read chunk size (default 8192, e.g. 64KiB)\n"
        "  -j, --jobs N           worker threads (default 4)\n"
        "      --columns          side-by-side view\n"
        "  -v, --verbose          progress on stderr\n"
        "  -h, --help             show this help\n";
}

}  // namespace

int main(int argc, char *argv[]) {
  std::vector<std::filesystem::path> dirs;
  uniqdir::options_t opt;
  bool columns = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-c"sv || arg == "--by-content"sv) {
      opt.mode = uniqdir::cmp_t::by_content;
    } else if (arg == "-l"sv || arg == "--follow-symlinks"sv) {
      opt.follow_symlinks = true;
    } else if (arg == "-a"sv || arg == "--hash"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing hash algorithm" << std::endl;
        return 1;
      }
      opt.hash_algo = argv[i];
      try {
        uniqdir::check_hash_algo(opt.hash_algo);
      } catch (const std::invalid_argument &e) {
        std::cerr << e.what() << std::endl;
        return 1;
      }
    } else if (arg == "-b"sv || arg == "--chunk-size"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing chunk size" << std::endl;
        return 1;
      }
      try {
        opt.chunk_size = utils::parse_size(argv[i]);
      } catch (const std::logic_error &e) {
        std::cerr << e.what() << std::endl;
        return 1;
      }
      if (opt.chunk_size == 0) {
        std::cerr << "chunk size must be > 0" << std::endl;
        return 1;
      }
    } else if (arg == "-j"sv || arg == "--jobs"sv) {
      ++i;
      if (i >= argc) {
        std::cerr << "missing jobs" << std::endl;
        return 1;
      }
      try {
        const auto jobs = std::stoi(argv[i]);
        if (jobs <= 0 || jobs > (int)uniqdir::max_thread_lim) {
          throw std::out_of_range(argv[i]);
        }
        opt.max_thread = (uint32_t)jobs;
      } catch (const std::logic_error &) {
        std::cerr << "jobs must be > 0 and <= " << uniqdir::max_thread_lim
                  << std::endl;
        return 1;
      }
    } else if (arg == "--columns"sv) {
      columns = true;
    } else if (arg == "-v"sv || arg == "--verbose"sv) {
      opt.verbose = true;
    } else if (arg == "-h"sv || arg == "--help"sv) {
      usage(std::cout);
      return 0;
    } else if (arg.size() > 1 && arg.front() == '-') {
      std::cerr << "unknown option: " << arg << std::endl;
      usage(std::cerr);
      return 1;
    } else {
      dirs.emplace_back(arg);
    }
  }

  if (dirs.size() < 2) {
    std::cerr << "Error: Please provide at least 2 directories to compare."
              << std::endl;
    return 1;
  }

  if (opt.mode == uniqdir::cmp_t::by_content) {
    std::cout << "Comparing files by content (this may take a while)...\n"
              << std::endl;
  }

  try {
    auto result = uniqdir::compare(dirs, opt);
    if (columns) {
      uniqdir::print_columns(std::cout, result.report);
    } else {
      uniqdir::print_list(std::cout, result.report);
    }
  } catch (const std::exception &e) {
    std::cerr << "[err] " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
