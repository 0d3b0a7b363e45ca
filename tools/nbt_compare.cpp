// nbt_compare - compare two uncompressed NBT files.
//
// Usage:
//   nbt_compare [--exclude NAME | --exclude-last-update] [--max-depth N]
//               [--dump] <left.nbt> <right.nbt>
//
// Prints "equal" or "different". Exit status: 0 equal, 1 different,
// 2 usage or decode error.

#include <nbtcmp/nbtcmp.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static void usage(const char *argv0) {
  std::cerr << "Usage: " << argv0
            << " [--exclude NAME | --exclude-last-update] [--max-depth N]"
               " [--dump] <left.nbt> <right.nbt>\n";
}

int main(int argc, char **argv) {
  nbtcmp::CompareOptions options;
  std::optional<std::string> exclude;
  bool dump = false;
  std::vector<std::string> files;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--exclude") == 0 && i + 1 < argc) {
      exclude = argv[++i];
    } else if (std::strcmp(argv[i], "--exclude-last-update") == 0) {
      exclude = std::string(nbtcmp::kLastUpdateField);
    } else if (std::strcmp(argv[i], "--max-depth") == 0 && i + 1 < argc) {
      options.decode.max_depth = std::strtoul(argv[++i], nullptr, 10);
    } else if (std::strcmp(argv[i], "--dump") == 0) {
      dump = true;
    } else if (argv[i][0] == '-' && argv[i][1] == '-') {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      usage(argv[0]);
      return 2;
    } else {
      files.emplace_back(argv[i]);
    }
  }
  if (files.size() != 2) {
    usage(argv[0]);
    return 2;
  }
  if (exclude)
    options.exclude_field = *exclude;

  std::string left;
  std::string right;
  try {
    left = nbtcmp::read_file(files[0]);
    right = nbtcmp::read_file(files[1]);
  } catch (const std::runtime_error &e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  try {
    if (dump) {
      nbtcmp::DocumentView doc;
      std::cout << "left:  "
                << nbtcmp::load_side(doc, left, options.decode,
                                     nbtcmp::Side::Left)
                << "\n";
      std::cout << "right: "
                << nbtcmp::load_side(doc, right, options.decode,
                                     nbtcmp::Side::Right)
                << "\n";
    }
    const bool equal = nbtcmp::compare(left, right, options);
    std::cout << (equal ? "equal" : "different") << "\n";
    return equal ? 0 : 1;
  } catch (const nbtcmp::ParseError &e) {
    std::cerr << e.format() << "\n";
    return 2;
  }
}
