// benchmarks/bench_compare.cpp
// Decode and compare throughput for nbtcmp.
//
// Usage:
//   ./bench_compare                    # synthetic chunk-like document
//   ./bench_compare a.nbt [b.nbt]      # uncompressed NBT files
//   ./bench_compare --iters N ...

#include "nbt_writer.hpp"
#include "utils.hpp"
#include <nbtcmp/nbtcmp.hpp>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Roughly the shape of a world chunk: sections holding packed long arrays,
// an entity list of compounds and a heightmap.
static std::string synthetic_document(int64_t last_update) {
  nbt_test::Writer w;
  w.root("").add_long("LastUpdate", last_update).add_int("xPos", 3).add_int("zPos", -7);
  w.begin_list("sections", 10, 24);
  for (int s = 0; s < 24; ++s) {
    w.add_byte("Y", static_cast<int8_t>(s - 4));
    w.tag(12, "data").u32(256);
    for (int i = 0; i < 256; ++i)
      w.u64(0x0123456789abcdefULL * (s + 1) + i);
    w.begin_list("palette", 10, 4);
    for (int p = 0; p < 4; ++p)
      w.add_string("Name", p % 2 ? "minecraft:stone" : "minecraft:dirt").end();
    w.end();
  }
  w.begin_list("entities", 10, 200);
  for (int e = 0; e < 200; ++e) {
    w.add_string("id", "minecraft:zombie").add_float("Health", 20.0f);
    w.begin_list("Pos", 6, 3).u64(e).u64(64).u64(e * 2);
    w.end();
  }
  w.tag(11, "Heightmap").u32(256);
  for (int i = 0; i < 256; ++i)
    w.u32(static_cast<uint32_t>(60 + i % 8));
  w.end();
  return w.str();
}

int main(int argc, char **argv) {
  size_t iters = 200;
  std::vector<std::string> files;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--iters") == 0 && i + 1 < argc) {
      iters = std::strtoul(argv[++i], nullptr, 10);
    } else {
      files.emplace_back(argv[i]);
    }
  }
  if (iters == 0)
    iters = 1;

  std::string left;
  std::string right;
  try {
    if (files.empty()) {
      left = synthetic_document(1);
      right = synthetic_document(2);
    } else {
      left = bench::read_file(files[0].c_str());
      right = files.size() > 1 ? bench::read_file(files[1].c_str()) : left;
    }
  } catch (const std::exception &e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  bench::print_header("bench_compare");
  std::cout << "Size: " << (left.size() / 1024.0) << " KB"
            << "  Iterations: " << iters << "\n";
  bench::print_table_header();

  try {
    // ── 1. Decode only (tape reused) ──────────────────────────────────────
    {
      nbtcmp::DocumentView doc;
      nbtcmp::load_reuse(doc, left); // warm-up: size the tape
      bench::Timer t;
      t.start();
      for (size_t i = 0; i < iters; ++i)
        nbtcmp::load_reuse(doc, left);
      bench::Result{"load_reuse", t.elapsed_ns() / iters, left.size(), true}
          .print();
    }

    // ── 2. Full compare, no exclusion ─────────────────────────────────────
    {
      bool result = false;
      bench::Timer t;
      t.start();
      for (size_t i = 0; i < iters; ++i)
        result = nbtcmp::compare(left, right);
      bench::Result{"compare", t.elapsed_ns() / iters,
                    left.size() + right.size(),
                    files.empty() ? !result : true}
          .print();
    }

    // ── 3. Full compare excluding LastUpdate ──────────────────────────────
    {
      bool result = false;
      bench::Timer t;
      t.start();
      for (size_t i = 0; i < iters; ++i)
        result = nbtcmp::compare(left, right, nbtcmp::kLastUpdateField);
      bench::Result{"compare (exclude LastUpdate)", t.elapsed_ns() / iters,
                    left.size() + right.size(), files.empty() ? result : true}
          .print();
    }
  } catch (const nbtcmp::ParseError &e) {
    std::cerr << e.format() << "\n";
    return 2;
  }

  return 0;
}
