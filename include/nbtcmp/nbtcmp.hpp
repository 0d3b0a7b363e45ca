/**
 * @file nbtcmp.hpp
 * @brief nbtcmp - zero-copy NBT decoder and structural comparator
 * @version 1.0.0
 *
 * Decodes uncompressed NBT (Named Binary Tag) documents into a flat tape of
 * slice descriptors that alias the input buffer, then compares two decoded
 * documents for structural equality.
 *
 * Features:
 * - Zero-copy: every payload is an (offset, length) pair into the source
 * - Closed tag dispatch: one switch over the 13 NBT tag ids
 * - Bulk spans for numeric lists and arrays (no per-element recursion)
 * - Order-insensitive compound comparison, order-sensitive lists
 * - Optional exclusion of one top-level field (e.g. "LastUpdate")
 * - Header-only, C++20 STL only
 *
 * License: MIT
 */

#ifndef NBTCMP_HPP
#define NBTCMP_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <future>
#include <limits>
#include <new>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#if __cplusplus < 202002L
#error "nbtcmp requires a C++20 compatible compiler."
#endif

#ifdef __GNUC__
#define NBTCMP_INLINE __attribute__((always_inline)) inline
#define NBTCMP_LIKELY(x) __builtin_expect(!!(x), 1)
#define NBTCMP_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define NBTCMP_INLINE inline
#define NBTCMP_LIKELY(x) (x)
#define NBTCMP_UNLIKELY(x) (x)
#endif

namespace nbtcmp {

// ============================================================================
// Error Handling
// ============================================================================

enum class Error {
  Ok = 0,
  InvalidRoot,
  UnexpectedEndOfInput,
  UnknownTag,
  ArithmeticOverflow,
  DepthLimitExceeded
};

inline const char *error_message(Error e) {
  switch (e) {
  case Error::Ok:
    return "No error";
  case Error::InvalidRoot:
    return "Root tag is not a compound";
  case Error::UnexpectedEndOfInput:
    return "Unexpected end of input";
  case Error::UnknownTag:
    return "Unknown tag id";
  case Error::ArithmeticOverflow:
    return "Overflow when calculating byte length";
  case Error::DepthLimitExceeded:
    return "Nesting depth too high";
  default:
    return "Unknown error";
  }
}

// Which input of a comparison produced an error.
enum class Side : uint8_t { None = 0, Left, Right };

inline const char *side_name(Side s) {
  switch (s) {
  case Side::Left:
    return "left";
  case Side::Right:
    return "right";
  default:
    return "none";
  }
}

class ParseError : public std::runtime_error {
public:
  Error code;
  size_t offset; // byte position in the failing input
  int tag;       // offending tag id for UnknownTag / InvalidRoot, else -1
  Side side;

  ParseError(Error c, size_t off = 0, int t = -1, Side s = Side::None)
      : std::runtime_error(describe(c, t)), code(c), offset(off), tag(t),
        side(s) {}

  // The comparator annotates errors with the failing input; the code is
  // never changed.
  ParseError with_side(Side s) const { return ParseError(code, offset, tag, s); }

  std::string format() const {
    std::ostringstream oss;
    oss << "Parse error at offset " << offset << ": " << what();
    if (side != Side::None) {
      oss << " (occurred while parsing " << side_name(side) << ")";
    }
    return oss.str();
  }

private:
  static std::string describe(Error c, int t) {
    std::string msg = error_message(c);
    if (t >= 0) {
      msg += ": ";
      msg += std::to_string(t);
    }
    return msg;
  }
};

// ============================================================================
// Tag Identifiers
// ============================================================================

enum class TagId : uint8_t {
  End = 0,
  Byte,
  Short,
  Int,
  Long,
  Float,
  Double,
  ByteArray,
  String,
  List,
  Compound,
  IntArray,
  LongArray
};

inline constexpr uint8_t kTagCount = 13;

namespace detail {

struct TagInfo {
  const char *name;
  uint8_t width; // payload bytes (numeric) or element bytes (array), else 0
};

inline constexpr std::array<TagInfo, kTagCount> kTagTable = {{
    {"TAG_End", 0},
    {"TAG_Byte", 1},
    {"TAG_Short", 2},
    {"TAG_Int", 4},
    {"TAG_Long", 8},
    {"TAG_Float", 4},
    {"TAG_Double", 8},
    {"TAG_Byte_Array", 1},
    {"TAG_String", 0},
    {"TAG_List", 0},
    {"TAG_Compound", 0},
    {"TAG_Int_Array", 4},
    {"TAG_Long_Array", 8},
}};

constexpr bool is_known_tag(uint8_t id) noexcept { return id < kTagCount; }

// Byte..Double: fixed width, decoded as one opaque span.
constexpr bool is_numeric_tag(uint8_t id) noexcept { return id >= 1 && id <= 6; }

constexpr uint8_t tag_width(uint8_t id) noexcept {
  return is_known_tag(id) ? kTagTable[id].width : 0;
}

constexpr uint8_t to_u8(TagId t) noexcept { return static_cast<uint8_t>(t); }

} // namespace detail

inline const char *tag_name(uint8_t id) {
  return detail::is_known_tag(id) ? detail::kTagTable[id].name : "TAG_Unknown";
}

// ============================================================================
// Cursor: bounds-checked, copy-free big-endian reads
// ============================================================================

namespace detail {

// count * width without wraparound. Templated on the size type so the
// 32-bit behaviour can be exercised on any host.
template <typename SizeT>
constexpr bool checked_mul(SizeT a, SizeT b, SizeT &out) noexcept {
  static_assert(std::is_unsigned_v<SizeT>, "checked_mul needs an unsigned type");
  if (b != 0 && a > std::numeric_limits<SizeT>::max() / b)
    return false;
  out = static_cast<SizeT>(a * b);
  return true;
}

class Cursor {
  const char *start_;
  const char *p_;
  const char *end_;

public:
  explicit Cursor(std::string_view data)
      : start_(data.data()), p_(data.data()), end_(data.data() + data.size()) {}

  size_t offset() const noexcept { return static_cast<size_t>(p_ - start_); }
  size_t remaining() const noexcept { return static_cast<size_t>(end_ - p_); }

  NBTCMP_INLINE std::string_view take(size_t n) {
    if (NBTCMP_UNLIKELY(n > remaining())) {
      throw ParseError(Error::UnexpectedEndOfInput, offset());
    }
    std::string_view out(p_, n);
    p_ += n;
    return out;
  }

  template <size_t N> NBTCMP_INLINE std::array<uint8_t, N> read_fixed() {
    std::string_view raw = take(N);
    std::array<uint8_t, N> out;
    std::memcpy(out.data(), raw.data(), N);
    return out;
  }

  NBTCMP_INLINE uint8_t read_u8() {
    return static_cast<uint8_t>(take(1)[0]);
  }

  NBTCMP_INLINE uint16_t read_u16() {
    auto b = read_fixed<2>();
    return static_cast<uint16_t>((b[0] << 8) | b[1]);
  }

  NBTCMP_INLINE uint32_t read_u32() {
    auto b = read_fixed<4>();
    return (static_cast<uint32_t>(b[0]) << 24) |
           (static_cast<uint32_t>(b[1]) << 16) |
           (static_cast<uint32_t>(b[2]) << 8) | static_cast<uint32_t>(b[3]);
  }
};

} // namespace detail

// ─────────────────────────────────────────────────────────────
// TapeNode - exactly 32 bytes
// ─────────────────────────────────────────────────────────────

enum class NodeType : uint8_t {
  Span = 0, // opaque bytes: numerics, arrays, strings, numeric lists, keys
  Map,      // compound: count members, each a key span + value subtree
  List,     // sequence: count element subtrees
};

struct TapeNode {
  NodeType type;     // 1 byte
  uint8_t tag;       // 1 byte  (NBT tag id that produced the node)
  uint16_t reserved; // 2 bytes
  uint32_t count;    // 4 bytes (members / elements)
  uint64_t next;     // 8 bytes (tape index one past this subtree)
  uint64_t offset;   // 8 bytes (byte offset into source)
  uint64_t length;   // 8 bytes (byte length in source)

  TapeNode() = default;
  TapeNode(NodeType t, uint8_t tg, uint64_t off, uint64_t len)
      : type(t), tag(tg), reserved(0), count(0), next(0), offset(off),
        length(len) {}
};
static_assert(sizeof(TapeNode) == 32, "TapeNode must be exactly 32 bytes");
static_assert(std::is_trivially_copyable_v<TapeNode>,
              "TapeNode is moved with realloc");

// ─────────────────────────────────────────────────────────────
// TapeArena - growable flat node buffer, reused across decodes
// ─────────────────────────────────────────────────────────────

struct TapeArena {
  TapeNode *base = nullptr;
  TapeNode *head = nullptr;
  TapeNode *cap = nullptr;

  TapeArena() = default;
  ~TapeArena() { std::free(base); }

  TapeArena(const TapeArena &) = delete;
  TapeArena &operator=(const TapeArena &) = delete;

  // Ensures room for n nodes and empties the tape.
  void reserve(size_t n) {
    if (capacity() < n)
      grow_to(n);
    head = base;
  }

  // Ensures room for n more nodes without touching the contents.
  void ensure(size_t n) {
    if (static_cast<size_t>(cap - head) < n)
      grow_to(size() + n);
  }

  NBTCMP_INLINE void reset() noexcept { head = base; }

  NBTCMP_INLINE size_t push(const TapeNode &node) {
    if (NBTCMP_UNLIKELY(head == cap))
      grow_to(size() + 1);
    *head = node;
    return static_cast<size_t>(head++ - base);
  }

  NBTCMP_INLINE size_t size() const noexcept {
    return static_cast<size_t>(head - base);
  }
  NBTCMP_INLINE size_t capacity() const noexcept {
    return static_cast<size_t>(cap - base);
  }

  NBTCMP_INLINE TapeNode &operator[](size_t i) noexcept { return base[i]; }
  NBTCMP_INLINE const TapeNode &operator[](size_t i) const noexcept {
    return base[i];
  }

private:
  void grow_to(size_t n) {
    const size_t used = size();
    size_t want = std::max<size_t>({n, capacity() * 2, 64});
    if (want > std::numeric_limits<size_t>::max() / sizeof(TapeNode))
      throw std::bad_alloc();
    auto *p = static_cast<TapeNode *>(std::realloc(base, want * sizeof(TapeNode)));
    if (!p)
      throw std::bad_alloc();
    base = p;
    head = p + used;
    cap = p + want;
  }
};

// ─────────────────────────────────────────────────────────────
// DocumentView
// ─────────────────────────────────────────────────────────────

// Borrows the source buffer; the caller keeps it alive for as long as the
// view or any Value taken from it is used.
class DocumentView {
public:
  std::string_view source;
  TapeArena tape;

  DocumentView() = default;
  explicit DocumentView(std::string_view nbt) : source(nbt) {}
  template <typename Alloc>
  explicit DocumentView(
      std::basic_string<char, std::char_traits<char>, Alloc> &&) = delete;

  DocumentView(DocumentView &&o) noexcept : source(o.source) {
    tape.base = o.tape.base;
    tape.head = o.tape.head;
    tape.cap = o.tape.cap;
    o.tape.base = o.tape.head = o.tape.cap = nullptr;
  }
  DocumentView &operator=(DocumentView &&o) noexcept {
    if (this != &o) {
      std::free(tape.base);
      source = o.source;
      tape.base = o.tape.base;
      tape.head = o.tape.head;
      tape.cap = o.tape.cap;
      o.tape.base = o.tape.head = o.tape.cap = nullptr;
    }
    return *this;
  }

  const char *data() const { return source.data(); }
  size_t size() const { return source.size(); }
};

// ─────────────────────────────────────────────────────────────
// Value - (document, tape index) handle
// ─────────────────────────────────────────────────────────────

class Value {
  const DocumentView *doc_ = nullptr;
  size_t idx_ = 0;

public:
  using Member = std::pair<std::string_view, Value>;

  Value() = default;
  Value(const DocumentView *doc, size_t idx) : doc_(doc), idx_(idx) {}

  const DocumentView *document() const { return doc_; }
  size_t index() const { return idx_; }
  const TapeNode &node() const { return doc_->tape[idx_]; }

  NodeType type() const { return node().type; }
  uint8_t tag() const { return node().tag; }
  bool is_span() const { return type() == NodeType::Span; }
  bool is_map() const { return type() == NodeType::Map; }
  bool is_list() const { return type() == NodeType::List; }

  // Raw bytes of a span; empty for maps and lists.
  std::string_view bytes() const {
    const TapeNode &n = node();
    if (n.type != NodeType::Span)
      return {};
    return doc_->source.substr(n.offset, n.length);
  }

  // Byte length for spans, element count for lists, distinct keys for maps.
  size_t size() const {
    switch (type()) {
    case NodeType::Span:
      return node().length;
    case NodeType::List:
      return node().count;
    case NodeType::Map:
      return members().size();
    }
    return 0;
  }

  // Tape navigation. In a map the first child is a key span and its sibling
  // is the member's value.
  Value first_child() const { return Value(doc_, idx_ + 1); }
  Value next_sibling() const { return Value(doc_, node().next); }

  // Visits members in stream order, duplicates included.
  template <typename F> void for_each_member(F &&f) const {
    if (!is_map())
      return;
    Value key = first_child();
    for (uint32_t i = 0; i < node().count; ++i) {
      Value val = key.next_sibling();
      f(key.bytes(), val);
      key = val.next_sibling();
    }
  }

  template <typename F> void for_each_element(F &&f) const {
    if (!is_list())
      return;
    Value elem = first_child();
    for (uint32_t i = 0; i < node().count; ++i) {
      f(elem);
      elem = elem.next_sibling();
    }
  }

  // Resolved members: sorted by key, last occurrence of a key wins.
  std::vector<Member> members() const {
    std::vector<Member> out;
    if (!is_map())
      return out;
    out.reserve(node().count);
    for_each_member(
        [&](std::string_view key, Value val) { out.emplace_back(key, val); });
    std::stable_sort(out.begin(), out.end(),
                     [](const Member &a, const Member &b) {
                       return a.first < b.first;
                     });
    size_t w = 0;
    for (size_t r = 0; r < out.size(); ++r) {
      if (r + 1 < out.size() && out[r + 1].first == out[r].first)
        continue;
      out[w++] = out[r];
    }
    out.resize(w);
    return out;
  }

  std::optional<Value> find(std::string_view key) const {
    std::optional<Value> found;
    for_each_member([&](std::string_view k, Value val) {
      if (k == key)
        found = val;
    });
    return found;
  }

  // Debug rendering: {name:value,...}, [...], "string", TAG_Int(0x0000002a)
  std::string dump() const {
    std::string out;
    if (doc_ && doc_->tape.size() > idx_)
      dump_to(out);
    return out;
  }

private:
  void dump_to(std::string &out) const {
    static constexpr char kHex[] = "0123456789abcdef";
    const TapeNode &n = node();
    switch (n.type) {
    case NodeType::Span: {
      std::string_view raw = bytes();
      if (n.tag == detail::to_u8(TagId::String)) {
        out += '"';
        out.append(raw);
        out += '"';
        break;
      }
      out += tag_name(n.tag);
      out += "(0x";
      for (char c : raw) {
        auto b = static_cast<uint8_t>(c);
        out += kHex[b >> 4];
        out += kHex[b & 0xF];
      }
      out += ')';
      break;
    }
    case NodeType::List: {
      out += '[';
      bool first = true;
      for_each_element([&](Value elem) {
        if (!first)
          out += ',';
        first = false;
        elem.dump_to(out);
      });
      out += ']';
      break;
    }
    case NodeType::Map: {
      out += '{';
      bool first = true;
      for_each_member([&](std::string_view key, Value val) {
        if (!first)
          out += ',';
        first = false;
        out.append(key);
        out += ':';
        val.dump_to(out);
      });
      out += '}';
      break;
    }
    }
  }
};

// ============================================================================
// Decoder
// ============================================================================

struct DecodeOptions {
  size_t max_depth = 512; // compound/list nesting; 0 = unlimited
};

class Decoder {
  DocumentView *doc_;
  detail::Cursor cur_;
  DecodeOptions options_;
  size_t depth_ = 0;

public:
  explicit Decoder(DocumentView *doc, DecodeOptions options = {})
      : doc_(doc), cur_(doc->source), options_(options) {}

  // Root loader: Compound tag, discarded name, compound payload.
  void decode_root() {
    const size_t at = cur_.offset();
    const uint8_t tag = cur_.read_u8();
    if (tag != detail::to_u8(TagId::Compound)) {
      throw ParseError(Error::InvalidRoot, at, tag);
    }
    cur_.take(cur_.read_u16());
    decode_compound();
  }

private:
  void enter(size_t at) {
    if (++depth_ > options_.max_depth && options_.max_depth != 0) {
      throw ParseError(Error::DepthLimitExceeded, at);
    }
  }
  void leave() { --depth_; }

  size_t byte_length(uint32_t count, uint8_t width, size_t at) const {
    size_t len = 0;
    if (!detail::checked_mul<size_t>(count, width, len)) {
      throw ParseError(Error::ArithmeticOverflow, at);
    }
    return len;
  }

  size_t push_span(uint8_t tag, std::string_view raw) {
    TapeNode n(NodeType::Span, tag,
               static_cast<uint64_t>(raw.data() - doc_->source.data()),
               raw.size());
    n.next = doc_->tape.size() + 1;
    return doc_->tape.push(n);
  }

  size_t open(NodeType type, TagId tag, size_t at) {
    return doc_->tape.push(TapeNode(type, detail::to_u8(tag), at, 0));
  }

  void close(size_t idx, uint32_t count) {
    TapeNode &n = doc_->tape[idx];
    n.count = count;
    n.next = doc_->tape.size();
    n.length = cur_.offset() - n.offset;
  }

  void decode_value(uint8_t tag) {
    const size_t at = cur_.offset();
    switch (static_cast<TagId>(tag)) {
    case TagId::Byte:
    case TagId::Short:
    case TagId::Int:
    case TagId::Long:
    case TagId::Float:
    case TagId::Double:
      push_span(tag, cur_.take(detail::tag_width(tag)));
      return;
    case TagId::ByteArray:
    case TagId::IntArray:
    case TagId::LongArray: {
      const uint32_t count = cur_.read_u32();
      push_span(tag, cur_.take(byte_length(count, detail::tag_width(tag), at)));
      return;
    }
    case TagId::String:
      push_span(tag, cur_.take(cur_.read_u16()));
      return;
    case TagId::List:
      decode_list();
      return;
    case TagId::Compound:
      decode_compound();
      return;
    case TagId::End:
      break;
    }
    throw ParseError(Error::UnknownTag, at, tag);
  }

  void decode_list() {
    const size_t at = cur_.offset();
    const uint8_t elem = cur_.read_u8();
    const uint32_t count = cur_.read_u32();
    if (!detail::is_known_tag(elem)) {
      throw ParseError(Error::UnknownTag, at, elem);
    }
    // Every empty list is the same empty sequence, whatever its element type.
    if (count == 0) {
      close(open(NodeType::List, TagId::List, at), 0);
      return;
    }
    if (elem == detail::to_u8(TagId::End)) {
      throw ParseError(Error::UnknownTag, at, elem);
    }
    if (detail::is_numeric_tag(elem)) {
      push_span(detail::to_u8(TagId::List),
                cur_.take(byte_length(count, detail::tag_width(elem), at)));
      return;
    }

    enter(at);
    const size_t idx = open(NodeType::List, TagId::List, at);
    // Every element consumes at least one byte, so this never trusts count
    // beyond the input that is actually there.
    doc_->tape.ensure(std::min<size_t>(count, cur_.remaining()));
    for (uint32_t i = 0; i < count; ++i) {
      decode_value(elem);
    }
    close(idx, count);
    leave();
  }

  void decode_compound() {
    const size_t at = cur_.offset();
    enter(at);
    const size_t idx = open(NodeType::Map, TagId::Compound, at);
    uint32_t count = 0;
    while (true) {
      const size_t tag_at = cur_.offset();
      const uint8_t tag = cur_.read_u8();
      if (tag == detail::to_u8(TagId::End))
        break;
      if (!detail::is_known_tag(tag)) {
        throw ParseError(Error::UnknownTag, tag_at, tag);
      }
      if (NBTCMP_UNLIKELY(count == std::numeric_limits<uint32_t>::max())) {
        throw ParseError(Error::ArithmeticOverflow, tag_at);
      }
      push_span(detail::to_u8(TagId::String), cur_.take(cur_.read_u16()));
      decode_value(tag);
      ++count;
    }
    close(idx, count);
    leave();
  }
};

// ─────────────────────────────────────────────────────────────
// Public API
// ─────────────────────────────────────────────────────────────

// Decodes one document into doc, reusing its tape capacity. Bytes after the
// root compound's End tag are ignored.
inline Value load_reuse(DocumentView &doc, std::string_view nbt,
                        DecodeOptions options = {}) {
  doc.source = nbt;
  doc.tape.reserve(nbt.size() / 16 + 64);
  Decoder(&doc, options).decode_root();
  return Value(&doc, 0);
}

// The tape would alias a buffer that dies at the end of the call.
template <typename Alloc>
Value load_reuse(DocumentView &,
                 std::basic_string<char, std::char_traits<char>, Alloc> &&,
                 DecodeOptions = {}) = delete;

// ============================================================================
// Structural Equality
// ============================================================================

inline constexpr std::string_view kLastUpdateField = "LastUpdate";

struct CompareOptions {
  // Top-level field removed from both roots before comparing.
  std::optional<std::string_view> exclude_field;
  DecodeOptions decode;
};

inline bool operator==(const Value &a, const Value &b);

namespace detail {

inline bool equal_maps(const Value &a, const Value &b,
                       std::optional<std::string_view> exclude) {
  auto ma = a.members();
  auto mb = b.members();
  if (exclude) {
    auto excluded = [&](const Value::Member &m) { return m.first == *exclude; };
    std::erase_if(ma, excluded);
    std::erase_if(mb, excluded);
  }
  if (ma.size() != mb.size())
    return false;
  for (size_t i = 0; i < ma.size(); ++i) {
    if (ma[i].first != mb[i].first || !(ma[i].second == mb[i].second))
      return false;
  }
  return true;
}

} // namespace detail

inline bool operator==(const Value &a, const Value &b) {
  if (a.type() != b.type())
    return false;
  switch (a.type()) {
  case NodeType::Span:
    return a.bytes() == b.bytes();
  case NodeType::List: {
    const uint32_t n = a.node().count;
    if (n != b.node().count)
      return false;
    Value ea = a.first_child();
    Value eb = b.first_child();
    for (uint32_t i = 0; i < n; ++i) {
      if (!(ea == eb))
        return false;
      ea = ea.next_sibling();
      eb = eb.next_sibling();
    }
    return true;
  }
  case NodeType::Map:
    return detail::equal_maps(a, b, std::nullopt);
  }
  return false;
}

inline bool operator!=(const Value &a, const Value &b) { return !(a == b); }

// Deep equality of two roots, with exclude removed from both root maps.
inline bool equal_roots(const Value &a, const Value &b,
                        std::optional<std::string_view> exclude) {
  if (exclude && a.is_map() && b.is_map())
    return detail::equal_maps(a, b, exclude);
  return a == b;
}

// load_reuse() with decode errors annotated with the given side.
inline Value load_side(DocumentView &doc, std::string_view nbt,
                       const DecodeOptions &options, Side side) {
  try {
    return load_reuse(doc, nbt, options);
  } catch (const ParseError &e) {
    throw e.with_side(side);
  }
}

// Decodes both documents (left first) and compares them. Decode failures
// throw ParseError tagged with the failing side.
inline bool compare(std::string_view left, std::string_view right,
                    const CompareOptions &options = {}) {
  DocumentView left_doc;
  DocumentView right_doc;
  const Value l = load_side(left_doc, left, options.decode, Side::Left);
  const Value r = load_side(right_doc, right, options.decode, Side::Right);
  return equal_roots(l, r, options.exclude_field);
}

inline bool compare(std::string_view left, std::string_view right,
                    std::string_view exclude_field) {
  CompareOptions options;
  options.exclude_field = exclude_field;
  return compare(left, right, options);
}

inline std::optional<bool> try_compare(std::string_view left,
                                       std::string_view right,
                                       const CompareOptions &options = {}) noexcept {
  try {
    return compare(left, right, options);
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

// Runs compare() on a worker thread. Both buffers and any exclude_field
// string must outlive the returned future.
inline std::future<bool> compare_async(std::string_view left,
                                       std::string_view right,
                                       CompareOptions options = {}) {
  return std::async(std::launch::async, [left, right, options] {
    return compare(left, right, options);
  });
}

// ============================================================================
// File Helpers
// ============================================================================

inline std::string read_file(const std::string &filename) {
  std::ifstream file(filename, std::ios::binary);
  if (!file)
    throw std::runtime_error("Cannot open: " + filename);
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

inline std::ostream &operator<<(std::ostream &os, const Value &v) {
  return os << v.dump();
}

} // namespace nbtcmp

#endif // NBTCMP_HPP
