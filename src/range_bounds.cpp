#include "range_bounds.hpp"
#include "splice_errors.hpp"
#include <limits>

/* n + 1 for an excluded start or an included end; SIZE_MAX has no successor */
static size_t bound_successor(size_t n, size_t len) {
  if (n == std::numeric_limits<size_t>::max()) throw BoundsError(OffsetRange{n, n}, len, "bound overflows");
  return n + 1;
}

OffsetRange resolve_range(const SpliceRange& range, size_t len) {
  OffsetRange r;
  switch (range.start.kind) {
    case Bound::Kind::Included: r.start = range.start.value; break;
    case Bound::Kind::Excluded: r.start = bound_successor(range.start.value, len); break;
    case Bound::Kind::Unbounded: r.start = 0; break;
  }
  switch (range.end.kind) {
    case Bound::Kind::Included: r.end = bound_successor(range.end.value, len); break;
    case Bound::Kind::Excluded: r.end = range.end.value; break;
    case Bound::Kind::Unbounded: r.end = len; break;
  }
  return r;
}

bool is_char_boundary(std::string_view src, size_t pos) {
  if (pos == 0 || pos == src.size()) return true;
  if (pos > src.size()) return false;
  return (static_cast<unsigned char>(src[pos]) & 0xC0) != 0x80;
}

void check_range(std::string_view src, size_t start, size_t end) {
  OffsetRange r{start, end};
  if (end > src.size()) throw BoundsError(r, src.size(), "end past the source");
  if (start > end) throw BoundsError(r, src.size(), "start after end");
  if (!is_char_boundary(src, start)) throw BoundsError(r, src.size(), "start splits a UTF-8 sequence");
  if (!is_char_boundary(src, end)) throw BoundsError(r, src.size(), "end splits a UTF-8 sequence");
}
