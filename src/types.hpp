#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Bound/SpliceRange/Splice/options).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <utility>
#include "cow_text.hpp"

enum class OverlapPolicy { StartPoint, Strict };

struct SpliceOptions { OverlapPolicy overlap = OverlapPolicy::StartPoint; };

/* concrete half-open [start, end) over source offsets */
struct OffsetRange {
  size_t start = 0;
  size_t end = 0;
  size_t length() const { return end - start; }
  bool empty() const { return start == end; }
  bool operator==(const OffsetRange&) const = default;
};

struct Bound {
  enum class Kind { Included, Excluded, Unbounded };
  Kind kind = Kind::Unbounded;
  size_t value = 0;

  static Bound included(size_t n) { return Bound{Kind::Included, n}; }
  static Bound excluded(size_t n) { return Bound{Kind::Excluded, n}; }
  static Bound unbounded() { return Bound{}; }
};

/* a range specification, resolved against the source by resolve_range() */
struct SpliceRange {
  Bound start;
  Bound end;

  static SpliceRange half_open(size_t a, size_t b) { return {Bound::included(a), Bound::excluded(b)}; }
  static SpliceRange closed(size_t a, size_t b) { return {Bound::included(a), Bound::included(b)}; }
  static SpliceRange from(size_t a) { return {Bound::included(a), Bound::unbounded()}; }
  static SpliceRange to(size_t b) { return {Bound::unbounded(), Bound::excluded(b)}; }
  static SpliceRange to_inclusive(size_t b) { return {Bound::unbounded(), Bound::included(b)}; }
  static SpliceRange all() { return {}; }
};

struct Splice {
  size_t start = 0;
  size_t end = 0;
  CowText value;

  OffsetRange range() const { return OffsetRange{start, end}; }
};

/* store order: by start, empty splices before a non-empty one at the same start */
using SpliceKey = std::pair<size_t, bool>;
inline SpliceKey splice_key(const Splice& s) { return SpliceKey{s.start, s.end > s.start}; }
