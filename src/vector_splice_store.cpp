#include "vector_splice_store.hpp"
#include <algorithm>
#include <iterator>

std::vector<Splice>::const_iterator VectorSpliceStore::upper_bound(size_t start) const {
  return std::upper_bound(splices_.begin(), splices_.end(), start,
                          [](size_t v, const Splice& s) { return v < s.start; });
}

const Splice* VectorSpliceStore::find_conflict(size_t start, size_t end, OverlapPolicy policy) const {
  if (policy == OverlapPolicy::StartPoint) {
    for (const auto& s : splices_) {
      if (s.start > start) break;
      if (s.end > start) return &s;
    }
    return nullptr;
  }
  // Strict: stored splices never intersect and empty ones sort first within
  // a start, so ends are sorted too and only the neighbours of the insertion
  // point can collide.
  auto it = upper_bound(start);
  if (it != splices_.begin()) {
    const Splice& prev = *std::prev(it);
    if (start < prev.end && prev.start < end) return &prev;
  }
  if (it != splices_.end() && it->start < end) return &*it;
  return nullptr;
}

void VectorSpliceStore::insert(Splice s) {
  auto pos = std::upper_bound(splices_.begin(), splices_.end(), s,
                              [](const Splice& a, const Splice& b) { return splice_key(a) < splice_key(b); });
  splices_.insert(pos, std::move(s));
}
