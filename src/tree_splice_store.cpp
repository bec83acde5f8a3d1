#include "tree_splice_store.hpp"
#include <iterator>

TreeSpliceStore::Map::const_iterator TreeSpliceStore::upper_bound(size_t start) const {
  return splices_.upper_bound(SpliceKey{start, true});
}

const Splice* TreeSpliceStore::find_conflict(size_t start, size_t end, OverlapPolicy policy) const {
  auto it = upper_bound(start);
  if (policy == OverlapPolicy::StartPoint) {
    for (auto p = splices_.begin(); p != it; ++p) {
      if (p->second.end > start) return &p->second;
    }
    return nullptr;
  }
  if (it != splices_.begin()) {
    const Splice& prev = std::prev(it)->second;
    if (start < prev.end && prev.start < end) return &prev;
  }
  if (it != splices_.end() && it->second.start < end) return &it->second;
  return nullptr;
}

void TreeSpliceStore::insert(Splice s) {
  SpliceKey key = splice_key(s);
  splices_.emplace(key, std::move(s));
}
