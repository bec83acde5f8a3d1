#pragma once
#include <map>
#include <string_view>
#include "i_splice_store.hpp"

/*
  ordered tree backend keyed by (start, non-empty)
  multimap::emplace puts equal keys after the existing ones, which keeps
  registration order for splices sharing a key
*/
class TreeSpliceStore : public SpliceStoreCRTP<TreeSpliceStore> {
public:
  static constexpr std::string_view get_name_sv() { return "tree"; }

  size_t size() const { return splices_.size(); }
  const Splice* find_conflict(size_t start, size_t end, OverlapPolicy policy) const;
  void insert(Splice s);

  /*forward to CRTP impl*/
  size_t do_size() const { return size(); }
  const Splice* do_find_conflict(size_t start, size_t end, OverlapPolicy policy) const { return find_conflict(start, end, policy); }
  void do_insert(Splice s) { insert(std::move(s)); }
  template <typename Fn>
  void do_for_each(Fn&& fn) const {
    for (const auto& kv : splices_) if (!fn(kv.second)) break;
  }

private:
  using Map = std::multimap<SpliceKey, Splice>;
  Map splices_;

  Map::const_iterator upper_bound(size_t start) const;
};

static_assert(SpliceStoreCRTPConcept<TreeSpliceStore>, "Tree backend must satisfy CRTP concept");
