#pragma once
#include <string_view>
#include <vector>
#include "i_splice_store.hpp"

/*
  sorted vector backend
  StartPoint policy scans every earlier splice, since that policy lets stored
  splices overlap and an early wide splice may cover a later start
*/
class VectorSpliceStore : public SpliceStoreCRTP<VectorSpliceStore> {
public:
  static constexpr std::string_view get_name_sv() { return "vector"; }

  size_t size() const { return splices_.size(); }
  const Splice* find_conflict(size_t start, size_t end, OverlapPolicy policy) const;
  void insert(Splice s);
  const std::vector<Splice>& raw_splices() const { return splices_; }

  /*forward to CRTP impl*/
  size_t do_size() const { return size(); }
  const Splice* do_find_conflict(size_t start, size_t end, OverlapPolicy policy) const { return find_conflict(start, end, policy); }
  void do_insert(Splice s) { insert(std::move(s)); }
  template <typename Fn>
  void do_for_each(Fn&& fn) const {
    for (const auto& s : splices_) if (!fn(s)) break;
  }

private:
  std::vector<Splice> splices_;

  std::vector<Splice>::const_iterator upper_bound(size_t start) const;
};

static_assert(SpliceStoreCRTPConcept<VectorSpliceStore>, "Vector backend must satisfy CRTP concept");
