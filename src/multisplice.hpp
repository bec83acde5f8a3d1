#pragma once
/*
 * Multisplice
 *
 * Purpose: splice a string many times using offsets into the original string,
 * so callers never recompute offsets after an edit.
 * Note: the source and any borrowed replacement must outlive the registry;
 * owned replacements are kept by the registry.
 */
#include <string>
#include <string_view>
#include <ostream>
#include "types.hpp"
#include "cow_text.hpp"
#include "splice_errors.hpp"
#include "renderer.hpp"
#include "config.hpp"
#if MS_STORE == MS_STORE_TREE
#include "tree_splice_store.hpp"
#else
#include "vector_splice_store.hpp"
#endif

class Multisplice {
public:
#if MS_STORE == MS_STORE_TREE
  using StoreType = TreeSpliceStore;
#else
  using StoreType = VectorSpliceStore;
#endif
  static_assert(SpliceStoreCRTPConcept<StoreType>, "Selected backend must satisfy CRTP concept");

  explicit Multisplice(std::string_view source, SpliceOptions opt = {});

  std::string_view source() const { return source_; }
  const SpliceOptions& options() const { return opt_; }
  std::string_view backend_name() const;
  size_t size() const;
  bool empty() const;
  const StoreType& splices() const { return store_; }

  /*replace [start, end) by value; throws BoundsError / OverlapError*/
  void splice(size_t start, size_t end, std::string value);
  void splice_borrowed(size_t start, size_t end, std::string_view value);
  void splice_range(const SpliceRange& range, std::string value);
  void splice_range_borrowed(const SpliceRange& range, std::string_view value);

  /*text of [start, end) of the original after splicing; throws BoundsError*/
  CowText slice(size_t start, size_t end) const;
  CowText slice_range(const SpliceRange& range) const;
  std::string to_string() const;

private:
  std::string_view source_;
  SpliceOptions opt_;
  StoreType store_;
  Renderer renderer_;

  void splice_text(size_t start, size_t end, CowText value);
};

std::ostream& operator<<(std::ostream& os, const Multisplice& ms);
