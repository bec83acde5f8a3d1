#pragma once
#include <concepts>
#include <cstddef>
#include <string_view>
#include <utility>
#include "types.hpp"

/*
  common face of the splice store backends
  splices are kept sorted by start, empty ones first within a start;
  otherwise equal starts keep registration order
*/
template <typename Derived>
class SpliceStoreCRTP {
public:
  std::string_view get_name() const { return as_const_derived().get_name_sv(); }
  size_t size() const { return as_const_derived().do_size(); }
  bool empty() const { return size() == 0; }
  /*the stored splice rejecting [start, end) under policy, nullptr if none*/
  const Splice* find_conflict(size_t start, size_t end, OverlapPolicy policy) const {
    return as_const_derived().do_find_conflict(start, end, policy);
  }
  void insert(Splice s) { as_derived().do_insert(std::move(s)); }
  /*visit in ascending start order; fn returns false to stop*/
  template <typename Fn>
  void for_each(Fn&& fn) const { as_const_derived().do_for_each(std::forward<Fn>(fn)); }

private:
  Derived& as_derived() { return static_cast<Derived&>(*this); }
  const Derived& as_const_derived() const { return static_cast<const Derived&>(*this); }
};

template <typename T>
concept SpliceStoreCRTPConcept =
  std::derived_from<T, SpliceStoreCRTP<T>> &&
  std::default_initializable<T> &&
  requires(T& t, const T& ct, Splice s, size_t n, OverlapPolicy p) {
    { T::get_name_sv() } -> std::convertible_to<std::string_view>;
    { ct.do_size() } -> std::convertible_to<size_t>;
    { ct.do_find_conflict(n, n, p) } -> std::same_as<const Splice*>;
    t.do_insert(std::move(s));
  };
