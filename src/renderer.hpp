#pragma once
/*
 * Renderer
 *
 * Purpose: rebuild the text of a window [start, end) of original offsets,
 * substituting every registered splice the window touches.
 * Constraint: stateless; receives the source and the store from Multisplice,
 * which has already validated the window.
 * Replacement values are atomic: a window starting or ending inside a splice
 * still gets the whole replacement.
 * When nothing was emitted before the tail, the result borrows the source.
 */
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>
#include "cow_text.hpp"
#include "i_splice_store.hpp"

class Renderer {
public:
  template <typename Store>
  CowText render(std::string_view source, const SpliceStoreCRTP<Store>& store,
                 size_t start, size_t end) const {
    std::string out;
    size_t last = start;
    store.for_each([&](const Splice& s) {
      // entirely before the window, or swallowed by an earlier splice
      if (s.end <= last) return true;
      if (s.start >= end) return false;
      if (s.start >= last) out.append(source.substr(last, s.start - last));
      out.append(s.value.view());
      last = s.end;
      return true;
    });
    // ending inside a splice: its replacement already covers the rest
    if (end >= last) {
      if (out.empty()) {
        SPDLOG_TRACE("render [{}, {}) borrowed", start, end);
        return CowText::borrowed(source.substr(last, end - last));
      }
      out.append(source.substr(last, end - last));
    }
    SPDLOG_TRACE("render [{}, {}) built {} bytes", start, end, out.size());
    return CowText::owned(std::move(out));
  }
};
