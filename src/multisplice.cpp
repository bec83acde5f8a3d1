#include "multisplice.hpp"
#include <spdlog/spdlog.h>
#include "range_bounds.hpp"

Multisplice::Multisplice(std::string_view source, SpliceOptions opt) : source_(source), opt_(opt) {}

std::string_view Multisplice::backend_name() const { return store_.get_name(); }
size_t Multisplice::size() const { return store_.size(); }
bool Multisplice::empty() const { return store_.empty(); }

void Multisplice::splice(size_t start, size_t end, std::string value) {
  splice_text(start, end, CowText::owned(std::move(value)));
}

void Multisplice::splice_borrowed(size_t start, size_t end, std::string_view value) {
  splice_text(start, end, CowText::borrowed(value));
}

void Multisplice::splice_range(const SpliceRange& range, std::string value) {
  OffsetRange r = resolve_range(range, source_.size());
  splice_text(r.start, r.end, CowText::owned(std::move(value)));
}

void Multisplice::splice_range_borrowed(const SpliceRange& range, std::string_view value) {
  OffsetRange r = resolve_range(range, source_.size());
  splice_text(r.start, r.end, CowText::borrowed(value));
}

void Multisplice::splice_text(size_t start, size_t end, CowText value) {
  try {
    check_range(source_, start, end);
  } catch (const BoundsError& e) {
    spdlog::debug("multisplice: rejected splice: {}", e.what());
    throw;
  }
  if (const Splice* hit = store_.find_conflict(start, end, opt_.overlap)) {
    spdlog::debug("multisplice: rejected splice [{}, {}): overlaps [{}, {})", start, end, hit->start, hit->end);
    throw OverlapError(OffsetRange{start, end}, hit->range());
  }
  size_t len = value.size();
  store_.insert(Splice{start, end, std::move(value)});
  spdlog::debug("multisplice: splice [{}, {}) -> {} bytes, {} splices", start, end, len, store_.size());
}

CowText Multisplice::slice(size_t start, size_t end) const {
  check_range(source_, start, end);
  return renderer_.render(source_, store_, start, end);
}

CowText Multisplice::slice_range(const SpliceRange& range) const {
  OffsetRange r = resolve_range(range, source_.size());
  return slice(r.start, r.end);
}

std::string Multisplice::to_string() const {
  return slice(0, source_.size()).into_string();
}

std::ostream& operator<<(std::ostream& os, const Multisplice& ms) {
  return os << ms.slice(0, ms.source().size());
}
