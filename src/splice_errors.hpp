#pragma once
/*
 * Splice errors
 *
 * Purpose: exceptions raised on offset bookkeeping mistakes by the caller.
 * Both are programmer errors; nothing is clamped or ignored.
 */
#include <stdexcept>
#include <string>
#include "types.hpp"

class SpliceError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

/* registration collides with an already registered splice */
class OverlapError : public SpliceError {
public:
  OverlapError(OffsetRange rejected, OffsetRange existing);
  OffsetRange rejected() const { return rejected_; }
  OffsetRange existing() const { return existing_; }
private:
  OffsetRange rejected_;
  OffsetRange existing_;
};

/* offsets outside the source, reversed, or splitting a UTF-8 sequence */
class BoundsError : public SpliceError {
public:
  BoundsError(OffsetRange range, size_t source_len, const std::string& reason);
  OffsetRange range() const { return range_; }
  size_t source_len() const { return source_len_; }
private:
  OffsetRange range_;
  size_t source_len_;
};
