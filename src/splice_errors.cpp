#include "splice_errors.hpp"
#include <spdlog/fmt/fmt.h>

OverlapError::OverlapError(OffsetRange rejected, OffsetRange existing)
  : SpliceError(fmt::format("trying to splice an already spliced range: [{}, {}) collides with [{}, {})",
                            rejected.start, rejected.end, existing.start, existing.end)),
    rejected_(rejected), existing_(existing) {}

BoundsError::BoundsError(OffsetRange range, size_t source_len, const std::string& reason)
  : SpliceError(fmt::format("range [{}, {}) out of bounds for source of length {}: {}",
                            range.start, range.end, source_len, reason)),
    range_(range), source_len_(source_len) {}
