#pragma once
/*
 * Range bounds
 *
 * Purpose: resolve SpliceRange specs to concrete offsets and validate
 * offsets against a source. Shared by registration and rendering.
 */
#include <string_view>
#include "types.hpp"

/* Unbounded start -> 0, excluded start n -> n + 1;
   unbounded end -> len, included end n -> n + 1.
   Throws BoundsError when n + 1 does not fit in size_t. */
OffsetRange resolve_range(const SpliceRange& range, size_t len);

/* true at 0, at src.size() and at any byte that does not continue a UTF-8 sequence */
bool is_char_boundary(std::string_view src, size_t pos);

/* throws BoundsError unless start <= end <= src.size() and both sit on char boundaries */
void check_range(std::string_view src, size_t start, size_t end);
