#pragma once

#include "hts_utils/hts_types.h"

#include <cstdint>
#include <vector>

namespace bamchop::splitter {

/**
 * @brief Drops the last chunk of a record if it is shorter than min_length.
 *
 * Only the last chunk can be short, all earlier chunks are exactly chunk_size
 * long. A min_length of 0 never drops anything. Dropping the only chunk leaves
 * |chunks| empty, which is a valid outcome.
 *
 * @return true if a chunk was dropped.
 */
bool filter_last_chunk(std::vector<BamPtr>& chunks, uint32_t min_length);

}  // namespace bamchop::splitter
