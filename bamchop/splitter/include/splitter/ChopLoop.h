#pragma once

#include <cstddef>

namespace bamchop {
class HtsFile;
class HtsReader;
}  // namespace bamchop

namespace bamchop::splitter {

class RecordChopper;

/**
 * @brief Chops every remaining record of |reader| and writes the chunks to |writer|.
 *
 * Chunks of one record are written contiguously, records in input order.
 * Malformed records are logged and skipped, any other error ends the loop.
 *
 * @return Number of records skipped as malformed.
 * @throws std::runtime_error if reading or writing fails, or a chunk record cannot be built.
 * @throws std::logic_error for an invalid CIGAR window.
 */
size_t chop_records(HtsReader& reader, HtsFile& writer, RecordChopper& chopper);

}  // namespace bamchop::splitter
