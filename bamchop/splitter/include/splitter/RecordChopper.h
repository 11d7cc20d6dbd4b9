#pragma once

#include "hts_utils/hts_types.h"
#include "splitter/RecordSplitter.h"
#include "splitter/SplitConfig.h"

#include <cstddef>
#include <vector>

struct bam1_t;

namespace bamchop::splitter {

// Running totals over all records passed to a RecordChopper.
struct ChopStats {
    size_t records_chopped{0};
    size_t chunks_emitted{0};
    size_t tail_chunks_dropped{0};
    size_t records_without_output{0};
};

// Splits records and applies the minimum length to the last chunk.
class RecordChopper {
public:
    explicit RecordChopper(SplitConfig config);

    /// Chunks of |record| that should be written, in read order.
    /// @throws MalformedRecordError for records that cannot be split.
    std::vector<BamPtr> chop(const bam1_t* record);

    const ChopStats& stats() const { return m_stats; }
    const SplitConfig& config() const { return m_splitter.config(); }

private:
    RecordSplitter m_splitter;
    ChopStats m_stats;
};

/**
 * @brief Splits one record into chunks and drops a short final chunk.
 *
 * Equivalent to RecordSplitter::split() followed by filter_last_chunk().
 * @throws std::invalid_argument for an invalid configuration.
 * @throws MalformedRecordError for records that cannot be split.
 */
std::vector<BamPtr> chop_record(const bam1_t* record, const SplitConfig& config);

}  // namespace bamchop::splitter
