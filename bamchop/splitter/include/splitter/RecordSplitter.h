#pragma once

#include "hts_utils/hts_types.h"
#include "splitter/SplitConfig.h"
#include "utils/cigar.h"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

struct bam1_t;

namespace bamchop::splitter {

// Raised for records that cannot be split: a CIGAR that does not describe the
// stored sequence, or a chunk name beyond the BAM limit.
class MalformedRecordError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Longest read name a BAM record can hold, excluding the NUL terminator.
constexpr size_t MAX_READ_NAME_LENGTH = 254;

// A range [start, end) of read coordinates that becomes one chunk.
struct ChunkWindow {
    uint32_t start{0};
    uint32_t end{0};

    uint32_t length() const { return end - start; }
};

bool operator==(const ChunkWindow& a, const ChunkWindow& b);

/**
 * @brief Tiles [0, read_length) with windows of chunk_size bases.
 *
 * All windows are chunk_size long except possibly the last one.
 * @throws std::invalid_argument if chunk_size is zero.
 */
std::vector<ChunkWindow> make_chunk_windows(uint32_t read_length, uint32_t chunk_size);

// Name given to the chunk at |chunk_index| of a read.
std::string make_chunk_name(const std::string& read_name, size_t chunk_index);

// Cuts alignment records into chunks of at most chunk_size read bases.
class RecordSplitter {
public:
    /// @throws std::invalid_argument if the configuration is invalid.
    explicit RecordSplitter(SplitConfig config);

    /**
     * @brief Splits one record into chunks, in read order.
     *
     * Each chunk carries the sequence and qualities of its window, the CIGAR of that
     * window and, for mapped records, a position shifted by the reference bases
     * consumed before the window. Flags, MAPQ and mate fields are copied unchanged.
     * Aux tags are copied unchanged except RG when a read group is configured.
     * No minimum length is applied here, see filter_last_chunk().
     *
     * @throws MalformedRecordError if the CIGAR does not describe the stored sequence
     * or a chunk name is too long.
     * @throws std::runtime_error if htslib fails to build a chunk record.
     */
    std::vector<BamPtr> split(const bam1_t* record) const;

    const SplitConfig& config() const { return m_config; }

private:
    SplitConfig m_config;

    BamPtr make_chunk_record(const bam1_t* record,
                             const std::string& name,
                             const std::vector<CigarOp>& cigar,
                             int64_t pos,
                             const char* seq,
                             const uint8_t* qual,
                             uint32_t length) const;
};

}  // namespace bamchop::splitter
