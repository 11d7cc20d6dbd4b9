#include "splitter/RecordSplitter.h"

#include "hts_utils/bam_utils.h"
#include "splitter/CigarWalker.h"
#include "utils/log_utils.h"

#include <htslib/sam.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace bamchop::splitter {

namespace {

// The part of a record that gets chunked: its CIGAR and the range of the stored
// sequence that the CIGAR describes.
struct ChunkingRange {
    std::vector<CigarOp> cigar;
    uint32_t query_start{0};
    uint32_t query_length{0};
};

ChunkingRange get_chunking_range(std::vector<CigarOp> cigar,
                                 uint32_t seq_len,
                                 bool skip_clipped_bases) {
    ChunkingRange range{std::move(cigar), 0, seq_len};
    if (!skip_clipped_bases) {
        return range;
    }

    // Hard clips are outermost and soft clips inside them, but accept any order.
    auto& ops = range.cigar;
    uint32_t leading_softclips = 0;
    auto first = ops.begin();
    for (; first != ops.end() && is_clip(first->op); ++first) {
        if (first->op == CigarOpType::S) {
            leading_softclips += first->len;
        }
    }
    uint32_t trailing_softclips = 0;
    auto last = ops.end();
    for (; last != first && is_clip(std::prev(last)->op); --last) {
        if (std::prev(last)->op == CigarOpType::S) {
            trailing_softclips += std::prev(last)->len;
        }
    }
    ops = std::vector<CigarOp>(first, last);

    range.query_start = leading_softclips;
    range.query_length = seq_len - leading_softclips - trailing_softclips;
    return range;
}

}  // namespace

bool operator==(const ChunkWindow& a, const ChunkWindow& b) {
    return a.start == b.start && a.end == b.end;
}

std::vector<ChunkWindow> make_chunk_windows(uint32_t read_length, uint32_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be a positive integer.");
    }

    std::vector<ChunkWindow> windows;
    windows.reserve(read_length / chunk_size + 1);
    for (uint32_t start = 0; start < read_length;) {
        const uint32_t end = start + std::min(chunk_size, read_length - start);
        windows.push_back({start, end});
        start = end;
    }
    return windows;
}

std::string make_chunk_name(const std::string& read_name, size_t chunk_index) {
    return read_name + "_" + std::to_string(chunk_index);
}

RecordSplitter::RecordSplitter(SplitConfig config) : m_config(std::move(config)) {
    validate(m_config);
}

std::vector<BamPtr> RecordSplitter::split(const bam1_t* record) const {
    const std::string read_name = utils::get_read_name(record);
    const auto seq_len = static_cast<uint32_t>(record->core.l_qseq);

    // Unmapped records keep their position field whatever it holds, and any
    // CIGAR they carry is not propagated.
    const bool is_mapped = !(record->core.flag & BAM_FUNMAP);
    auto cigar = is_mapped ? utils::extract_cigar(record) : std::vector<CigarOp>{};

    if (!cigar.empty()) {
        const uint32_t cigar_len = query_length(cigar);
        if (cigar_len != seq_len) {
            throw MalformedRecordError("Malformed CIGAR " + serialize_cigar(cigar) +
                                       " for read " + read_name + ": describes " +
                                       std::to_string(cigar_len) +
                                       " read bases but the record stores " +
                                       std::to_string(seq_len));
        }
    }

    const auto range = get_chunking_range(std::move(cigar), seq_len, m_config.skip_clipped_bases);

    const std::string seq = utils::extract_sequence(record);
    const std::vector<uint8_t> qual = utils::extract_quality(record);

    const auto windows = make_chunk_windows(range.query_length, m_config.chunk_size);

    std::vector<BamPtr> chunks;
    chunks.reserve(windows.size());
    for (size_t chunk_index = 0; chunk_index < windows.size(); ++chunk_index) {
        const auto& window = windows[chunk_index];
        const uint32_t seq_offset = range.query_start + window.start;

        int64_t pos = record->core.pos;
        std::vector<CigarOp> chunk_cigar;
        if (!range.cigar.empty()) {
            auto cigar_window = walk_cigar_window(range.cigar, window.start, window.end);
            pos += cigar_window.ref_before;
            chunk_cigar = std::move(cigar_window.ops);
        }

        const auto chunk_name = make_chunk_name(read_name, chunk_index);
        if (chunk_name.size() > MAX_READ_NAME_LENGTH) {
            throw MalformedRecordError("Chunk name " + chunk_name + " exceeds " +
                                       std::to_string(MAX_READ_NAME_LENGTH) + " characters");
        }
#if ENABLE_PER_READ_TRACE
        utils::trace_log("{} [{}, {}) -> {} pos {} cigar {}", read_name, seq_offset,
                         seq_offset + window.length(), chunk_name, pos,
                         serialize_cigar(chunk_cigar));
#endif

        chunks.push_back(make_chunk_record(record, chunk_name, chunk_cigar, pos,
                                           seq.data() + seq_offset,
                                           qual.empty() ? nullptr : qual.data() + seq_offset,
                                           window.length()));
    }

    return chunks;
}

BamPtr RecordSplitter::make_chunk_record(const bam1_t* record,
                                         const std::string& name,
                                         const std::vector<CigarOp>& cigar,
                                         int64_t pos,
                                         const char* seq,
                                         const uint8_t* qual,
                                         uint32_t length) const {
    const auto packed_cigar = convert_to_bam_cigar(cigar);
    const auto l_aux = bam_get_l_aux(record);

    BamPtr chunk(bam_init1());
    if (!chunk) {
        throw std::runtime_error("Failed to allocate record for " + name);
    }

    if (bam_set1(chunk.get(), name.size(), name.c_str(), record->core.flag, record->core.tid, pos,
                 record->core.qual, packed_cigar.size(),
                 packed_cigar.empty() ? nullptr : packed_cigar.data(), record->core.mtid,
                 record->core.mpos, record->core.isize, length, seq,
                 reinterpret_cast<const char*>(qual), l_aux) < 0) {
        throw std::runtime_error("Failed to build chunk record " + name);
    }

    // Tags are not chunk aware, so the whole aux block is carried over.
    std::memcpy(bam_get_aux(chunk.get()), bam_get_aux(record), l_aux);
    chunk->l_data += static_cast<int>(l_aux);

    if (m_config.read_group) {
        utils::set_read_group_tag(chunk.get(), *m_config.read_group);
    }
    return chunk;
}

}  // namespace bamchop::splitter
