#include "splitter/RecordChopper.h"

#include "splitter/ChunkFilter.h"

#include <utility>

namespace bamchop::splitter {

RecordChopper::RecordChopper(SplitConfig config) : m_splitter(std::move(config)) {}

std::vector<BamPtr> RecordChopper::chop(const bam1_t* record) {
    auto chunks = m_splitter.split(record);
    if (filter_last_chunk(chunks, m_splitter.config().min_length)) {
        m_stats.tail_chunks_dropped++;
    }
    if (chunks.empty()) {
        m_stats.records_without_output++;
    }
    m_stats.records_chopped++;
    m_stats.chunks_emitted += chunks.size();
    return chunks;
}

std::vector<BamPtr> chop_record(const bam1_t* record, const SplitConfig& config) {
    auto chunks = RecordSplitter(config).split(record);
    filter_last_chunk(chunks, config.min_length);
    return chunks;
}

}  // namespace bamchop::splitter
