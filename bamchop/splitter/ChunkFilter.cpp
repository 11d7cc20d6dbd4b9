#include "splitter/ChunkFilter.h"

#include <htslib/sam.h>

namespace bamchop::splitter {

bool filter_last_chunk(std::vector<BamPtr>& chunks, uint32_t min_length) {
    if (chunks.empty() || min_length == 0) {
        return false;
    }
    const auto last_length = static_cast<uint32_t>(chunks.back()->core.l_qseq);
    if (last_length >= min_length) {
        return false;
    }
    chunks.pop_back();
    return true;
}

}  // namespace bamchop::splitter
