#include "splitter/SplitConfig.h"

#include <sstream>
#include <stdexcept>

namespace bamchop::splitter {

void validate(const SplitConfig& config) {
    if (config.chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be a positive integer.");
    }
    if (config.read_group && config.read_group->empty()) {
        throw std::invalid_argument("Read group must be non-empty when specified.");
    }
}

std::string to_string(const SplitConfig& config) {
    std::ostringstream oss;
    oss << "{ ";
    oss << "chunk_size:" << config.chunk_size << ", ";
    oss << "min_length:" << config.min_length << ", ";
    oss << "read_group:'" << config.read_group.value_or("") << "', ";
    oss << "skip_clipped_bases:" << (config.skip_clipped_bases ? "true" : "false");
    oss << " }";
    return oss.str();
}

}  // namespace bamchop::splitter
