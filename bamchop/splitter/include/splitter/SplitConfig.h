#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace bamchop::splitter {

// Settings threaded into every split call.
struct SplitConfig {
    // Maximum number of read bases per chunk. Must be positive.
    uint32_t chunk_size{0};
    // The final chunk of a record is dropped if it is shorter than this.
    uint32_t min_length{0};
    // When set, RG:Z on every chunk is replaced with this value.
    std::optional<std::string> read_group{};
    // Remove leading/trailing soft and hard clips before chunking.
    bool skip_clipped_bases{false};
};

/**
 * @brief Checks that the configuration can be used for splitting.
 *
 * @throws std::invalid_argument if chunk_size is zero or the read group is empty.
 */
void validate(const SplitConfig& config);

std::string to_string(const SplitConfig& config);

}  // namespace bamchop::splitter
