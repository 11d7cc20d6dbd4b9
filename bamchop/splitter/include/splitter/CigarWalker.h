#pragma once

#include "utils/cigar.h"

#include <cstdint>
#include <vector>

namespace bamchop::splitter {

// The part of an alignment that covers one window of read coordinates.
struct CigarWindow {
    // Ops covering the window, with boundary ops truncated to the window.
    std::vector<CigarOp> ops;
    // Reference bases consumed before the window starts.
    uint32_t ref_before{0};
    // Reference bases consumed by |ops|.
    uint32_t ref_span{0};
};

/**
 * @brief Extracts the CIGAR ops that describe the read window [start, end).
 *
 * Ops that consume read bases are truncated to their overlap with the window.
 * Ops that consume no read bases (D, N, H, P) sit between two read positions and
 * are attached to the window ending at that position, i.e. the window satisfying
 * start < position <= end. Ops in front of the first read base go to the window
 * starting at 0. Reference-consuming ops after the last read base of the record are
 * dropped. Every op is therefore emitted by at most one window.
 *
 * @param cigar Full CIGAR of the record.
 * @param start First read position of the window.
 * @param end One past the last read position of the window.
 * @return The ops of the window and the reference offsets.
 * @throws std::logic_error if start > end or end exceeds the read length of the CIGAR.
 */
CigarWindow walk_cigar_window(const std::vector<CigarOp>& cigar, uint32_t start, uint32_t end);

}  // namespace bamchop::splitter
