#include "splitter/CigarWalker.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace bamchop::splitter {

namespace {

void emit(CigarWindow& window, CigarOpType op, uint32_t len) {
    window.ops.push_back({op, len});
    if (consumes_reference(op)) {
        window.ref_span += len;
    }
}

}  // namespace

CigarWindow walk_cigar_window(const std::vector<CigarOp>& cigar, uint32_t start, uint32_t end) {
    const uint32_t read_length = query_length(cigar);
    if (start > end || end > read_length) {
        throw std::logic_error("Invalid CIGAR window [" + std::to_string(start) + ", " +
                               std::to_string(end) + ") for read length " +
                               std::to_string(read_length));
    }

    CigarWindow window;
    window.ops.reserve(cigar.size());

    // The cursor is the read position of the next base described by the CIGAR.
    uint32_t cursor = 0;
    for (const auto& op : cigar) {
        if (op.len == 0) {
            continue;
        }

        if (consumes_query(op.op)) {
            const uint32_t op_start = cursor;
            const uint32_t op_end = cursor + op.len;
            cursor = op_end;

            if (consumes_reference(op.op) && op_start < start) {
                window.ref_before += std::min(op_end, start) - op_start;
            }

            // Only the part overlapping the window is kept, the rest belongs to
            // the neighbouring windows.
            const uint32_t overlap_start = std::max(op_start, start);
            const uint32_t overlap_end = std::min(op_end, end);
            if (overlap_end > overlap_start) {
                emit(window, op.op, overlap_end - overlap_start);
            }
        } else {
            if (consumes_reference(op.op) && cursor == read_length) {
                // No read base follows, so there is no window to own this op.
                continue;
            }

            const bool in_window = (cursor == 0) ? (start == 0) : (start < cursor && cursor <= end);
            if (in_window) {
                emit(window, op.op, op.len);
            } else if (consumes_reference(op.op) && cursor <= start) {
                window.ref_before += op.len;
            }
        }

        if (cursor > end) {
            // Everything after this point belongs to later windows.
            break;
        }
    }

    return window;
}

}  // namespace bamchop::splitter
