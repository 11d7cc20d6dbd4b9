#include "utils/cigar.h"

#include <cctype>
#include <ostream>
#include <sstream>
#include <tuple>

namespace bamchop {

namespace {

// Shift and mask of the packed BAM CIGAR encoding.
constexpr uint32_t BAM_CIGAR_OP_SHIFT = 4;
constexpr uint32_t BAM_CIGAR_OP_MASK = 0xf;

}  // namespace

std::ostream& operator<<(std::ostream& os, const CigarOp& a) {
    os << a.len << convert_cigar_op_to_char(a.op);
    return os;
}

std::string cigar_op_to_string(const CigarOp& a) {
    return std::to_string(a.len) + std::string(1, convert_cigar_op_to_char(a.op));
}

std::ostream& operator<<(std::ostream& os, const std::vector<CigarOp>& cigar) {
    for (CigarOp op : cigar) {
        os << op;
    }
    return os;
}

bool operator==(const CigarOp& a, const CigarOp& b) {
    return std::tie(a.op, a.len) == std::tie(b.op, b.len);
}

std::vector<CigarOp> parse_cigar_from_string(const std::string_view cigar) {
    std::vector<CigarOp> ops;
    ops.reserve(std::size(cigar));
    uint32_t len = 0;
    for (char c : cigar) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            len = len * 10 + (c - '0');
        } else {
            const CigarOpType op = CIGAR_CHAR_TO_OP[static_cast<unsigned char>(c)];
            ops.emplace_back(CigarOp{op, len});
            len = 0;
        }
    }
    ops.shrink_to_fit();
    return ops;
}

std::vector<CigarOp> convert_bam_cigar(const uint32_t* cigar, uint32_t n_cigar) {
    std::vector<CigarOp> cigar_ops;
    cigar_ops.resize(n_cigar);
    for (uint32_t i = 0; i < n_cigar; ++i) {
        const CigarOpType op = CIGAR_BAM_TO_OP[cigar[i] & BAM_CIGAR_OP_MASK];
        const uint32_t len = cigar[i] >> BAM_CIGAR_OP_SHIFT;
        cigar_ops[i] = {op, len};
    }
    return cigar_ops;
}

std::vector<uint32_t> convert_to_bam_cigar(const std::vector<CigarOp>& cigar) {
    std::vector<uint32_t> packed;
    packed.reserve(cigar.size());
    for (const auto& op : cigar) {
        packed.push_back(op.len << BAM_CIGAR_OP_SHIFT | static_cast<uint32_t>(op.op));
    }
    return packed;
}

uint32_t query_length(const std::vector<CigarOp>& cigar) {
    uint32_t len = 0;
    for (const auto& op : cigar) {
        if (consumes_query(op.op)) {
            len += op.len;
        }
    }
    return len;
}

uint32_t reference_length(const std::vector<CigarOp>& cigar) {
    uint32_t len = 0;
    for (const auto& op : cigar) {
        if (consumes_reference(op.op)) {
            len += op.len;
        }
    }
    return len;
}

std::string serialize_cigar(const std::vector<CigarOp>& cigar) {
    std::ostringstream oss;
    oss << cigar;
    return oss.str();
}

}  // namespace bamchop
