#include "hts_utils/bam_utils.h"

#include <htslib/sam.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace bamchop::utils {

namespace {

// Convert the 4bit encoded sequence in a bam1_t structure
// into a string.
std::string convert_nt16_to_str(const uint8_t* bseq, size_t slen) {
    std::string seq(slen, '*');
    for (size_t i = 0; i < slen; i++) {
        seq[i] = seq_nt16_str[bam_seqi(bseq, i)];
    }
    return seq;
}

}  // namespace

std::string extract_sequence(const bam1_t* input_record) {
    auto bseq = bam_get_seq(input_record);
    int seqlen = input_record->core.l_qseq;
    return convert_nt16_to_str(bseq, seqlen);
}

std::vector<uint8_t> extract_quality(const bam1_t* input_record) {
    const uint8_t* qual_aln = bam_get_qual(input_record);
    int seqlen = input_record->core.l_qseq;
    std::vector<uint8_t> qual;
    if (seqlen > 0 && qual_aln[0] != 0xff) {
        qual = std::vector<uint8_t>(qual_aln, qual_aln + seqlen);
    }
    return qual;
}

std::vector<CigarOp> extract_cigar(const bam1_t* input_record) {
    return convert_bam_cigar(bam_get_cigar(input_record), input_record->core.n_cigar);
}

std::string get_read_name(const bam1_t* record) { return std::string(bam_get_qname(record)); }

void set_unknown_sort_order(sam_hdr_t* hdr) {
    if (sam_hdr_count_lines(hdr, "HD") <= 0) {
        if (sam_hdr_add_line(hdr, "HD", "VN", SAM_FORMAT_VERSION, "SO", "unknown", nullptr) < 0) {
            throw std::runtime_error("Failed to add @HD line to header.");
        }
        return;
    }
    if (sam_hdr_change_HD(hdr, "SO", "unknown") < 0) {
        throw std::runtime_error("Failed to update the sort order in the @HD header line.");
    }
}

bool add_rg_header(sam_hdr_t* hdr,
                   const std::string& read_group_id,
                   const std::optional<std::string>& sample_name) {
    if (sam_hdr_line_index(hdr, "RG", read_group_id.c_str()) >= 0) {
        spdlog::debug("Read group {} already present in header", read_group_id);
        return false;
    }

    auto line = "@RG\tID:" + read_group_id;
    if (sample_name) {
        line += "\tSM:" + *sample_name;
    }
    line += '\n';
    if (sam_hdr_add_lines(hdr, line.c_str(), 0) < 0) {
        throw std::runtime_error("Failed to add read group " + read_group_id + " to header.");
    }
    return true;
}

void set_read_group_tag(bam1_t* record, const std::string& read_group_id) {
    if (bam_aux_update_str(record, "RG", static_cast<int>(read_group_id.size() + 1),
                           read_group_id.c_str()) < 0) {
        throw std::runtime_error("Unable to set RG:" + read_group_id + " on record " +
                                 get_read_name(record));
    }
}

}  // namespace bamchop::utils
