#pragma once

#include "utils/cigar.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct sam_hdr_t;
struct bam1_t;

namespace bamchop::utils {

/*
 * Extract the sequence string.
 *
 * @param input_record Record to fetch sequence from.
 * @return The sequence bases as a string. Empty if the record stores no sequence.
 */
std::string extract_sequence(const bam1_t* input_record);

/*
 * Extract the sequence quality information.
 *
 * @param input_record Record to fetch quality from.
 * @return Vector of raw (not +33 offset) qualities. Empty if the record has no
 * sequence or its qualities are absent (stored as 0xff).
 */
std::vector<uint8_t> extract_quality(const bam1_t* input_record);

/*
 * Extract the CIGAR of a record as CigarOps.
 */
std::vector<CigarOp> extract_cigar(const bam1_t* input_record);

// Read name of the record without the trailing NUL padding.
std::string get_read_name(const bam1_t* record);

// Sets SO:unknown in the @HD line, adding the line if it is missing.
void set_unknown_sort_order(sam_hdr_t* hdr);

/*
 * Add an @RG line with the given ID, and SM when a sample name is supplied.
 *
 * @return false if a read group with that ID already exists, in which case the
 * header is left unchanged.
 * @throws std::runtime_error if htslib fails to add the line.
 */
bool add_rg_header(sam_hdr_t* hdr,
                   const std::string& read_group_id,
                   const std::optional<std::string>& sample_name);

/*
 * Set the RG:Z tag of a record, replacing any existing value.
 *
 * @throws std::runtime_error if the tag cannot be written.
 */
void set_read_group_tag(bam1_t* record, const std::string& read_group_id);

}  // namespace bamchop::utils
