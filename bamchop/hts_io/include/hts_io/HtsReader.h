#pragma once

#include "hts_utils/hts_types.h"

#include <cstddef>
#include <optional>
#include <string>

struct sam_hdr_t;

namespace bamchop {

// Sequential reader for SAM/BAM/CRAM input.
class HtsReader {
public:
    /**
     * @param filename Input path, or "-" for stdin.
     * @param reference FASTA used to decode CRAM input. Ignored for other formats.
     * @param threads Decompression threads, 0 to decode on the calling thread.
     * @throws std::runtime_error if the file or its header cannot be read.
     */
    HtsReader(const std::string& filename,
              const std::optional<std::string>& reference,
              int threads);

    /// Reads the next record into |record|.
    /// @return false at the end of the input.
    /// @throws std::runtime_error if the input is truncated or corrupt.
    bool read();

    BamPtr record;

    sam_hdr_t* header();
    const sam_hdr_t* header() const;
    const std::string& format() const;
    std::size_t num_records_read() const { return m_num_records; }

private:
    std::string m_filename;
    HtsFilePtr m_file;
    SamHdrPtr m_header;
    std::string m_format;
    std::size_t m_num_records{0};
};

}  // namespace bamchop
