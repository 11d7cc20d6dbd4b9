#pragma once

#include "hts_utils/hts_types.h"

#include <cstddef>
#include <optional>
#include <string>

struct bam1_t;
struct sam_hdr_t;

namespace bamchop {

// Output sink for SAM/BAM/CRAM records.
class HtsFile {
public:
    enum class OutputMode {
        UBAM,
        BAM,
        SAM,
        CRAM,
    };

    /**
     * @param filename Output path, or "-" for stdout.
     * @param mode Container format to write.
     * @param threads Compression threads, 0 to compress on the calling thread.
     * @param reference FASTA reference, required for CRAM output.
     * @throws std::runtime_error if the file cannot be opened or configured.
     */
    HtsFile(const std::string& filename,
            OutputMode mode,
            int threads,
            const std::optional<std::string>& reference);
    ~HtsFile();
    HtsFile(const HtsFile&) = delete;
    HtsFile& operator=(const HtsFile&) = delete;

    /// Stores a copy of |header| and writes it. Must be called once before write().
    void set_header(const sam_hdr_t* header);

    /// @throws std::runtime_error if the record cannot be written.
    void write(const bam1_t* record);

    /// Flushes and closes the file.
    /// @throws std::runtime_error if closing fails.
    void finalise();

    OutputMode get_output_mode() const { return m_mode; }
    std::size_t num_records_written() const { return m_num_records; }

private:
    std::string m_filename;
    HtsFilePtr m_file;
    SamHdrPtr m_header;
    std::size_t m_num_records{0};
    bool m_finalised{false};
    const OutputMode m_mode;
};

std::string to_string(HtsFile::OutputMode mode);

}  // namespace bamchop
