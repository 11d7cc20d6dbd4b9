#include "hts_io/HtsReader.h"

#include <htslib/hts.h>
#include <htslib/sam.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace bamchop {

HtsReader::HtsReader(const std::string& filename,
                     const std::optional<std::string>& reference,
                     int threads)
        : m_filename(filename) {
    m_file.reset(hts_open(filename.c_str(), "r"));
    if (!m_file) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    auto format = hts_format_description(hts_get_format(m_file.get()));
    if (format) {
        m_format = format;
        hts_free(format);
    }

    if (reference) {
        if (hts_get_format(m_file.get())->format == cram) {
            if (hts_set_fai_filename(m_file.get(), reference->c_str()) != 0) {
                throw std::runtime_error("Could not load reference " + *reference + " for " +
                                         filename);
            }
        } else {
            spdlog::debug("Reference {} not needed for {} input", *reference, m_format);
        }
    }

    if (threads > 0 && hts_set_threads(m_file.get(), threads) != 0) {
        throw std::runtime_error("Could not enable multi threading for reading " + filename);
    }

    m_header.reset(sam_hdr_read(m_file.get()));
    if (!m_header) {
        throw std::runtime_error("Could not read header from file: " + filename);
    }

    spdlog::debug("Opened {} ({})", filename, m_format);
    record.reset(bam_init1());
}

bool HtsReader::read() {
    const int res = sam_read1(m_file.get(), m_header.get(), record.get());
    if (res == -1) {
        return false;
    }
    if (res < -1) {
        throw std::runtime_error("Failed to read record " + std::to_string(m_num_records + 1) +
                                 " from " + m_filename + ", error code " + std::to_string(res));
    }
    ++m_num_records;
    return true;
}

sam_hdr_t* HtsReader::header() { return m_header.get(); }

const sam_hdr_t* HtsReader::header() const { return m_header.get(); }

const std::string& HtsReader::format() const { return m_format; }

}  // namespace bamchop
