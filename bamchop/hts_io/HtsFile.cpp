#include "hts_io/HtsFile.h"

#include <htslib/hts.h>
#include <htslib/sam.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

namespace {

const char* open_mode(bamchop::HtsFile::OutputMode mode) {
    using OutputMode = bamchop::HtsFile::OutputMode;
    switch (mode) {
    case OutputMode::UBAM:
        return "wb0";
    case OutputMode::BAM:
        return "wb";
    case OutputMode::SAM:
        return "w";
    case OutputMode::CRAM:
        return "wc";
    default:
        throw std::runtime_error("Unknown output mode selected: " +
                                 std::to_string(static_cast<int>(mode)));
    }
}

}  // namespace

namespace bamchop {

HtsFile::HtsFile(const std::string& filename,
                 OutputMode mode,
                 int threads,
                 const std::optional<std::string>& reference)
        : m_filename(filename), m_mode(mode) {
    if (m_mode == OutputMode::CRAM && !reference) {
        throw std::runtime_error("A reference is required to write CRAM output.");
    }

    m_file.reset(hts_open(m_filename.c_str(), open_mode(m_mode)));
    if (!m_file) {
        throw std::runtime_error("Could not open file: " + m_filename);
    }

    if (m_mode == OutputMode::CRAM) {
        if (hts_set_fai_filename(m_file.get(), reference->c_str()) != 0) {
            throw std::runtime_error("Could not load reference " + *reference + " for " +
                                     m_filename);
        }
    }

    if (threads > 0 && m_mode != OutputMode::SAM) {
        if (hts_set_threads(m_file.get(), threads) != 0) {
            throw std::runtime_error("Could not enable multi threading for " + to_string(m_mode) +
                                     " generation.");
        }
    }
}

HtsFile::~HtsFile() {
    if (!m_finalised) {
        spdlog::error("finalise() not called on a HtsFile.");
    }
}

void HtsFile::set_header(const sam_hdr_t* header) {
    if (m_header) {
        throw std::runtime_error("Header already written to " + m_filename);
    }
    m_header.reset(sam_hdr_dup(header));
    if (!m_header) {
        throw std::runtime_error("Could not copy header for " + m_filename);
    }
    if (sam_hdr_write(m_file.get(), m_header.get()) != 0) {
        throw std::runtime_error("Could not write header to " + m_filename);
    }
}

void HtsFile::write(const bam1_t* record) {
    if (!m_header) {
        throw std::runtime_error("set_header() must be called before writing to " + m_filename);
    }
    auto res = sam_write1(m_file.get(), m_header.get(), record);
    if (res < 0) {
        throw std::runtime_error("Failed to write record " + std::string(bam_get_qname(record)) +
                                 " to " + m_filename + ", error code " + std::to_string(res));
    }
    ++m_num_records;
}

void HtsFile::finalise() {
    if (m_finalised) {
        spdlog::error("finalise() called twice on a HtsFile. Ignoring second call.");
        return;
    }
    m_finalised = true;
    const int res = hts_close(m_file.release());
    if (res != 0) {
        throw std::runtime_error("Failed to close " + m_filename + ", error code " +
                                 std::to_string(res));
    }
    spdlog::debug("Wrote {} records to {}", m_num_records, m_filename);
}

std::string to_string(HtsFile::OutputMode mode) {
    switch (mode) {
    case HtsFile::OutputMode::UBAM:
        return "UBAM";
    case HtsFile::OutputMode::BAM:
        return "BAM";
    case HtsFile::OutputMode::SAM:
        return "SAM";
    case HtsFile::OutputMode::CRAM:
        return "CRAM";
    default:
        return "UNKNOWN";
    }
}

}  // namespace bamchop
