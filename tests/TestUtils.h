#pragma once

#include "hts_utils/hts_types.h"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bamchop::tests {

std::filesystem::path get_data_dir(const std::string& sub_dir);

#define get_chop_data_dir() get_data_dir("chop")

// Wrapper around a temporary directory since one doesn't exist in the standard
struct TempDir {
private:
    // Force devs to use the function instead of creating their own TempDirs
    friend TempDir make_temp_dir(const std::string& prefix);
    TempDir(std::filesystem::path path) : m_path(std::move(path)) {}

public:
    ~TempDir() {
        if (!m_path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(m_path, ec);
            if (ec) {
                spdlog::warn("Could not delete {}: {}", m_path.string(), ec.message());
            }
        }
    }

    TempDir(TempDir&& other) { std::swap(m_path, other.m_path); }
    TempDir& operator=(TempDir&& other) = delete;

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::filesystem::path m_path;
};

TempDir make_temp_dir(const std::string& prefix);

// Fields of a test record. Qualities default to i % 40 for base i so that slices
// can be told apart.
struct TestRecord {
    std::string name{"read"};
    std::string seq;
    std::string cigar;
    int64_t pos{100};
    uint16_t flag{0};
    int32_t tid{0};
    uint8_t mapq{60};
    int32_t mtid{-1};
    int64_t mpos{-1};
    int64_t isize{0};
    bool with_quality{true};
};

BamPtr make_record(const TestRecord& fields);

// Appends a Z tag to |record|.
void add_string_tag(bam1_t* record, const char tag[2], const std::string& value);

// Value of a Z tag, or an empty string if the tag is missing.
std::string get_string_tag(const bam1_t* record, const char tag[2]);

}  // namespace bamchop::tests

using namespace bamchop::tests;
