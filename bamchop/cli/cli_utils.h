// Add some utilities for CLI.
#pragma once

#include "bamchop_version.h"
#include "hts_io/HtsFile.h"
#include "hts_utils/bam_utils.h"
#include "utils/string_utils.h"
#include "utils/tty_utils.h"

#include <argparse/argparse.hpp>
#include <htslib/sam.h>

#include <cstdio>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace bamchop {

namespace cli {

// Marks the header as unsorted and records the command line in a @PG line.
inline void add_pg_hdr(sam_hdr_t* hdr, const std::string& pg_id, const std::vector<std::string>& args) {
    utils::set_unknown_sort_order(hdr);
    auto safe_id = sam_hdr_pg_id(hdr, pg_id.c_str());
    if (!safe_id) {
        throw std::runtime_error("Could not generate a @PG ID for " + pg_id);
    }

    std::stringstream pg;
    pg << "@PG\tID:" << safe_id << "\tPN:bamchop\tVN:" << BAMCHOP_VERSION << "\tCL:bamchop";
    for (size_t i = 1; i < args.size(); ++i) {
        pg << " " << std::quoted(args[i]);
    }
    pg << '\n';
    if (sam_hdr_add_lines(hdr, pg.str().c_str(), 0) < 0) {
        throw std::runtime_error("Could not add @PG line to header.");
    }
}

// ArgumentParser has no method returning optional arguments with default values so this function returns
// optional<T> which lets us determine if the value (including the default value) was explictly set by the user.
template <typename T>
inline std::optional<T> get_optional_argument(const std::string& arg_name,
                                              const argparse::ArgumentParser& parser) {
    static_assert(std::is_default_constructible_v<T>, "T must be default constructible");
    return parser.is_used(arg_name) ? std::optional<T>(parser.get<T>(arg_name)) : std::nullopt;
}

inline std::optional<HtsFile::OutputMode> parse_output_format(const std::string& format) {
    const auto lower = utils::to_lowercase(format);
    if (lower == "bam") {
        return HtsFile::OutputMode::BAM;
    }
    if (lower == "ubam") {
        return HtsFile::OutputMode::UBAM;
    }
    if (lower == "sam") {
        return HtsFile::OutputMode::SAM;
    }
    if (lower == "cram") {
        return HtsFile::OutputMode::CRAM;
    }
    return std::nullopt;
}

// Picks the output format from the file extension. For stdout, SAM is written to a
// terminal and uncompressed BAM to a pipe.
inline HtsFile::OutputMode infer_output_mode(const std::string& output_path) {
    if (output_path == "-") {
        if (utils::is_fd_tty(stdout)) {
            return HtsFile::OutputMode::SAM;
        }
        if (utils::is_fd_pipe(stdout)) {
            return HtsFile::OutputMode::UBAM;
        }
        return HtsFile::OutputMode::BAM;
    }
    const auto lower = utils::to_lowercase(output_path);
    if (utils::ends_with(lower, ".sam")) {
        return HtsFile::OutputMode::SAM;
    }
    if (utils::ends_with(lower, ".cram")) {
        return HtsFile::OutputMode::CRAM;
    }
    return HtsFile::OutputMode::BAM;
}

}  // namespace cli

}  // namespace bamchop
