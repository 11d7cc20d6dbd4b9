#include "cli/cli.h"
#include "cli/cli_utils.h"
#include "hts_io/HtsFile.h"
#include "hts_io/HtsReader.h"
#include "hts_utils/bam_utils.h"
#include "hts_utils/hts_types.h"
#include "splitter/ChopLoop.h"
#include "splitter/RecordChopper.h"
#include "splitter/SplitConfig.h"
#include "utils/log_utils.h"
#include "utils/tty_utils.h"

#include <argparse/argparse.hpp>
#include <htslib/sam.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace bamchop {

int chop(int argc, char* argv[]) {
    argparse::ArgumentParser parser("bamchop", BAMCHOP_VERSION, argparse::default_arguments::help);
    parser.add_description("Split aligned reads into fixed-length chunks with consistent alignments.");
    parser.add_argument("-i", "--input")
            .help("Input SAM/BAM/CRAM file. Use - to read from stdin.")
            .required();
    parser.add_argument("-r", "--reference")
            .help("FASTA reference used to decode CRAM input and encode CRAM output.");
    parser.add_argument("-o", "--output")
            .help("Output file. Use - to write to stdout.")
            .required();
    parser.add_argument("-s", "--chunk-size")
            .help("Maximum number of read bases in each chunk.")
            .required()
            .scan<'i', int>();
    parser.add_argument("--min-length")
            .help("Drop the last chunk of a read if it is shorter than this.")
            .default_value(0)
            .scan<'i', int>();
    parser.add_argument("-g", "--read-group")
            .help("Read group ID written to the RG tag of every chunk.");
    parser.add_argument("-n", "--sample-name")
            .help("Sample name for the new @RG header line. Requires --read-group.");
    parser.add_argument("--skip-clipped-bases")
            .help("Remove leading and trailing clipped bases before chunking.")
            .default_value(false)
            .implicit_value(true);
    parser.add_argument("--output-format")
            .help("One of bam, ubam, sam or cram. Inferred from the output file name by default.");
    parser.add_argument("-t", "--threads")
            .help("Number of htslib compression/decompression threads.")
            .default_value(0)
            .scan<'i', int>();
    int verbosity = 0;
    parser.add_argument("-v", "--verbose")
            .default_value(false)
            .implicit_value(true)
            .nargs(0)
            .action([&](const auto&) { ++verbosity; })
            .append();

    try {
        parser.parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::ostringstream parser_stream;
        parser_stream << parser;
        spdlog::error("{}\n{}", e.what(), parser_stream.str());
        return EXIT_FAILURE;
    }

    if (parser.get<bool>("--verbose")) {
        utils::SetVerboseLogging(static_cast<utils::VerboseLogLevel>(verbosity));
    }

    const auto chunk_size = parser.get<int>("--chunk-size");
    if (chunk_size <= 0) {
        spdlog::error("--chunk-size must be a positive integer, got {}.", chunk_size);
        return EXIT_FAILURE;
    }
    const auto min_length = parser.get<int>("--min-length");
    if (min_length < 0) {
        spdlog::error("--min-length must not be negative, got {}.", min_length);
        return EXIT_FAILURE;
    }
    const auto threads = parser.get<int>("--threads");
    if (threads < 0) {
        spdlog::error("--threads must not be negative, got {}.", threads);
        return EXIT_FAILURE;
    }

    const auto input = parser.get<std::string>("--input");
    const auto output = parser.get<std::string>("--output");
    const auto reference = cli::get_optional_argument<std::string>("--reference", parser);
    const auto sample_name = cli::get_optional_argument<std::string>("--sample-name", parser);

    splitter::SplitConfig config;
    config.chunk_size = static_cast<uint32_t>(chunk_size);
    config.min_length = static_cast<uint32_t>(min_length);
    config.read_group = cli::get_optional_argument<std::string>("--read-group", parser);
    config.skip_clipped_bases = parser.get<bool>("--skip-clipped-bases");

    if (sample_name && !config.read_group) {
        spdlog::error("--sample-name can only be used together with --read-group.");
        return EXIT_FAILURE;
    }

    try {
        splitter::validate(config);
    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    auto output_mode = cli::infer_output_mode(output);
    if (parser.is_used("--output-format")) {
        const auto format = parser.get<std::string>("--output-format");
        const auto parsed_mode = cli::parse_output_format(format);
        if (!parsed_mode) {
            spdlog::error("Unknown output format '{}'. Choose from bam, ubam, sam or cram.", format);
            return EXIT_FAILURE;
        }
        output_mode = *parsed_mode;
    }
    if (output_mode == HtsFile::OutputMode::CRAM && !reference) {
        spdlog::error("CRAM output requires a reference, set one with --reference.");
        return EXIT_FAILURE;
    }

    if (input == "-" && utils::is_fd_tty(stdin)) {
        std::cout << parser << '\n';
        return EXIT_FAILURE;
    }

    spdlog::debug("> {}", splitter::to_string(config));
    spdlog::debug("> output {} as {}", output, to_string(output_mode));

    const auto start_time = std::chrono::steady_clock::now();
    std::vector<std::string> args(argv, argv + argc);

    try {
        HtsReader reader(input, reference, threads);
        auto header = SamHdrPtr(sam_hdr_dup(reader.header()));
        if (!header) {
            spdlog::error("Failed to copy the header of {}", input);
            return EXIT_FAILURE;
        }
        if (config.read_group) {
            const bool added = utils::add_rg_header(header.get(), *config.read_group, sample_name);
            if (!added && sample_name) {
                spdlog::warn("Read group {} is already in the input header, ignoring --sample-name.",
                             *config.read_group);
            }
        }
        cli::add_pg_hdr(header.get(), "bamchop", args);

        HtsFile hts_file(output, output_mode, threads, reference);
        hts_file.set_header(header.get());

        splitter::RecordChopper chopper(config);

        spdlog::info("> starting chunking of {} with chunk size {}", input, config.chunk_size);
        const size_t num_skipped = splitter::chop_records(reader, hts_file, chopper);

        hts_file.finalise();

        const auto& stats = chopper.stats();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
        spdlog::info("> records read: {}, records skipped: {}", reader.num_records_read(),
                     num_skipped);
        spdlog::info("> chunks written: {}, tail chunks dropped: {}, records without output: {}",
                     hts_file.num_records_written(), stats.tail_chunks_dropped,
                     stats.records_without_output);
        spdlog::info("> finished in {:.3f}s", elapsed.count() / 1000.0);
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

}  // namespace bamchop
