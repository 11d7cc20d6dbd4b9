#include "splitter/ChopLoop.h"

#include "hts_io/HtsFile.h"
#include "hts_io/HtsReader.h"
#include "hts_utils/bam_utils.h"
#include "splitter/RecordChopper.h"
#include "splitter/RecordSplitter.h"
#include "utils/PostCondition.h"

#include <spdlog/spdlog.h>

#include <vector>

namespace bamchop::splitter {

namespace {

constexpr size_t PROGRESS_INTERVAL = 100000;

}  // namespace

size_t chop_records(HtsReader& reader, HtsFile& writer, RecordChopper& chopper) {
    size_t num_skipped = 0;
    while (reader.read()) {
        auto report_progress = utils::PostCondition([&reader] {
            if (reader.num_records_read() % PROGRESS_INTERVAL == 0) {
                spdlog::debug("> processed {} records", reader.num_records_read());
            }
        });

        std::vector<BamPtr> chunks;
        try {
            chunks = chopper.chop(reader.record.get());
        } catch (const MalformedRecordError& e) {
            spdlog::warn("Skipping read {}: {}", utils::get_read_name(reader.record.get()),
                         e.what());
            ++num_skipped;
            continue;
        }
        for (const auto& chunk : chunks) {
            writer.write(chunk.get());
        }
    }
    return num_skipped;
}

}  // namespace bamchop::splitter
