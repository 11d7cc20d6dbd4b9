#include "TestUtils.h"
#include "hts_utils/bam_utils.h"
#include "splitter/RecordChopper.h"
#include "splitter/SplitConfig.h"

#include <catch2/catch_test_macros.hpp>
#include <htslib/sam.h>

#include <stdexcept>
#include <string>

#define TEST_GROUP "[record_chopper]"

using namespace bamchop;
using namespace bamchop::splitter;

CATCH_TEST_CASE("RecordChopper: minimum length drops the tail", TEST_GROUP) {
    const SplitConfig config{.chunk_size = 4, .min_length = 3};
    const auto record = make_record({.name = "r", .seq = "ACGTACGTAC", .cigar = "10M"});

    const auto chunks = chop_record(record.get(), config);
    CATCH_REQUIRE(chunks.size() == 2);
    CATCH_CHECK(utils::get_read_name(chunks[0].get()) == "r_0");
    CATCH_CHECK(utils::get_read_name(chunks[1].get()) == "r_1");
}

CATCH_TEST_CASE("RecordChopper: tail at the minimum length is kept", TEST_GROUP) {
    const SplitConfig config{.chunk_size = 4, .min_length = 2};
    const auto record = make_record({.name = "r", .seq = "ACGTACGTAC", .cigar = "10M"});

    const auto chunks = chop_record(record.get(), config);
    CATCH_REQUIRE(chunks.size() == 3);
    CATCH_CHECK(chunks[2]->core.l_qseq == 2);
}

CATCH_TEST_CASE("RecordChopper: short read with minimum length", TEST_GROUP) {
    const SplitConfig config{.chunk_size = 4, .min_length = 3};
    const auto record = make_record({.seq = "AC", .cigar = "2M"});
    CATCH_CHECK(chop_record(record.get(), config).empty());
}

CATCH_TEST_CASE("RecordChopper: invalid configuration", TEST_GROUP) {
    const auto record = make_record({.seq = "ACGT", .cigar = "4M"});
    CATCH_CHECK_THROWS_AS(chop_record(record.get(), SplitConfig{}), std::invalid_argument);
    CATCH_CHECK_THROWS_AS(RecordChopper(SplitConfig{}), std::invalid_argument);
}

CATCH_TEST_CASE("RecordChopper: statistics", TEST_GROUP) {
    RecordChopper chopper(SplitConfig{.chunk_size = 4, .min_length = 3});

    const auto ten = make_record({.name = "ten", .seq = "ACGTACGTAC", .cigar = "10M"});
    const auto eight = make_record({.name = "eight", .seq = "ACGTACGT", .cigar = "8M"});
    const auto two = make_record({.name = "two", .seq = "AC", .cigar = "2M"});

    CATCH_CHECK(chopper.chop(ten.get()).size() == 2);
    CATCH_CHECK(chopper.chop(eight.get()).size() == 2);
    CATCH_CHECK(chopper.chop(two.get()).empty());

    const auto& stats = chopper.stats();
    CATCH_CHECK(stats.records_chopped == 3);
    CATCH_CHECK(stats.chunks_emitted == 4);
    CATCH_CHECK(stats.tail_chunks_dropped == 2);
    CATCH_CHECK(stats.records_without_output == 1);
}

CATCH_TEST_CASE("RecordChopper: malformed record leaves statistics unchanged", TEST_GROUP) {
    RecordChopper chopper(SplitConfig{.chunk_size = 4});
    const auto record = make_record({.seq = "", .cigar = "4M"});
    CATCH_CHECK_THROWS_AS(chopper.chop(record.get()), MalformedRecordError);
    CATCH_CHECK(chopper.stats().records_chopped == 0);
}

CATCH_TEST_CASE("RecordChopper: to_string", TEST_GROUP) {
    const SplitConfig config{.chunk_size = 4, .min_length = 3, .read_group = "rg"};
    CATCH_CHECK(to_string(config) ==
                "{ chunk_size:4, min_length:3, read_group:'rg', skip_clipped_bases:false }");
}
