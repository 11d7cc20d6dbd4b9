#include "splitter/CigarWalker.h"
#include "utils/cigar.h"

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#define TEST_GROUP "[cigar_walker]"

using namespace bamchop;
using namespace bamchop::splitter;

namespace {

std::string window_cigar(const std::string& cigar, uint32_t start, uint32_t end) {
    return serialize_cigar(walk_cigar_window(parse_cigar_from_string(cigar), start, end).ops);
}

}  // namespace

CATCH_TEST_CASE("CigarWalker: plain match", TEST_GROUP) {
    const auto cigar = parse_cigar_from_string("10M");

    const auto first = walk_cigar_window(cigar, 0, 4);
    CATCH_CHECK(serialize_cigar(first.ops) == "4M");
    CATCH_CHECK(first.ref_before == 0);
    CATCH_CHECK(first.ref_span == 4);

    const auto last = walk_cigar_window(cigar, 8, 10);
    CATCH_CHECK(serialize_cigar(last.ops) == "2M");
    CATCH_CHECK(last.ref_before == 8);
    CATCH_CHECK(last.ref_span == 2);
}

CATCH_TEST_CASE("CigarWalker: deletion on a window boundary", TEST_GROUP) {
    const auto cigar = parse_cigar_from_string("4M2D4M");

    const auto first = walk_cigar_window(cigar, 0, 4);
    CATCH_CHECK(serialize_cigar(first.ops) == "4M2D");
    CATCH_CHECK(first.ref_before == 0);
    CATCH_CHECK(first.ref_span == 6);

    const auto second = walk_cigar_window(cigar, 4, 8);
    CATCH_CHECK(serialize_cigar(second.ops) == "4M");
    CATCH_CHECK(second.ref_before == 6);
    CATCH_CHECK(second.ref_span == 4);
}

CATCH_TEST_CASE("CigarWalker: insertion spanning a window boundary", TEST_GROUP) {
    const std::string cigar{"4M4I4M"};
    CATCH_CHECK(window_cigar(cigar, 0, 6) == "4M2I");
    CATCH_CHECK(window_cigar(cigar, 6, 12) == "2I4M");

    const auto second = walk_cigar_window(parse_cigar_from_string(cigar), 6, 12);
    CATCH_CHECK(second.ref_before == 4);
    CATCH_CHECK(second.ref_span == 4);
}

CATCH_TEST_CASE("CigarWalker: reference skip inside a window", TEST_GROUP) {
    const auto cigar = parse_cigar_from_string("3M1000N3M");
    const auto window = walk_cigar_window(cigar, 0, 6);
    CATCH_CHECK(serialize_cigar(window.ops) == "3M1000N3M");
    CATCH_CHECK(window.ref_span == 1006);

    const auto tail = walk_cigar_window(cigar, 4, 6);
    CATCH_CHECK(serialize_cigar(tail.ops) == "2M");
    CATCH_CHECK(tail.ref_before == 1004);
}

CATCH_TEST_CASE("CigarWalker: clips stay with the window that holds them", TEST_GROUP) {
    const std::string cigar{"2H3S5M3S2H"};

    CATCH_SECTION("leading clips") {
        const auto window = walk_cigar_window(parse_cigar_from_string(cigar), 0, 4);
        CATCH_CHECK(serialize_cigar(window.ops) == "2H3S1M");
        CATCH_CHECK(window.ref_before == 0);
        CATCH_CHECK(window.ref_span == 1);
    }

    CATCH_SECTION("trailing clips") {
        const auto window = walk_cigar_window(parse_cigar_from_string(cigar), 4, 11);
        CATCH_CHECK(serialize_cigar(window.ops) == "4M3S2H");
        CATCH_CHECK(window.ref_before == 1);
        CATCH_CHECK(window.ref_span == 4);
    }
}

CATCH_TEST_CASE("CigarWalker: leading deletion belongs to the first window", TEST_GROUP) {
    const std::string cigar{"2D6M"};
    CATCH_CHECK(window_cigar(cigar, 0, 3) == "2D3M");
    const auto second = walk_cigar_window(parse_cigar_from_string(cigar), 3, 6);
    CATCH_CHECK(serialize_cigar(second.ops) == "3M");
    CATCH_CHECK(second.ref_before == 5);
}

CATCH_TEST_CASE("CigarWalker: trailing deletion is dropped", TEST_GROUP) {
    const auto window = walk_cigar_window(parse_cigar_from_string("6M3D"), 3, 6);
    CATCH_CHECK(serialize_cigar(window.ops) == "3M");
    CATCH_CHECK(window.ref_span == 3);
}

CATCH_TEST_CASE("CigarWalker: mixed ops", TEST_GROUP) {
    // 4M5D2M4I3S has 13 read bases and 11 reference bases.
    const std::string cigar{"4M5D2M4I3S"};
    CATCH_CHECK(window_cigar(cigar, 0, 4) == "4M5D");
    CATCH_CHECK(window_cigar(cigar, 4, 8) == "2M2I");
    CATCH_CHECK(window_cigar(cigar, 8, 12) == "2I2S");
    CATCH_CHECK(window_cigar(cigar, 12, 13) == "1S");

    const auto ops = parse_cigar_from_string(cigar);
    CATCH_CHECK(walk_cigar_window(ops, 4, 8).ref_before == 9);
    CATCH_CHECK(walk_cigar_window(ops, 8, 12).ref_before == 11);
    CATCH_CHECK(walk_cigar_window(ops, 8, 12).ref_span == 0);
}

CATCH_TEST_CASE("CigarWalker: windows tile the alignment", TEST_GROUP) {
    const auto cigar = parse_cigar_from_string("5S3M2I4M1D6M3N2X1I4=2S");
    const uint32_t read_length = query_length(cigar);
    const uint32_t ref_length = reference_length(cigar);

    for (uint32_t chunk_size : {1u, 2u, 3u, 5u, 7u, read_length}) {
        CATCH_CAPTURE(chunk_size);
        uint32_t total_query = 0;
        uint32_t total_ref = 0;
        for (uint32_t start = 0; start < read_length; start += chunk_size) {
            const uint32_t end = std::min(start + chunk_size, read_length);
            const auto window = walk_cigar_window(cigar, start, end);
            CATCH_CHECK(query_length(window.ops) == end - start);
            CATCH_CHECK(reference_length(window.ops) == window.ref_span);
            CATCH_CHECK(window.ref_before == total_ref);
            total_query += query_length(window.ops);
            total_ref += window.ref_span;
        }
        CATCH_CHECK(total_query == read_length);
        CATCH_CHECK(total_ref == ref_length);
    }
}

CATCH_TEST_CASE("CigarWalker: merged windows reproduce the CIGAR", TEST_GROUP) {
    const auto merge = [](const std::vector<CigarOp>& ops) {
        std::vector<CigarOp> merged;
        for (const auto& op : ops) {
            if (!merged.empty() && merged.back().op == op.op) {
                merged.back().len += op.len;
            } else {
                merged.push_back(op);
            }
        }
        return merged;
    };

    const auto cigar = parse_cigar_from_string("2H3S4M1D3M2I5M4N2M1S1H");
    const uint32_t read_length = query_length(cigar);
    for (uint32_t chunk_size : {1u, 3u, 4u, 6u}) {
        CATCH_CAPTURE(chunk_size);
        std::vector<CigarOp> joined;
        for (uint32_t start = 0; start < read_length; start += chunk_size) {
            const auto window =
                    walk_cigar_window(cigar, start, std::min(start + chunk_size, read_length));
            joined.insert(joined.end(), window.ops.begin(), window.ops.end());
        }
        CATCH_CHECK(merge(joined) == cigar);
    }

    // A trailing deletion has no read base after it and is not reproduced.
    const auto with_deletion = parse_cigar_from_string("6M3D");
    std::vector<CigarOp> joined;
    for (uint32_t start = 0; start < 6; start += 3) {
        const auto window = walk_cigar_window(with_deletion, start, start + 3);
        joined.insert(joined.end(), window.ops.begin(), window.ops.end());
    }
    CATCH_CHECK(serialize_cigar(merge(joined)) == "6M");
}

CATCH_TEST_CASE("CigarWalker: whole read reproduces the CIGAR", TEST_GROUP) {
    const std::string cigar{"3H2S4M1D3M2I5M4N2M1S"};
    const auto ops = parse_cigar_from_string(cigar);
    CATCH_CHECK(window_cigar(cigar, 0, query_length(ops)) == cigar);
}

CATCH_TEST_CASE("CigarWalker: zero length ops are ignored", TEST_GROUP) {
    CATCH_CHECK(window_cigar("0M4M0D4M", 0, 8) == "4M4M");
    CATCH_CHECK(walk_cigar_window(parse_cigar_from_string("4M0D4M"), 4, 8).ref_before == 4);
}

CATCH_TEST_CASE("CigarWalker: invalid window", TEST_GROUP) {
    const auto cigar = parse_cigar_from_string("10M");
    CATCH_CHECK_THROWS_AS(walk_cigar_window(cigar, 5, 4), std::logic_error);
    CATCH_CHECK_THROWS_AS(walk_cigar_window(cigar, 8, 11), std::logic_error);
    CATCH_CHECK_NOTHROW(walk_cigar_window(cigar, 10, 10));
}
