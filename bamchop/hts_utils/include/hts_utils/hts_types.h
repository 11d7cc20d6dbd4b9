#pragma once

#include <memory>

struct bam1_t;
struct sam_hdr_t;
struct htsFile;

namespace bamchop {

struct BamDestructor {
    void operator()(bam1_t*);
};
using BamPtr = std::unique_ptr<bam1_t, BamDestructor>;

struct SamHdrDestructor {
    void operator()(sam_hdr_t*);
};
using SamHdrPtr = std::unique_ptr<sam_hdr_t, SamHdrDestructor>;

struct HtsFileDestructor {
    void operator()(htsFile*);
};
using HtsFilePtr = std::unique_ptr<htsFile, HtsFileDestructor>;

}  // namespace bamchop
