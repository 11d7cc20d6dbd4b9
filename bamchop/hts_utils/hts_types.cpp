#include "hts_utils/hts_types.h"

#include <htslib/sam.h>
#include <spdlog/spdlog.h>

namespace bamchop {

void BamDestructor::operator()(bam1_t* bam) { bam_destroy1(bam); }

void SamHdrDestructor::operator()(sam_hdr_t* hdr) { sam_hdr_destroy(hdr); }

void HtsFileDestructor::operator()(htsFile* hts_file) {
    if (hts_file) {
        // Output files are closed by HtsFile::finalise().
        if (hts_close(hts_file) < 0) {
            spdlog::debug("hts_close failed while releasing an htsFile");
        }
    }
}

}  // namespace bamchop
