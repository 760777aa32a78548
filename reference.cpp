#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

#include <unistd.h>

#include <htslib/faidx.h>

#include "errors.hpp"
#include "reference.hpp"

ReferenceGenome::ReferenceGenome(std::unordered_map<std::string, std::string> sequences)
    : sequences_ {std::move(sequences)} {}

char ReferenceGenome::lookup(const std::string& contig, long position) const {
    auto it = sequences_.find(contig);
    if (it == sequences_.end() || position < 1 || position > (long)it->second.size()) {
        return NO_REFERENCE_BASE;
    }
    return it->second[position - 1];
}

ReferenceGenome loadReference(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        throw ReferenceMissing {"Could not locate the reference " + path};
    }

    std::unique_ptr<faidx_t, decltype(&fai_destroy)> fai {fai_load(path.c_str()), &fai_destroy};
    if (!fai) {
        throw std::runtime_error {"Could not open or index the reference " + path};
    }

    std::unordered_map<std::string, std::string> sequences;
    int num_sequences = faidx_nseq(fai.get());
    for (int i = 0; i < num_sequences; ++i) {
        const char* name = faidx_iseq(fai.get(), i);
        hts_pos_t length = faidx_seq_len64(fai.get(), name);
        if (length <= 0) {
            sequences.emplace(name, std::string {});
            continue;
        }
        hts_pos_t fetched = 0;
        char* seq = faidx_fetch_seq64(fai.get(), name, 0, length - 1, &fetched);
        if (seq == nullptr || fetched < 0) {
            free(seq);
            throw std::runtime_error {"Could not read sequence " + std::string {name} + " from " + path};
        }
        sequences.emplace(name, std::string(seq, fetched));
        free(seq);
    }

    std::cerr << "# Loaded " << sequences.size() << " reference sequences from " << path << std::endl;
    return ReferenceGenome {std::move(sequences)};
}
