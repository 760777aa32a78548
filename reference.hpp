#pragma once

#include <string>
#include <unordered_map>

// returned by lookup() for unknown contigs and positions outside a contig
const char NO_REFERENCE_BASE = '\0';

/** Reference sequences addressed with the 1-based coordinates used by
 * `samtools mpileup`.
 *
 * Immutable once built, so a single instance can be shared by all
 * worker threads.
 */
class ReferenceGenome {
public:
    ReferenceGenome() = default;
    explicit ReferenceGenome(std::unordered_map<std::string, std::string> sequences);

    /** Base at 1-based `position` of `contig`, or NO_REFERENCE_BASE. */
    char lookup(const std::string& contig, long position) const;

    size_t size() const { return sequences_.size(); }

private:
    std::unordered_map<std::string, std::string> sequences_;
};

/** Read all sequences of a FASTA file.
 *
 * Throws ReferenceMissing if `path` is not a readable file. The file
 * is opened through its faidx index, which is built next to it when
 * missing.
 */
ReferenceGenome loadReference(const std::string& path);
