#include <algorithm>
#include <cctype>
#include <ctime>

#include "vcf.hpp"

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return char(std::toupper(c)); });
    return s;
}

OutputRecord makeOutputRecord(const PileupLine& plp, const ConsensusResult& consensus, const ReferenceGenome* reference) {
    std::string reference_base = ".";
    if (reference != nullptr) {
        char base = reference->lookup(plp.contig, plp.position);
        if (base != NO_REFERENCE_BASE) {
            reference_base = std::string(1, char(std::toupper(static_cast<unsigned char>(base))));
        }
    }
    return {
        plp.contig,
        plp.position,
        plp.contig + ":" + std::to_string(plp.position),
        reference_base,
        upper(consensus.final_call),
        consensus.score,
        consensus.filter_summary,
        "DP=" + std::to_string(plp.depth) + ";AC=" + std::to_string(consensus.allele_count)
    };
}

bool isReported(const OutputRecord& record, bool variants_only) {
    if (!variants_only) {
        return true;
    }
    const std::string reference_base = upper(record.reference_base);
    const std::string alt = upper(record.alt);
    return !(reference_base == alt || alt == NO_CALL || reference_base == NO_CALL);
}

void printVcfHeader(std::ostream& out, const std::string& source, const std::string& date, const std::string& reference_path) {
    out << "##fileformat=VCFv4.2" << '\n';
    out << "##fileDate=" << date << '\n';
    out << "##source=" << source << '\n';
    out << "##INFO=<ID=DP,Number=1,Type=Integer,Description=\"Total Depth\">" << '\n';
    out << "##INFO=<ID=AC,Number=1,Type=Integer,Description=\"allele count in genotypes, "
           "for each ALT allele, in the same order as listed\">" << '\n';
    if (!reference_path.empty()) {
        out << "##reference=" << reference_path << '\n';
    }
    out << "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO" << '\n';
}

std::string vcfDate() {
    std::time_t now = std::time(nullptr);
    std::tm local {};
    localtime_r(&now, &local);
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y%m%d", &local);
    return buffer;
}
