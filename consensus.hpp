#pragma once

#include <string>
#include <vector>

#include "pileup_parser.hpp"

const std::string NO_CALL = "N";

typedef struct {
	int min_coverage {10};
	double min_frequency {0.75};
} ConsensusSettings;

// a triggered filter and the value that triggered it, e.g. {"depth", "8"}
typedef struct {
	std::string name;
	std::string value;
} Filter;

typedef struct {
	std::string winner {NO_CALL};
	int allele_count {0};
	double frequency {0.0};
	double score {0.0};
	std::vector<Filter> filters;
	std::string final_call {NO_CALL};
	// majority allele before it was replaced by a no-call
	std::string original_guess {NO_CALL};
	std::string filter_summary {"PASS"};
} ConsensusResult;

/** Majority call of the reads at one position.
 *
 * Alleles are compared case-insensitively; equally frequent alleles
 * are ranked by byte order. Every read adds (or, if it disagrees with
 * the majority, subtracts) its base quality times its mapping quality
 * to the score. The call becomes a no-call when the depth, majority
 * frequency, strand balance or score filter triggers, and the filter
 * summary then lists every triggered filter followed by the original
 * guess.
 */
ConsensusResult findConsensus(const std::vector<ReadObservation>& reads,
	const std::string& base_qualities,
	const std::string& mapping_qualities,
	const ConsensusSettings& settings);

inline ConsensusResult findConsensus(const PileupLine& plp, const ConsensusSettings& settings) {
	return findConsensus(plp.reads, plp.base_qualities, plp.mapping_qualities, settings);
}

std::string formatDecimal(double value);
