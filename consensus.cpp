#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <map>

#include "consensus.hpp"
#include "errors.hpp"

// a strand holding less than a tenth of the majority's reads is suspicious
const int MIN_STRAND_SHARE_DIVISOR = 10;

static std::string upper(std::string token) {
	std::transform(token.begin(), token.end(), token.begin(),
		[](unsigned char c) { return char(std::toupper(c)); });
	return token;
}

std::string formatDecimal(double value) {
	char buffer[64];
	snprintf(buffer, sizeof(buffer), "%0.2f", value);
	return buffer;
}

// rounds exactly like the printed value, so 0.625 becomes 0.62
static double roundDecimal(double value) {
	return std::strtod(formatDecimal(value).c_str(), nullptr);
}

ConsensusResult findConsensus(const std::vector<ReadObservation>& reads,
		const std::string& base_qualities,
		const std::string& mapping_qualities,
		const ConsensusSettings& settings) {
	if (base_qualities.size() != reads.size() || mapping_qualities.size() != reads.size()) {
		throw MalformedLine {"Quality strings do not match the number of reads"};
	}
	const int depth = int(reads.size());
	ConsensusResult result;

	// std::map iterates in byte order, so the first of equally frequent alleles wins
	std::map<std::string, int> counts;
	for (const auto& read : reads) {
		++counts[upper(read.token)];
	}
	for (const auto& count : counts) {
		if (count.second > result.allele_count) {
			result.winner = count.first;
			result.allele_count = count.second;
		}
	}
	result.original_guess = result.winner;
	std::string call = result.winner;

	if (depth < settings.min_coverage) {
		result.filters.push_back({"depth", std::to_string(depth)});
	}

	if (depth > 0) {
		result.frequency = roundDecimal(double(result.allele_count) / depth);
	}
	if (result.frequency < settings.min_frequency) {
		result.filters.push_back({"freq", formatDecimal(result.frequency)});
	}

	// strands of the reads agreeing with the majority; deletions have none
	int forward = 0;
	int reverse = 0;
	for (const auto& read : reads) {
		if (upper(read.token) != result.winner) {
			continue;
		}
		if (read.strand == Strand::Forward) {
			++forward;
		} else if (read.strand == Strand::Reverse) {
			++reverse;
		}
	}
	const int stranded = forward + reverse;
	if (stranded > 0 && (forward * MIN_STRAND_SHARE_DIVISOR < stranded
			|| reverse * MIN_STRAND_SHARE_DIVISOR < stranded)) {
		result.filters.push_back({"forwardReads", std::to_string(forward)});
		result.filters.push_back({"reverseReads", std::to_string(reverse)});
	}

	auto qualities = parseQualities(base_qualities);
	auto mapping = parseQualities(mapping_qualities);
	double score = 0;
	for (size_t i = 0; i < reads.size(); ++i) {
		double weight = double(qualities[i]) * mapping[i];
		if (upper(reads[i].token) == result.winner) {
			score += weight;
		} else {
			score -= weight;
		}
	}
	result.score = roundDecimal(score);
	if (result.score < 0) {
		result.filters.push_back({"score", formatDecimal(result.score)});
		call = NO_CALL;
	}

	if (result.filters.empty()) {
		result.filter_summary = "PASS";
		result.final_call = call;
	} else {
		result.filter_summary.clear();
		for (const auto& filter : result.filters) {
			result.filter_summary += filter.name + ":" + filter.value + ";";
		}
		result.filter_summary += "ifIHadToGuess:" + result.original_guess;
		result.final_call = NO_CALL;
	}
	return result;
}
