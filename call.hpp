#pragma once

#include <cstdio>
#include <iostream>
#include <string>

#include "consensus.hpp"
#include "reference.hpp"

typedef struct {
	ConsensusSettings consensus;
	bool variants_only {false};
	// log and count malformed lines instead of stopping
	bool skip_malformed {false};
	bool debug {false};
	int num_threads {1};
	long progress_interval {100000};
	long debug_limit {10000};
} CallSettings;

typedef struct {
	long positions {0};
	long reported {0};
	long skipped {0};
	bool stopped_early {false};
} CallSummary;

/** Call one pileup line.
 *
 * Returns the VCF record line without newline, or an empty string if
 * the record is suppressed. Throws MalformedLine or DecodeError.
 */
std::string callPosition(char* line, const ReferenceGenome* reference, const CallSettings& settings);

/** Call every line of `input` and write the records to `out`.
 *
 * With more than one thread, lines are processed in batches by an
 * OpenMP team. Records are written in input order, but callers must not
 * rely on the order of records in that mode.
 */
CallSummary callPositions(FILE* input, std::ostream& out, const ReferenceGenome* reference, const CallSettings& settings);
