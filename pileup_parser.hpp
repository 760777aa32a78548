#pragma once

#include <string>
#include <vector>

#include "reference.hpp"

enum class Strand {Forward, Reverse, Unknown};

/** One read at a pileup position.
 *
 * The token is normally a single base, but an insertion is kept as its
 * whole inserted literal and a deletion as a run of '*' of the deleted
 * length.
 */
typedef struct {
	std::string token;
	Strand strand {Strand::Unknown};
} ReadObservation;

typedef struct {
	std::string contig;
	long position {-1};
	char reference_hint {'N'};
	int depth {0};
	std::string read_bases;
	std::string base_qualities;
	std::string mapping_qualities;
	// one entry per read, in the order of the quality strings
	std::vector<ReadObservation> reads;
} PileupLine;

/** Parse one line of `samtools mpileup -s` output.
 *
 * `reference` may be null when no reference was loaded; read bases
 * matching the reference ('.' and ',') then decode to '.'.
 * Throws MalformedLine or DecodeError.
 */
PileupLine parsePileupLine(char* line, const ReferenceGenome* reference);

std::vector<ReadObservation> parseReadBases(const char* read_bases, char reference, int depth);

std::vector<int> parseQualities(const std::string& qualities);
