#pragma once

#include <iostream>
#include <string>

#include "consensus.hpp"
#include "pileup_parser.hpp"
#include "reference.hpp"

typedef struct {
	std::string contig;
	long position;
	std::string id;
	std::string reference_base;
	std::string alt;
	double qual;
	std::string filter;
	std::string info;
} OutputRecord;

inline std::ostream& operator<<(std::ostream& os, const OutputRecord& r) {
	os << r.contig;
	os << '\t' << r.position;
	os << '\t' << r.id;
	os << '\t' << r.reference_base;
	os << '\t' << r.alt;
	os << '\t' << formatDecimal(r.qual);
	os << '\t' << r.filter;
	os << '\t' << r.info;
	return os;
}

OutputRecord makeOutputRecord(const PileupLine& plp, const ConsensusResult& consensus, const ReferenceGenome* reference);

// false if `variants_only` is set and the record is not a confident variant
bool isReported(const OutputRecord& record, bool variants_only);

void printVcfHeader(std::ostream& out, const std::string& source, const std::string& date, const std::string& reference_path);

// today's date as YYYYMMDD
std::string vcfDate();
