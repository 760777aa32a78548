#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "consensus.hpp"
#include "errors.hpp"
#include "pileup_parser.hpp"

// the same quality character for base and mapping quality of every read
static ConsensusResult callColumn(const char* read_bases, char reference, int depth,
		const ConsensusSettings& settings = ConsensusSettings {}, char quality = '5') {
	auto reads = parseReadBases(read_bases, reference, depth);
	std::string qualities(depth, quality);
	return findConsensus(reads, qualities, qualities, settings);
}

TEST_CASE("Consensus of matching reads", "[findConsensus]") {
	SECTION("below minimum coverage") {
		auto result = callColumn("....,,,,", 'A', 8);
		REQUIRE(result.winner == "A");
		REQUIRE(result.original_guess == "A");
		REQUIRE(result.allele_count == 8);
		REQUIRE(result.frequency == Approx(1.0));
		REQUIRE(result.score == Approx(3200.0));
		REQUIRE(result.filters.size() == 1);
		REQUIRE(result.filters[0].name == "depth");
		REQUIRE(result.filters[0].value == "8");
		REQUIRE(result.final_call == "N");
		REQUIRE(result.filter_summary == "depth:8;ifIHadToGuess:A");
	}
	SECTION("enough coverage passes") {
		auto result = callColumn("......,,,,,,", 'A', 12);
		REQUIRE(result.filters.empty());
		REQUIRE(result.filter_summary == "PASS");
		REQUIRE(result.final_call == "A");
		REQUIRE(result.allele_count == 12);
		REQUIRE(result.score == Approx(3600.0));
	}
	SECTION("forward and reverse reads are one allele") {
		auto result = callColumn("AAAAAaaaaa", 'N', 10);
		REQUIRE(result.allele_count == 10);
		REQUIRE(result.final_call == "A");
	}
}

TEST_CASE("Insertions are counted as their own allele", "[findConsensus]") {
	auto result = callColumn("..+2AT...", 'a', 6);
	REQUIRE(result.winner == "A");
	REQUIRE(result.allele_count == 5);
	REQUIRE(result.frequency == Approx(0.83));
	REQUIRE(result.score == Approx(1600.0));
	REQUIRE(result.filter_summary == "depth:6;forwardReads:5;reverseReads:0;ifIHadToGuess:A");
	REQUIRE(result.final_call == "N");
}

TEST_CASE("Strand balance", "[findConsensus]") {
	SECTION("a tenth of the reads on one strand is enough") {
		auto result = callColumn(".........,", 'C', 10);
		REQUIRE(result.filter_summary == "PASS");
		REQUIRE(result.final_call == "C");
	}
	SECTION("less than a tenth is not") {
		auto result = callColumn("...................,", 'C', 20);
		REQUIRE(result.filter_summary == "forwardReads:19;reverseReads:1;ifIHadToGuess:C");
		REQUIRE(result.final_call == "N");
	}
	SECTION("only reads agreeing with the majority count") {
		auto result = callColumn("..........ttt", 'C', 13, ConsensusSettings {10, 0.5});
		REQUIRE(result.filter_summary == "forwardReads:10;reverseReads:0;ifIHadToGuess:C");
	}
	SECTION("deletions have no strand") {
		auto result = callColumn("***", 'A', 3, ConsensusSettings {0, 0.5});
		REQUIRE(result.filter_summary == "PASS");
		REQUIRE(result.final_call == "*");
	}
}

TEST_CASE("Negative scores force a no-call", "[findConsensus]") {
	// two agreeing reads of weight 1 against one disagreeing read of weight 40 * 40
	auto reads = parseReadBases("AaC", 'N', 3);
	auto result = findConsensus(reads, "\"\"I", "\"\"I", ConsensusSettings {0, 0.5});
	REQUIRE(result.winner == "A");
	REQUIRE(result.frequency == Approx(0.67));
	REQUIRE(result.score == Approx(-1598.0));
	REQUIRE(result.filter_summary == "score:-1598.00;ifIHadToGuess:A");
	REQUIRE(result.final_call == "N");
}

TEST_CASE("Low majority frequency", "[findConsensus]") {
	auto result = callColumn("AAAAAACCCCgg", 'N', 12);
	REQUIRE(result.winner == "A");
	REQUIRE(result.frequency == Approx(0.5));
	REQUIRE(result.filter_summary == "freq:0.50;forwardReads:6;reverseReads:0;ifIHadToGuess:A");
}

TEST_CASE("Frequency is rounded like its printed value", "[findConsensus]") {
	// 5/8 = 0.625 is exact in binary and rounds to even
	auto result = callColumn("AAAAACCC", 'N', 8, ConsensusSettings {0, 0.63});
	REQUIRE(result.frequency == Approx(0.62));
	REQUIRE(result.filter_summary == "freq:0.62;forwardReads:5;reverseReads:0;ifIHadToGuess:A");

	auto passing = callColumn("AAAAACCC", 'N', 8, ConsensusSettings {0, 0.62});
	REQUIRE(passing.filter_summary == "forwardReads:5;reverseReads:0;ifIHadToGuess:A");
}

TEST_CASE("Uncovered position", "[findConsensus]") {
	auto result = findConsensus(std::vector<ReadObservation> {}, "", "", ConsensusSettings {});
	REQUIRE(result.frequency == 0.0);
	REQUIRE(result.score == 0.0);
	REQUIRE(result.allele_count == 0);
	REQUIRE(result.final_call == "N");
	REQUIRE(result.filter_summary == "depth:0;freq:0.00;ifIHadToGuess:N");
}

TEST_CASE("Ties are broken by byte order", "[findConsensus]") {
	ConsensusSettings lenient {0, 0.0};
	REQUIRE(callColumn("TA", 'N', 2, lenient).winner == "A");
	REQUIRE(callColumn("gC", 'N', 2, lenient).winner == "C");
	REQUIRE(callColumn("A*", 'N', 2, lenient).winner == "*");
	REQUIRE(callColumn("+2GG+1T", 'N', 2, lenient).winner == "GG");
}

TEST_CASE("Consensus is a pure function", "[findConsensus]") {
	auto reads = parseReadBases("^].,,aG+2ca-1t$", 'c', 7);
	const std::string qualities = "5I+?!#D";
	const std::string mapping = "I5?+D#!";
	auto first = findConsensus(reads, qualities, mapping, ConsensusSettings {});
	auto second = findConsensus(reads, qualities, mapping, ConsensusSettings {});
	REQUIRE(first.winner == second.winner);
	REQUIRE(first.allele_count == second.allele_count);
	REQUIRE(first.frequency == second.frequency);
	REQUIRE(first.score == second.score);
	REQUIRE(first.final_call == second.final_call);
	REQUIRE(first.filter_summary == second.filter_summary);
}

TEST_CASE("Quality strings must match the reads", "[findConsensus]") {
	auto reads = parseReadBases("AA", 'N', 2);
	REQUIRE_THROWS_AS(findConsensus(reads, "5", "55", ConsensusSettings {}), MalformedLine);
	REQUIRE_THROWS_AS(findConsensus(reads, "55", "555", ConsensusSettings {}), MalformedLine);
}

TEST_CASE("Decimal formatting", "[formatDecimal]") {
	REQUIRE(formatDecimal(3600) == "3600.00");
	REQUIRE(formatDecimal(0.5) == "0.50");
	REQUIRE(formatDecimal(-1598) == "-1598.00");
	REQUIRE(formatDecimal(0.625) == "0.62");
	REQUIRE(formatDecimal(0.375) == "0.38");
}
