#include <catch2/catch.hpp>

#include <cstdio>
#include <fstream>
#include <string>
#include <unordered_map>

#include "errors.hpp"
#include "reference.hpp"

TEST_CASE("Reference lookup", "[ReferenceGenome]") {
	std::unordered_map<std::string, std::string> sequences {{"chr1", "ACGTn"}, {"chr2", ""}};
	ReferenceGenome reference(sequences);

	SECTION("positions are 1-based") {
		REQUIRE(reference.lookup("chr1", 1) == 'A');
		REQUIRE(reference.lookup("chr1", 4) == 'T');
		REQUIRE(reference.lookup("chr1", 5) == 'n');
	}
	SECTION("outside of the contig") {
		REQUIRE(reference.lookup("chr1", 0) == NO_REFERENCE_BASE);
		REQUIRE(reference.lookup("chr1", 6) == NO_REFERENCE_BASE);
		REQUIRE(reference.lookup("chr1", -3) == NO_REFERENCE_BASE);
		REQUIRE(reference.lookup("chr2", 1) == NO_REFERENCE_BASE);
	}
	SECTION("unknown contig") {
		REQUIRE(reference.lookup("chrM", 1) == NO_REFERENCE_BASE);
	}
	SECTION("empty reference") {
		ReferenceGenome empty;
		REQUIRE(empty.size() == 0);
		REQUIRE(empty.lookup("chr1", 1) == NO_REFERENCE_BASE);
	}
}

TEST_CASE("Reference loading", "[loadReference]") {
	SECTION("missing file") {
		REQUIRE_THROWS_AS(loadReference("does-not-exist.fasta"), ReferenceMissing);
	}
	SECTION("FASTA file") {
		const std::string path = "plpcall-test-reference.fasta";
		{
			std::ofstream fasta {path};
			fasta << ">contig1 first contig\nACGTAC\nGT\n>contig2\nnnA\n";
		}
		auto reference = loadReference(path);
		std::remove(path.c_str());
		std::remove((path + ".fai").c_str());

		REQUIRE(reference.size() == 2);
		REQUIRE(reference.lookup("contig1", 1) == 'A');
		REQUIRE(reference.lookup("contig1", 7) == 'G');
		REQUIRE(reference.lookup("contig1", 8) == 'T');
		REQUIRE(reference.lookup("contig1", 9) == NO_REFERENCE_BASE);
		REQUIRE(reference.lookup("contig2", 1) == 'n');
		REQUIRE(reference.lookup("contig2", 3) == 'A');
	}
}
