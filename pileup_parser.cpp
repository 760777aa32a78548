#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>

#include "errors.hpp"
#include "pileup_parser.hpp"

const std::string MALFORMED = "Malformed pileup line";
const char* const DELIM = " \t\r\n";
const size_t NUM_FIELDS = 7;

enum Field {CONTIG, POSITION, REFERENCE, DEPTH, READ_BASES, BASE_QUALITIES, MAPPING_QUALITIES};

// "contig:position" as far as the fields could be read
static std::string describe(const std::array<char*, NUM_FIELDS>& fields, size_t found) {
    if (found == 0) {
        return "";
    }
    std::string where = std::string(" at ") + fields[CONTIG];
    if (found > POSITION) {
        where += std::string(":") + fields[POSITION];
    }
    return where;
}

static bool parseInteger(const char* s, long& value) {
    char* end = nullptr;
    errno = 0;
    value = strtol(s, &end, 10);
    return end != s && *end == '\0' && errno == 0;
}

// samtools writes '*' for the empty columns of an uncovered position
static const char* emptyIfPlaceholder(const char* field, long depth) {
    if (depth == 0 && strcmp(field, "*") == 0) {
        return "";
    }
    return field;
}

static Strand indelStrand(const std::string& literal) {
    bool has_upper = false;
    for (char c : literal) {
        if (std::islower(static_cast<unsigned char>(c))) {
            return Strand::Reverse;
        }
        has_upper = has_upper || std::isupper(static_cast<unsigned char>(c));
    }
    return has_upper ? Strand::Forward : Strand::Unknown;
}

PileupLine parsePileupLine(char* line, const ReferenceGenome* reference) {
    char* saveptr = nullptr;
    std::array<char*, NUM_FIELDS> fields {};

    // validate the field count before looking at any value
    for (size_t i = 0; i < NUM_FIELDS; ++i) {
        fields[i] = strtok_r(i == 0 ? line : nullptr, DELIM, &saveptr);
        if (fields[i] == nullptr) {
            throw MalformedLine {MALFORMED + describe(fields, i) + ": expected "
                + std::to_string(NUM_FIELDS) + " fields, found " + std::to_string(i)};
        }
    }
    const std::string where = describe(fields, NUM_FIELDS);

    PileupLine result;
    result.contig = fields[CONTIG];

    long position = 0;
    if (!parseInteger(fields[POSITION], position) || position < 1) {
        throw MalformedLine {MALFORMED + where + ": position must be a positive integer"};
    }
    result.position = position;

    if (strlen(fields[REFERENCE]) != 1) {
        throw MalformedLine {MALFORMED + where + ": reference base must be a single character"};
    }
    result.reference_hint = fields[REFERENCE][0];

    long depth = 0;
    if (!parseInteger(fields[DEPTH], depth) || depth < 0 || depth > std::numeric_limits<int>::max()) {
        throw MalformedLine {MALFORMED + where + ": depth must be a non-negative integer"};
    }
    result.depth = int(depth);

    result.read_bases = emptyIfPlaceholder(fields[READ_BASES], depth);
    result.base_qualities = emptyIfPlaceholder(fields[BASE_QUALITIES], depth);
    result.mapping_qualities = emptyIfPlaceholder(fields[MAPPING_QUALITIES], depth);

    if (result.base_qualities.size() != size_t(depth)) {
        throw MalformedLine {MALFORMED + where + ": " + std::to_string(result.base_qualities.size())
            + " base qualities for depth " + std::to_string(depth)};
    }
    if (result.mapping_qualities.size() != size_t(depth)) {
        throw MalformedLine {MALFORMED + where + ": " + std::to_string(result.mapping_qualities.size())
            + " mapping qualities for depth " + std::to_string(depth)};
    }

    char reference_base = NO_REFERENCE_BASE;
    if (reference != nullptr) {
        reference_base = reference->lookup(result.contig, result.position);
    }

    try {
        result.reads = parseReadBases(result.read_bases.c_str(), reference_base, result.depth);
    } catch (const DecodeError& e) {
        throw DecodeError {"Undecodable read bases" + where + ": " + e.what()};
    }
    return result;
}

std::vector<ReadObservation> parseReadBases(const char* read_bases, char reference, int depth) {
    std::vector<ReadObservation> result;
    result.reserve(depth);

    const size_t length = strlen(read_bases);
    for (size_t i = 0; i < length; ++i) {
        const char base = read_bases[i];
        switch (base) {
            case '^':
                // read start, the next char is its mapping quality
                if (i + 1 >= length) {
                    throw DecodeError {"read start without mapping quality"};
                }
                ++i;
                break;
            case '$':
                break;
            case '.':
                if (reference == NO_REFERENCE_BASE) {
                    result.push_back({".", Strand::Forward});
                } else {
                    result.push_back({std::string(1, char(std::toupper(reference))), Strand::Forward});
                }
                break;
            case ',':
                if (reference == NO_REFERENCE_BASE) {
                    result.push_back({".", Strand::Reverse});
                } else {
                    result.push_back({std::string(1, char(std::tolower(reference))), Strand::Reverse});
                }
                break;
            case '*':
            case '#':
                // deleted in this read, no strand information
                result.push_back({"*", Strand::Unknown});
                break;
            case '+':
            case '-': {
                // parse following number, which gives the length of the inserted/deleted bases
                if (!std::isdigit(static_cast<unsigned char>(read_bases[i + 1]))) {
                    throw DecodeError {std::string("missing length after '") + base + "'"};
                }
                char* first_after_number;
                // number is always positive since the sign is skipped
                unsigned long indel_length = strtoul(read_bases + i + 1, &first_after_number, 10);
                size_t start = first_after_number - read_bases;
                if (indel_length == 0 || indel_length > length - start) {
                    throw DecodeError {"indel length " + std::to_string(indel_length)
                        + " does not fit the read bases"};
                }
                std::string literal(read_bases + start, indel_length);
                for (char c : literal) {
                    if (!std::isalpha(static_cast<unsigned char>(c)) && c != '*' && c != '#') {
                        throw DecodeError {std::string("unexpected '") + c + "' inside indel " + literal};
                    }
                }
                if (base == '+') {
                    result.push_back({literal, indelStrand(literal)});
                } else {
                    result.push_back({std::string(indel_length, '*'), Strand::Unknown});
                }
                // -1 because i is incremented in the surrounding loop
                i = start + indel_length - 1;
                break;
            }
            default:
                if (std::isupper(static_cast<unsigned char>(base))) {
                    result.push_back({std::string(1, base), Strand::Forward});
                } else if (std::islower(static_cast<unsigned char>(base))) {
                    result.push_back({std::string(1, base), Strand::Reverse});
                } else {
                    throw DecodeError {std::string("unexpected '") + base + "' in read bases"};
                }
                break;
        }
    }

    if (result.size() != size_t(depth)) {
        throw DecodeError {"decoded " + std::to_string(result.size()) + " reads for depth "
            + std::to_string(depth)};
    }
    return result;
}

std::vector<int> parseQualities(const std::string& qualities) {
    std::vector<int> result;
    result.reserve(qualities.size());
    for (char q : qualities) {
        result.push_back(int(q) - 33);
    }
    return result;
}
