#include <cstdlib>
#include <exception>
#include <sstream>
#include <vector>

#include "call.hpp"
#include "errors.hpp"
#include "pileup_parser.hpp"
#include "vcf.hpp"

const size_t LINES_PER_THREAD = 4096;

// getline(3) on a FILE*, owning its buffer
class LineReader {
public:
	explicit LineReader(FILE* input) : input_ {input} {}
	~LineReader() { free(buffer_); }

	LineReader(const LineReader&) = delete;
	LineReader& operator=(const LineReader&) = delete;

	bool next(std::string& line) {
		ssize_t length = getline(&buffer_, &capacity_, input_);
		if (length == -1) {
			return false;
		}
		line.assign(buffer_, length);
		return true;
	}

private:
	FILE* input_;
	char* buffer_ {nullptr};
	size_t capacity_ {0};
};

static bool isBlank(const std::string& line) {
	return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

// message of a skippable line error; anything else is rethrown
static std::string lineErrorMessage(const std::exception_ptr& error) {
	try {
		std::rethrow_exception(error);
	} catch (const MalformedLine& e) {
		return e.what();
	} catch (const DecodeError& e) {
		return e.what();
	}
}

std::string callPosition(char* line, const ReferenceGenome* reference, const CallSettings& settings) {
	PileupLine plp = parsePileupLine(line, reference);
	ConsensusResult consensus = findConsensus(plp, settings.consensus);
	OutputRecord record = makeOutputRecord(plp, consensus, reference);
	if (!isReported(record, settings.variants_only)) {
		return "";
	}
	std::ostringstream os;
	os << record;
	return os.str();
}

CallSummary callPositions(FILE* input, std::ostream& out, const ReferenceGenome* reference, const CallSettings& settings) {
	const int threads = settings.num_threads > 1 ? settings.num_threads : 1;
	const size_t batch_size = threads > 1 ? LINES_PER_THREAD * threads : 1;

	CallSummary summary;
	LineReader reader {input};
	std::vector<std::string> lines;
	std::vector<std::string> outputs;
	std::vector<std::exception_ptr> errors;

	bool more = true;
	while (more && !summary.stopped_early) {
		lines.clear();
		std::string line;
		while (lines.size() < batch_size && (more = reader.next(line))) {
			if (!isBlank(line)) {
				lines.push_back(std::move(line));
			}
		}
		if (lines.empty()) {
			break;
		}

		const int num_lines = int(lines.size());
		outputs.assign(num_lines, std::string {});
		errors.assign(num_lines, std::exception_ptr {});

		#pragma omp parallel for schedule(dynamic) num_threads(threads) if(threads > 1)
		for (int i = 0; i < num_lines; ++i) {
			// exceptions must not leave the parallel region
			try {
				outputs[i] = callPosition(&lines[i][0], reference, settings);
			} catch (...) {
				errors[i] = std::current_exception();
			}
		}

		for (int i = 0; i < num_lines; ++i) {
			++summary.positions;
			if (errors[i]) {
				if (!settings.skip_malformed) {
					std::rethrow_exception(errors[i]);
				}
				std::cerr << "# Skipping " << lineErrorMessage(errors[i]) << std::endl;
				++summary.skipped;
			} else if (!outputs[i].empty()) {
				out << outputs[i] << '\n';
				++summary.reported;
			}

			if (settings.progress_interval > 0 && summary.positions % settings.progress_interval == 0) {
				std::cerr << "# Finished with " << summary.positions << " positions" << std::endl;
				if (settings.debug && summary.positions > settings.debug_limit) {
					summary.stopped_early = true;
					break;
				}
			}
		}
	}
	out.flush();

	std::cerr << "# Finished with " << summary.positions << " positions" << std::endl;
	if (summary.skipped > 0) {
		std::cerr << "# Skipped " << summary.skipped << " malformed positions" << std::endl;
	}
	return summary;
}
