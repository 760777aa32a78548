#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <getopt.h>

#include "call.hpp"
#include "mpileup.hpp"
#include "reference.hpp"
#include "vcf.hpp"

using namespace std;

struct arguments {
    CallSettings settings {};
    string reference_path;
    string mpileup_options {"-q 1"};
} args {};

void printHelp(const char* program_name, const vector<struct option>& options, const vector<string>& descriptions) {
    cout << "Calls consensus bases from samtools mpileup output and writes them as VCF." << endl;
    cout << "Usage: " << program_name << " [options] [file.sorted.bam | file.pileup | -] > out.vcf" << endl;
    cout << "Options:" << endl;
    for (size_t i = 0; i < options.size() && i < descriptions.size(); ++i) {
        cout << '\t';
        cout << '-' << (char) options[i].val;
        cout << ", --" << options[i].name;
        cout << "\t" << descriptions[i] << endl;
    }
    cout << "With more than one CPU the records are not guaranteed to be sorted; sort them with" << endl;
    cout << "\t(grep '^#' out.vcf; grep -v '^#' out.vcf | sort -k1,1 -k2,2n) > out.sorted.vcf" << endl;
}

bool parseLong(const char* s, long& value) {
    char* end = nullptr;
    errno = 0;
    value = strtol(s, &end, 10);
    return end != s && *end == '\0' && errno == 0;
}

bool parseDouble(const char* s, double& value) {
    char* end = nullptr;
    errno = 0;
    value = strtod(s, &end);
    return end != s && *end == '\0' && errno == 0;
}

CallSummary callFile(const string& input, const ReferenceGenome* reference) {
    if (isAlignmentFile(input)) {
        MpileupProcess mpileup {mpileupCommand(input, args.reference_path, args.mpileup_options)};
        CallSummary summary = callPositions(mpileup.stream(), cout, reference, args.settings);
        if (summary.stopped_early) {
            // samtools is still writing, its exit status is meaningless
            cerr << "# Debug mode: stopped after " << summary.positions << " positions" << endl;
        } else {
            cerr << "# Closing the samtools mpileup stream" << endl;
            mpileup.close();
        }
        return summary;
    }
    if (input.empty() || input == "-") {
        return callPositions(stdin, cout, reference, args.settings);
    }
    unique_ptr<FILE, decltype(&fclose)> f {fopen(input.c_str(), "r"), &fclose};
    if (!f) {
        throw runtime_error {"Could not open " + input};
    }
    return callPositions(f.get(), cout, reference, args.settings);
}

int main(int argc, char** argv) {
    vector<struct option> options;
    vector<string> descriptions;

    options.push_back({"help", no_argument, nullptr, 'h'});
    descriptions.push_back("Print this help message and exit");

    options.push_back({"min-coverage", required_argument, nullptr, 'c'});
    descriptions.push_back("Minimum depth at a position (default 10)");

    options.push_back({"min-frequency", required_argument, nullptr, 'f'});
    descriptions.push_back("Minimum frequency of the majority base, between 0 and 1 (default 0.75)");

    options.push_back({"reference", required_argument, nullptr, 'r'});
    descriptions.push_back("Reference FASTA, used for REF and for matches in the read bases (optional)");

    options.push_back({"numcpus", required_argument, nullptr, 'n'});
    descriptions.push_back("Number of threads (default 1)");

    options.push_back({"variants-only", no_argument, nullptr, 'v'});
    descriptions.push_back("Do not print invariant sites or no-calls");

    options.push_back({"mpileup-options", required_argument, nullptr, 'm'});
    descriptions.push_back("Options passed to 'samtools mpileup' for alignment input (default '-q 1')");

    options.push_back({"skip-malformed", no_argument, nullptr, 's'});
    descriptions.push_back("Skip and count malformed pileup lines instead of stopping");

    options.push_back({"debug", no_argument, nullptr, 'd'});
    descriptions.push_back("Stop at the first progress report after 10000 positions");

    // end marker for getopt_long
    options.push_back({0,0,0,0});

    string optstring;
    for (struct option opt : options) {
        optstring += opt.val;
        // use the fact that no_argument = 0, required_argument = 1, optional_argument = 2
        for (int i = 0; i < opt.has_arg; ++i) {
            optstring += ':';
        }
    }

    int optindex = -1;
    int opt = 0;
    long number = 0;
    double fraction = 0.0;
    while ((opt = getopt_long(argc, argv, optstring.c_str(), options.data(), &optindex)) != -1) {
        switch (opt) {
        case 'h':
            printHelp(argv[0], options, descriptions);
            exit(EXIT_SUCCESS);
            break;
        case 'c':
            if (!parseLong(optarg, number) || number < 0 || number > INT32_MAX) {
                cerr << "# Invalid minimum coverage: " << optarg << endl;
                exit(EXIT_FAILURE);
            }
            args.settings.consensus.min_coverage = int(number);
            break;
        case 'f':
            if (!parseDouble(optarg, fraction) || fraction < 0.0 || fraction > 1.0) {
                cerr << "# Invalid minimum frequency: " << optarg << endl;
                exit(EXIT_FAILURE);
            }
            args.settings.consensus.min_frequency = fraction;
            break;
        case 'r':
            args.reference_path = optarg;
            break;
        case 'n':
            if (!parseLong(optarg, number) || number < 1 || number > 1024) {
                cerr << "# Invalid number of CPUs: " << optarg << endl;
                exit(EXIT_FAILURE);
            }
            args.settings.num_threads = int(number);
            break;
        case 'v':
            args.settings.variants_only = true;
            break;
        case 'm':
            args.mpileup_options = optarg;
            break;
        case 's':
            args.settings.skip_malformed = true;
            break;
        case 'd':
            args.settings.debug = true;
            break;
        default:
            printHelp(argv[0], options, descriptions);
            exit(EXIT_FAILURE);
        }
    }

    string program_name = argv[0];
    program_name = program_name.substr(program_name.find_last_of('/') + 1);
    string input = optind < argc ? argv[optind] : "";

    try {
        ReferenceGenome reference;
        const ReferenceGenome* reference_handle = nullptr;
        if (args.reference_path.empty()) {
            cerr << "# Warning: reference not given" << endl;
        } else {
            reference = loadReference(args.reference_path);
            reference_handle = &reference;
        }

        printVcfHeader(cout, program_name, vcfDate(), args.reference_path);
        CallSummary summary = callFile(input, reference_handle);
        cerr << "# Done. " << summary.positions << " positions were analyzed." << endl;
    } catch (const exception& e) {
        cout.flush();
        cerr << "# Error: " << e.what() << endl;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
