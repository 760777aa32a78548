#pragma once

#include <cstdio>
#include <string>

/** `samtools mpileup` command line producing one line per position with
 * mapping qualities (-s) and read positions (-O).
 */
std::string mpileupCommand(const std::string& alignment, const std::string& reference_path, const std::string& extra_options);

// true for inputs that have to be piled up first (.bam, .cram, .sam)
bool isAlignmentFile(const std::string& path);

/** A child process whose standard output is read through stream().
 *
 * close() waits for the process and throws UpstreamProcessFailure if it
 * did not exit with status 0.
 */
class MpileupProcess {
public:
    explicit MpileupProcess(const std::string& command);
    ~MpileupProcess();

    MpileupProcess(const MpileupProcess&) = delete;
    MpileupProcess& operator=(const MpileupProcess&) = delete;

    FILE* stream() const { return pipe_; }
    void close();

private:
    std::string command_;
    FILE* pipe_ {nullptr};
};
