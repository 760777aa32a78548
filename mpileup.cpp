#include <iostream>

#include <sys/wait.h>

#include "errors.hpp"
#include "mpileup.hpp"

static std::string shellQuote(const std::string& s) {
    std::string quoted = "'";
    for (char c : s) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

static bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string mpileupCommand(const std::string& alignment, const std::string& reference_path, const std::string& extra_options) {
    std::string command = "samtools mpileup";
    if (!extra_options.empty()) {
        command += " " + extra_options;
    }
    if (!reference_path.empty()) {
        command += " -f " + shellQuote(reference_path);
    }
    return command + " -O -s " + shellQuote(alignment);
}

bool isAlignmentFile(const std::string& path) {
    return endsWith(path, ".bam") || endsWith(path, ".cram") || endsWith(path, ".sam");
}

MpileupProcess::MpileupProcess(const std::string& command) : command_ {command} {
    std::cerr << "# " << command_ << std::endl;
    pipe_ = popen(command_.c_str(), "r");
    if (pipe_ == nullptr) {
        throw UpstreamProcessFailure {"Could not start: " + command_};
    }
}

MpileupProcess::~MpileupProcess() {
    if (pipe_ != nullptr) {
        pclose(pipe_);
    }
}

void MpileupProcess::close() {
    if (pipe_ == nullptr) {
        return;
    }
    int status = pclose(pipe_);
    pipe_ = nullptr;
    if (status == -1) {
        throw UpstreamProcessFailure {"Could not wait for: " + command_};
    }
    if (WIFSIGNALED(status)) {
        throw UpstreamProcessFailure {"Killed by signal " + std::to_string(WTERMSIG(status)) + ": " + command_};
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        throw UpstreamProcessFailure {"Exited with status " + std::to_string(WEXITSTATUS(status)) + ": " + command_};
    }
}
