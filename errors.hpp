#pragma once

#include <stdexcept>
#include <string>

/** A pileup line whose fields cannot be read: too few columns, a
 * position or depth that is not a number, or quality strings whose
 * length does not match the depth.
 */
class MalformedLine : public std::invalid_argument {
public:
    explicit MalformedLine(const std::string& what) : std::invalid_argument {what} {}
};

/** A read base column that cannot be expanded into exactly `depth`
 * read observations.
 */
class DecodeError : public std::invalid_argument {
public:
    explicit DecodeError(const std::string& what) : std::invalid_argument {what} {}
};

class ReferenceMissing : public std::runtime_error {
public:
    explicit ReferenceMissing(const std::string& what) : std::runtime_error {what} {}
};

// samtools mpileup could not be started or exited with a non-zero status
class UpstreamProcessFailure : public std::runtime_error {
public:
    explicit UpstreamProcessFailure(const std::string& what) : std::runtime_error {what} {}
};
