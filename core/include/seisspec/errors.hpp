#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace seisspec {

/**
 * @brief Base class for errors raised by seisspec operations.
 */
class SeisspecError : public std::runtime_error {
public:
    SeisspecError(std::string identifier, const std::string& msg)
        : std::runtime_error(msg), identifier_(std::move(identifier)) {}

    /// Stable identifier of the form "seisspec:<operation>:<kind>"
    [[nodiscard]] const std::string& identifier() const noexcept {
        return identifier_;
    }

private:
    std::string identifier_;
};

/**
 * @brief Thrown when a record collection fails the structural check.
 */
class InvalidRecordError : public SeisspecError {
public:
    InvalidRecordError(std::string identifier, const std::string& msg)
        : SeisspecError(std::move(identifier), "Invalid record: " + msg) {}
};

/**
 * @brief Thrown when a spectral-only operation meets a non-spectral record.
 *
 * Raised before any record in the batch is touched.
 */
class NonSpectralRecordError : public SeisspecError {
public:
    NonSpectralRecordError(const std::string& operation, Index record,
                           FileType found)
        : SeisspecError("seisspec:" + operation + ":illegalOperation",
                        "Illegal operation on non-spectral file! (record " +
                            std::to_string(record) + " is '" +
                            toString(found) + "')"),
          record_(record), found_(found) {}

    /// Index of the first offending record in the batch
    [[nodiscard]] Index record() const noexcept { return record_; }

    /// File type found on the offending record
    [[nodiscard]] FileType found() const noexcept { return found_; }

private:
    Index record_;
    FileType found_;
};

} // namespace seisspec
