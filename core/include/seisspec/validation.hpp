#pragma once

#include "record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace seisspec {

/**
 * @brief Description of a structural problem found in a record collection.
 */
struct ValidationError {
    /// Stable identifier, e.g. "seisspec:checkRecords:oddColumnCount"
    std::string identifier;

    /// Human-readable message
    std::string message;

    /// Index of the offending record
    Index record = 0;
};

/**
 * @brief Check that spectral records with data hold whole column pairs.
 *
 * Conversion reads columns two at a time, so this check runs on every
 * conversion call regardless of ConversionOptions::skip_validation.
 *
 * @param records Records to check
 * @return The first problem found, or std::nullopt if all records pass
 */
std::optional<ValidationError> checkColumnPairs(const std::vector<Record>& records);

/**
 * @brief Full structural check of a record collection.
 *
 * Runs checkColumnPairs(), then requires every record that carries data
 * to have a finite, positive delta. Dataless records always pass.
 *
 * @param records Records to check
 * @return The first problem found, or std::nullopt if all records pass
 */
std::optional<ValidationError> checkRecords(const std::vector<Record>& records);

/**
 * @brief Require every record in the batch to be spectral.
 *
 * The whole batch is inspected before anything else happens, so a caller
 * that runs this first never mutates a batch that is later rejected.
 *
 * @param records Records to check
 * @param operation Name of the calling operation, used in the error identifier
 * @throws NonSpectralRecordError naming the first non-spectral record
 */
void requireSpectral(const std::vector<Record>& records,
                     const std::string& operation);

} // namespace seisspec
