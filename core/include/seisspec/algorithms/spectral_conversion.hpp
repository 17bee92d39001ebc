#pragma once

#include "../record.hpp"
#include <vector>

namespace seisspec {
namespace algorithms {

/**
 * @brief Options for spectral representation conversion
 */
struct ConversionOptions {
    /// Skip the header checks of checkRecords(); the column-pair and
    /// spectral checks always run
    bool skip_validation = false;
};

/**
 * @brief Switches spectral records between real/imaginary and
 * amplitude/phase representations.
 *
 * Both directions share one contract:
 * - every record must be spectral, checked over the whole batch before
 *   anything is modified (NonSpectralRecordError otherwise)
 * - records already in the target representation keep their data
 * - dataless records are skipped and keep NaN statistics
 * - depmen/depmin/depmax are recomputed from the final data
 * - every record ends tagged with the target representation
 * - storage precision of each record is preserved
 *
 * Example: multiply two spectra in real/imaginary form, then go back.
 * @code
 * SpectralConverter converter;
 * converter.toRealImag(records);
 * // ... complex multiplication on records ...
 * converter.toAmplPhase(records);
 * @endcode
 */
class SpectralConverter {
public:
    SpectralConverter() = default;
    explicit SpectralConverter(const ConversionOptions& options)
        : options_(options) {}

    /**
     * @brief Convert real/imaginary records to amplitude/phase in place.
     *
     * Phase is atan2(imag, real), in radians.
     *
     * @param records Records to convert
     * @throws InvalidRecordError if the structural check fails
     * @throws NonSpectralRecordError if any record is not spectral
     */
    void toAmplPhase(std::vector<Record>& records) const;

    /**
     * @brief Convert amplitude/phase records to real/imaginary in place.
     *
     * @param records Records to convert
     * @throws InvalidRecordError if the structural check fails
     * @throws NonSpectralRecordError if any record is not spectral
     */
    void toRealImag(std::vector<Record>& records) const;

    /**
     * @brief Get/set options
     */
    const ConversionOptions& options() const { return options_; }
    void setOptions(const ConversionOptions& opt) { options_ = opt; }

private:
    ConversionOptions options_;

    /// Shared batch driver for both directions
    void convert(std::vector<Record>& records, FileType from, FileType to,
                 const char* operation) const;
};

/**
 * @brief Convenience function: real/imaginary to amplitude/phase.
 */
inline std::vector<Record> rlimToAmph(std::vector<Record> records,
                                      const ConversionOptions& options = {}) {
    SpectralConverter converter(options);
    converter.toAmplPhase(records);
    return records;
}

/**
 * @brief Convenience function: amplitude/phase to real/imaginary.
 */
inline std::vector<Record> amphToRlim(std::vector<Record> records,
                                      const ConversionOptions& options = {}) {
    SpectralConverter converter(options);
    converter.toRealImag(records);
    return records;
}

} // namespace algorithms
} // namespace seisspec
