#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <limits>
#include <cmath>

namespace seisspec {

/// Sample value type used for all working-precision arithmetic
using Sample = double;

/// Index type for records, rows and columns
using Index = std::size_t;

/// File type of a record (the header's iftype field)
enum class FileType : std::uint8_t {
    UNKNOWN = 0,
    TIME_SERIES,    // Time series file
    REAL_IMAG,      // Spectral file, real/imaginary pairs
    AMPL_PHASE,     // Spectral file, amplitude/phase pairs
    GENERAL_XY,     // General x vs y file
    GENERAL_XYZ     // General 3-D file
};

/// Storage precision of a record's dependent data
enum class Precision : std::uint8_t {
    FLOAT32,
    FLOAT64
};

/// Range template for min/max values (floating-point T)
template<typename T>
struct Range {
    T min_value = std::numeric_limits<T>::infinity();
    T max_value = -std::numeric_limits<T>::infinity();

    Range() = default;
    Range(T min_val, T max_val) : min_value(min_val), max_value(max_val) {}

    bool isEmpty() const { return min_value > max_value; }
    T span() const { return max_value - min_value; }

    bool contains(T value) const {
        return value >= min_value && value <= max_value;
    }

    void extend(T value) {
        if (value < min_value) min_value = value;
        if (value > max_value) max_value = value;
    }
};

using SampleRange = Range<Sample>;

/// Key-value metadata container
using MetaData = std::map<std::string, std::string>;

/// Check whether a file type holds frequency-domain data
inline bool isSpectral(FileType t) {
    return t == FileType::REAL_IMAG || t == FileType::AMPL_PHASE;
}

/// Convert file type to its header description
inline std::string toString(FileType t) {
    switch (t) {
        case FileType::TIME_SERIES: return "Time Series File";
        case FileType::REAL_IMAG: return "Spectral File-Real/Imag";
        case FileType::AMPL_PHASE: return "Spectral File-Ampl/Phase";
        case FileType::GENERAL_XY: return "General X vs Y file";
        case FileType::GENERAL_XYZ: return "General XYZ (3-D) file";
        default: return "Unknown";
    }
}

/// Convert precision to string
inline std::string toString(Precision p) {
    switch (p) {
        case Precision::FLOAT32: return "single";
        case Precision::FLOAT64: return "double";
    }
    return "unknown";
}

/**
 * @brief Look up a file type from its header description.
 *
 * Matching is case-insensitive. Descriptions that name no known file
 * type map to FileType::UNKNOWN.
 */
FileType fileTypeFromString(const std::string& description);

} // namespace seisspec
