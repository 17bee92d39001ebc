#pragma once

#include "types.hpp"
#include "sample_buffer.hpp"
#include <string>
#include <vector>

namespace seisspec {

/**
 * @brief Summary statistics of a record's dependent data.
 *
 * All three values are NaN for a dataless record.
 */
struct DepStats {
    Sample mean = std::numeric_limits<Sample>::quiet_NaN();
    Sample min = std::numeric_limits<Sample>::quiet_NaN();
    Sample max = std::numeric_limits<Sample>::quiet_NaN();
};

/**
 * @brief Compute mean, min and max over every element of a buffer.
 *
 * NaN elements are ignored by min and max but propagate into the mean.
 * An empty buffer yields all-NaN statistics.
 */
DepStats computeDepStats(const SampleBuffer& dep);

/**
 * @brief One waveform record: header fields plus dependent data.
 *
 * For spectral records the columns of dep() come in pairs per channel,
 * either (real, imaginary) or (amplitude, phase) depending on fileType().
 */
class Record {
public:
    /// Default constructor creates a dataless record of unknown type
    Record() = default;

    /// Construct with file type and data; statistics are computed from the data
    Record(FileType type, SampleBuffer dep)
        : file_type_(type), dep_(std::move(dep)) {
        updateStats();
    }

    Record(Record&&) noexcept = default;
    Record& operator=(Record&&) noexcept = default;
    Record(const Record&) = default;
    Record& operator=(const Record&) = default;

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get dependent data
    [[nodiscard]] const SampleBuffer& dep() const noexcept { return dep_; }

    /// Get dependent data (mutable); statistics are not refreshed
    SampleBuffer& dep() noexcept { return dep_; }

    /// Replace dependent data and refresh statistics
    void setDep(SampleBuffer dep) {
        dep_ = std::move(dep);
        updateStats();
    }

    /// Check if the record carries header metadata only
    [[nodiscard]] bool isDataless() const noexcept { return dep_.empty(); }

    /// Number of samples
    [[nodiscard]] std::size_t npts() const noexcept { return dep_.rows(); }

    /// Number of channels (column pairs for spectral records)
    [[nodiscard]] std::size_t ncmp() const noexcept {
        return isSpectral(file_type_) ? dep_.columns() / 2 : dep_.columns();
    }

    // =========================================================================
    // Header
    // =========================================================================

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    /// Get file type (iftype)
    [[nodiscard]] FileType fileType() const noexcept { return file_type_; }
    void setFileType(FileType type) noexcept { file_type_ = type; }

    /// Sample spacing (frequency step for spectral records)
    [[nodiscard]] double delta() const noexcept { return delta_; }
    void setDelta(double delta) noexcept { delta_ = delta; }

    /// Value of the first sample's independent variable
    [[nodiscard]] double b() const noexcept { return b_; }
    void setB(double b) noexcept { b_ = b; }

    [[nodiscard]] Sample depmen() const noexcept { return stats_.mean; }
    [[nodiscard]] Sample depmin() const noexcept { return stats_.min; }
    [[nodiscard]] Sample depmax() const noexcept { return stats_.max; }
    [[nodiscard]] const DepStats& depStats() const noexcept { return stats_; }
    void setDepStats(const DepStats& stats) noexcept { stats_ = stats; }

    /// Get custom metadata
    [[nodiscard]] const MetaData& metadata() const noexcept { return metadata_; }
    MetaData& metadata() noexcept { return metadata_; }

    /// Recompute depmen, depmin and depmax from the current data
    void updateStats() { stats_ = computeDepStats(dep_); }

private:
    std::string name_;
    FileType file_type_ = FileType::UNKNOWN;
    double delta_ = 1.0;
    double b_ = 0.0;

    SampleBuffer dep_;

    // Cached statistics
    DepStats stats_;

    MetaData metadata_;
};

/**
 * @brief Batch header update: one file type for every record plus
 * per-record statistics.
 */
struct HeaderUpdate {
    FileType file_type = FileType::UNKNOWN;
    std::vector<DepStats> stats;
};

/**
 * @brief Write a HeaderUpdate onto a batch of records.
 *
 * @throws std::invalid_argument if the statistics count differs from the
 *         record count; no record is modified in that case
 */
void applyHeaderUpdate(std::vector<Record>& records, const HeaderUpdate& update);

} // namespace seisspec
