#pragma once

#include "types.hpp"
#include <initializer_list>
#include <stdexcept>
#include <vector>

namespace seisspec {

/**
 * @brief Dependent data of a record: a samples x columns matrix.
 *
 * Elements are stored column-major in either single or double precision.
 * The precision tag travels with the buffer: arithmetic is done on a
 * widened copy (see widen()) and written back with assign(), which narrows
 * to the stored precision again.
 */
class SampleBuffer {
public:
    /// Default constructor creates an empty double-precision buffer
    SampleBuffer() = default;

    /// Construct a double-precision buffer from column-major data
    /// @throws std::invalid_argument if rows x columns overflows or differs
    ///         from data.size()
    SampleBuffer(std::size_t rows, std::size_t columns, std::vector<double> data);

    /// Construct a single-precision buffer from column-major data
    /// @throws std::invalid_argument as for the double-precision constructor
    SampleBuffer(std::size_t rows, std::size_t columns, std::vector<float> data);

    /**
     * @brief Build a buffer from row-wise values.
     *
     * @param rows One inner list per sample, all of equal length
     * @param precision Storage precision of the result
     * @throws std::invalid_argument if the rows are ragged
     */
    static SampleBuffer fromRows(
        std::initializer_list<std::initializer_list<double>> rows,
        Precision precision = Precision::FLOAT64);

    /// Move constructor; the source is left empty
    SampleBuffer(SampleBuffer&& other) noexcept;

    /// Move assignment; the source is left empty
    SampleBuffer& operator=(SampleBuffer&& other) noexcept;
    SampleBuffer(const SampleBuffer&) = default;
    SampleBuffer& operator=(const SampleBuffer&) = default;

    // =========================================================================
    // Shape
    // =========================================================================

    /// Number of samples (matrix rows)
    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }

    /// Number of columns
    [[nodiscard]] std::size_t columns() const noexcept { return columns_; }

    /// Total element count
    [[nodiscard]] std::size_t size() const noexcept { return rows_ * columns_; }

    /// Check if the buffer holds no elements
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    /// Storage precision
    [[nodiscard]] Precision precision() const noexcept { return precision_; }

    // =========================================================================
    // Element Access
    // =========================================================================

    /// Get element at (row, column) as a working-precision value
    [[nodiscard]] Sample at(Index row, Index column) const;

    /// Get one column as working-precision values
    [[nodiscard]] std::vector<Sample> column(Index column) const;

    /// Raw single-precision storage (empty unless precision is FLOAT32)
    [[nodiscard]] const std::vector<float>& float32() const noexcept {
        return data32_;
    }

    /// Raw double-precision storage (empty unless precision is FLOAT64)
    [[nodiscard]] const std::vector<double>& float64() const noexcept {
        return data64_;
    }

    // =========================================================================
    // Precision Handling
    // =========================================================================

    /// Copy all elements (column-major) into working precision
    [[nodiscard]] std::vector<Sample> widen() const;

    /**
     * @brief Overwrite all elements, narrowing to the stored precision.
     *
     * @param values Column-major values, one per element
     * @throws std::invalid_argument if the value count differs from size()
     */
    void assign(const std::vector<Sample>& values);

    /// Return a copy stored at another precision
    [[nodiscard]] SampleBuffer castTo(Precision precision) const;

    /// Compare shape, precision and element bit patterns
    [[nodiscard]] bool identical(const SampleBuffer& other) const;

private:
    void reset() noexcept;

    [[nodiscard]] Index offset(Index row, Index column) const noexcept {
        return column * rows_ + row;
    }

    std::size_t rows_ = 0;
    std::size_t columns_ = 0;
    Precision precision_ = Precision::FLOAT64;

    std::vector<float> data32_;
    std::vector<double> data64_;
};

} // namespace seisspec
