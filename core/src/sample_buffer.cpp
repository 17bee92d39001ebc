#include "seisspec/sample_buffer.hpp"
#include <cstring>
#include <limits>

namespace seisspec {

namespace {

void checkShape(std::size_t rows, std::size_t columns, std::size_t count) {
    if (columns != 0 && rows > std::numeric_limits<std::size_t>::max() / columns) {
        throw std::invalid_argument(
            "shape " + std::to_string(rows) + "x" + std::to_string(columns) +
            " overflows the element count");
    }
    if (rows * columns != count) {
        throw std::invalid_argument(
            "sample count " + std::to_string(count) +
            " does not match shape " + std::to_string(rows) + "x" +
            std::to_string(columns));
    }
}

} // namespace

SampleBuffer::SampleBuffer(std::size_t rows, std::size_t columns,
                           std::vector<double> data)
    : rows_(rows), columns_(columns), precision_(Precision::FLOAT64),
      data64_(std::move(data)) {
    checkShape(rows_, columns_, data64_.size());
}

SampleBuffer::SampleBuffer(std::size_t rows, std::size_t columns,
                           std::vector<float> data)
    : rows_(rows), columns_(columns), precision_(Precision::FLOAT32),
      data32_(std::move(data)) {
    checkShape(rows_, columns_, data32_.size());
}

SampleBuffer::SampleBuffer(SampleBuffer&& other) noexcept
    : rows_(other.rows_), columns_(other.columns_),
      precision_(other.precision_),
      data32_(std::move(other.data32_)), data64_(std::move(other.data64_)) {
    other.reset();
}

SampleBuffer& SampleBuffer::operator=(SampleBuffer&& other) noexcept {
    if (this != &other) {
        rows_ = other.rows_;
        columns_ = other.columns_;
        precision_ = other.precision_;
        data32_ = std::move(other.data32_);
        data64_ = std::move(other.data64_);
        other.reset();
    }
    return *this;
}

void SampleBuffer::reset() noexcept {
    rows_ = 0;
    columns_ = 0;
    data32_.clear();
    data64_.clear();
}

SampleBuffer SampleBuffer::fromRows(
    std::initializer_list<std::initializer_list<double>> rows,
    Precision precision) {
    const std::size_t nrows = rows.size();
    const std::size_t ncols = nrows ? rows.begin()->size() : 0;

    std::vector<double> data(nrows * ncols);
    Index r = 0;
    for (const auto& row : rows) {
        if (row.size() != ncols) {
            throw std::invalid_argument("all rows must have the same length");
        }
        Index c = 0;
        for (double value : row) {
            data[c * nrows + r] = value;
            ++c;
        }
        ++r;
    }

    SampleBuffer buffer(nrows, ncols, std::move(data));
    if (precision == Precision::FLOAT32) {
        return buffer.castTo(Precision::FLOAT32);
    }
    return buffer;
}

Sample SampleBuffer::at(Index row, Index column) const {
    if (row >= rows_ || column >= columns_) {
        throw std::out_of_range("sample index out of range");
    }
    const Index i = offset(row, column);
    return precision_ == Precision::FLOAT32
        ? static_cast<Sample>(data32_[i])
        : data64_[i];
}

std::vector<Sample> SampleBuffer::column(Index column) const {
    if (column >= columns_) {
        throw std::out_of_range("column index out of range");
    }
    std::vector<Sample> result(rows_);
    for (Index r = 0; r < rows_; ++r) {
        const Index i = offset(r, column);
        result[r] = precision_ == Precision::FLOAT32
            ? static_cast<Sample>(data32_[i])
            : data64_[i];
    }
    return result;
}

std::vector<Sample> SampleBuffer::widen() const {
    if (precision_ == Precision::FLOAT64) {
        return data64_;
    }
    return std::vector<Sample>(data32_.begin(), data32_.end());
}

void SampleBuffer::assign(const std::vector<Sample>& values) {
    if (values.size() != size()) {
        throw std::invalid_argument(
            "cannot assign " + std::to_string(values.size()) +
            " values to a buffer of " + std::to_string(size()) + " elements");
    }

    if (precision_ == Precision::FLOAT64) {
        data64_ = values;
        return;
    }
    for (std::size_t i = 0; i < values.size(); ++i) {
        data32_[i] = static_cast<float>(values[i]);
    }
}

SampleBuffer SampleBuffer::castTo(Precision precision) const {
    if (precision == precision_) {
        return *this;
    }
    if (precision == Precision::FLOAT64) {
        return SampleBuffer(rows_, columns_, widen());
    }
    std::vector<float> narrowed(data64_.size());
    for (std::size_t i = 0; i < data64_.size(); ++i) {
        narrowed[i] = static_cast<float>(data64_[i]);
    }
    return SampleBuffer(rows_, columns_, std::move(narrowed));
}

bool SampleBuffer::identical(const SampleBuffer& other) const {
    if (rows_ != other.rows_ || columns_ != other.columns_ ||
        precision_ != other.precision_) {
        return false;
    }
    if (empty()) {
        return true;
    }
    if (precision_ == Precision::FLOAT32) {
        return std::memcmp(data32_.data(), other.data32_.data(),
                           data32_.size() * sizeof(float)) == 0;
    }
    return std::memcmp(data64_.data(), other.data64_.data(),
                       data64_.size() * sizeof(double)) == 0;
}

} // namespace seisspec
