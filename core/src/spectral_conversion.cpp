#include "seisspec/algorithms/spectral_conversion.hpp"
#include "seisspec/errors.hpp"
#include "seisspec/log.hpp"
#include "seisspec/validation.hpp"
#include <cmath>
#include <complex>

namespace seisspec {
namespace algorithms {

namespace {

// Columns are stored column-major; channel k occupies columns 2k and 2k+1.

void realImagToAmplPhase(std::vector<Sample>& values, std::size_t rows,
                         std::size_t columns) {
    for (Index k = 0; k + 1 < columns; k += 2) {
        Sample* first = values.data() + k * rows;
        Sample* second = values.data() + (k + 1) * rows;
        for (Index r = 0; r < rows; ++r) {
            const std::complex<Sample> z(first[r], second[r]);
            first[r] = std::abs(z);
            second[r] = std::arg(z);
        }
    }
}

void amplPhaseToRealImag(std::vector<Sample>& values, std::size_t rows,
                         std::size_t columns) {
    for (Index k = 0; k + 1 < columns; k += 2) {
        Sample* first = values.data() + k * rows;
        Sample* second = values.data() + (k + 1) * rows;
        for (Index r = 0; r < rows; ++r) {
            const Sample amplitude = first[r];
            const Sample phase = second[r];
            first[r] = amplitude * std::cos(phase);
            second[r] = amplitude * std::sin(phase);
        }
    }
}

} // namespace

void SpectralConverter::toAmplPhase(std::vector<Record>& records) const {
    convert(records, FileType::REAL_IMAG, FileType::AMPL_PHASE, "rlimToAmph");
}

void SpectralConverter::toRealImag(std::vector<Record>& records) const {
    convert(records, FileType::AMPL_PHASE, FileType::REAL_IMAG, "amphToRlim");
}

void SpectralConverter::convert(std::vector<Record>& records, FileType from,
                                FileType to, const char* operation) const {
    auto err = options_.skip_validation ? checkColumnPairs(records)
                                        : checkRecords(records);
    if (err) {
        SEISSPEC_LOG_ERROR("{}: {}", operation, err->message);
        throw InvalidRecordError(err->identifier, err->message);
    }

    requireSpectral(records, operation);

    HeaderUpdate update;
    update.file_type = to;
    update.stats.resize(records.size());

    std::size_t converted = 0;
    std::size_t dataless = 0;
    for (Index i = 0; i < records.size(); ++i) {
        Record& rec = records[i];
        if (rec.isDataless()) {
            ++dataless;
            continue;
        }

        if (rec.fileType() == from) {
            SampleBuffer& dep = rec.dep();
            std::vector<Sample> values = dep.widen();
            if (to == FileType::AMPL_PHASE) {
                realImagToAmplPhase(values, dep.rows(), dep.columns());
            } else {
                amplPhaseToRealImag(values, dep.rows(), dep.columns());
            }
            dep.assign(values);
            ++converted;
        }

        update.stats[i] = computeDepStats(rec.dep());
    }

    applyHeaderUpdate(records, update);

    SEISSPEC_LOG_DEBUG("{}: {} records, {} converted, {} dataless, {} already '{}'",
                       operation, records.size(), converted, dataless,
                       records.size() - converted - dataless, toString(to));
}

} // namespace algorithms
} // namespace seisspec
