#include "seisspec/validation.hpp"
#include "seisspec/errors.hpp"
#include "seisspec/log.hpp"
#include <cmath>

namespace seisspec {

std::optional<ValidationError> checkColumnPairs(const std::vector<Record>& records) {
    for (Index i = 0; i < records.size(); ++i) {
        const Record& rec = records[i];
        if (rec.isDataless() || !isSpectral(rec.fileType())) {
            continue;
        }

        const std::size_t columns = rec.dep().columns();
        if (columns % 2 != 0) {
            ValidationError err;
            err.identifier = "seisspec:checkRecords:oddColumnCount";
            err.message = "spectral record " + std::to_string(i) + " has " +
                          std::to_string(columns) +
                          " data columns; expected column pairs";
            err.record = i;
            return err;
        }
    }
    return std::nullopt;
}

std::optional<ValidationError> checkRecords(const std::vector<Record>& records) {
    if (auto err = checkColumnPairs(records)) {
        return err;
    }

    for (Index i = 0; i < records.size(); ++i) {
        const Record& rec = records[i];
        if (rec.isDataless()) {
            continue;
        }

        if (!std::isfinite(rec.delta()) || rec.delta() <= 0.0) {
            ValidationError err;
            err.identifier = "seisspec:checkRecords:badDelta";
            err.message = "record " + std::to_string(i) + " has delta " +
                          std::to_string(rec.delta()) +
                          "; expected a finite positive sample spacing";
            err.record = i;
            return err;
        }
    }
    return std::nullopt;
}

void requireSpectral(const std::vector<Record>& records,
                     const std::string& operation) {
    for (Index i = 0; i < records.size(); ++i) {
        const FileType type = records[i].fileType();
        if (!isSpectral(type)) {
            SEISSPEC_LOG_ERROR("{}: record {} is '{}', not spectral; batch of {} rejected",
                               operation, i, toString(type), records.size());
            throw NonSpectralRecordError(operation, i, type);
        }
    }
}

} // namespace seisspec
