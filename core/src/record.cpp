#include "seisspec/record.hpp"
#include <stdexcept>

namespace seisspec {

DepStats computeDepStats(const SampleBuffer& dep) {
    DepStats stats;
    if (dep.empty()) {
        return stats;
    }

    const std::vector<Sample> values = dep.widen();

    Sample sum = 0.0;
    SampleRange range;
    for (Sample v : values) {
        sum += v;
        if (!std::isnan(v)) {
            range.extend(v);
        }
    }

    stats.mean = sum / static_cast<Sample>(values.size());
    if (!range.isEmpty()) {
        stats.min = range.min_value;
        stats.max = range.max_value;
    }
    return stats;
}

void applyHeaderUpdate(std::vector<Record>& records, const HeaderUpdate& update) {
    if (update.stats.size() != records.size()) {
        throw std::invalid_argument(
            "header update carries " + std::to_string(update.stats.size()) +
            " statistics for " + std::to_string(records.size()) + " records");
    }

    for (std::size_t i = 0; i < records.size(); ++i) {
        records[i].setFileType(update.file_type);
        records[i].setDepStats(update.stats[i]);
    }
}

} // namespace seisspec
