#include "seisspec/types.hpp"
#include <algorithm>
#include <cctype>

namespace seisspec {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

FileType fileTypeFromString(const std::string& description) {
    static const FileType known[] = {
        FileType::TIME_SERIES,
        FileType::REAL_IMAG,
        FileType::AMPL_PHASE,
        FileType::GENERAL_XY,
        FileType::GENERAL_XYZ
    };

    const std::string wanted = lowercase(description);
    for (FileType t : known) {
        if (lowercase(toString(t)) == wanted) {
            return t;
        }
    }
    return FileType::UNKNOWN;
}

} // namespace seisspec
