#include <catch2/catch.hpp>
#include "seisspec/log.hpp"
#include "seisspec/algorithms/spectral_conversion.hpp"
#include "seisspec/errors.hpp"
#include <string>
#include <utility>
#include <vector>

using namespace seisspec;

namespace {

struct CapturedLog {
    std::vector<std::pair<log::Level, std::string>> entries;

    CapturedLog() {
        log::setSink([this](log::Level level, const std::string& msg) {
            entries.emplace_back(level, msg);
        });
    }

    ~CapturedLog() {
        log::setSink(nullptr);
        log::setLevel(log::Level::WARN);
    }
};

} // namespace

TEST_CASE("Logger levels", "[log]") {
    CapturedLog captured;

    SECTION("Messages below the level are dropped") {
        log::setLevel(log::Level::WARN);
        SEISSPEC_LOG_DEBUG("hidden {}", 1);
        log::logf(log::Level::WARN, "shown {}", 2);
        REQUIRE(captured.entries.size() == 1);
        REQUIRE(captured.entries[0].first == log::Level::WARN);
        REQUIRE(captured.entries[0].second == "shown 2");
    }

    SECTION("OFF silences everything") {
        log::setLevel(log::Level::OFF);
        SEISSPEC_LOG_ERROR("nothing");
        REQUIRE(captured.entries.empty());
        REQUIRE_FALSE(log::Logger::instance().enabled(log::Level::ERROR));
    }

    SECTION("Level names") {
        REQUIRE(std::string(log::toString(log::Level::TRACE)) == "TRACE");
        REQUIRE(std::string(log::toString(log::Level::ERROR)) == "ERROR");
    }
}

TEST_CASE("Conversion logging", "[log]") {
    CapturedLog captured;
    log::setLevel(log::Level::DEBUG);

    std::vector<Record> records;
    records.emplace_back(FileType::REAL_IMAG, SampleBuffer::fromRows({{3.0, 4.0}}));
    records.emplace_back(FileType::AMPL_PHASE, SampleBuffer());

    SECTION("Batch summary at debug level") {
        algorithms::rlimToAmph(records);
        REQUIRE(captured.entries.size() == 1);
        REQUIRE(captured.entries[0].first == log::Level::DEBUG);
        REQUIRE(captured.entries[0].second.find("1 converted") != std::string::npos);
        REQUIRE(captured.entries[0].second.find("1 dataless") != std::string::npos);
    }

    SECTION("Rejection is logged as an error") {
        records.emplace_back(FileType::TIME_SERIES, SampleBuffer());
        REQUIRE_THROWS_AS(algorithms::rlimToAmph(records), NonSpectralRecordError);
        REQUIRE(captured.entries.size() == 1);
        REQUIRE(captured.entries[0].first == log::Level::ERROR);
    }
}
