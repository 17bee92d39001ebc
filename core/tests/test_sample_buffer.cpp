#include <catch2/catch.hpp>
#include "seisspec/sample_buffer.hpp"
#include <cmath>
#include <limits>

using namespace seisspec;
using Catch::Detail::Approx;

TEST_CASE("SampleBuffer construction", "[sample_buffer]") {
    SECTION("Default construction") {
        SampleBuffer buf;
        REQUIRE(buf.empty());
        REQUIRE(buf.rows() == 0);
        REQUIRE(buf.columns() == 0);
        REQUIRE(buf.precision() == Precision::FLOAT64);
    }

    SECTION("Column-major double data") {
        SampleBuffer buf(2, 3, std::vector<double>{1, 2, 3, 4, 5, 6});
        REQUIRE(buf.size() == 6);
        REQUIRE(buf.at(0, 0) == Approx(1.0));
        REQUIRE(buf.at(1, 0) == Approx(2.0));
        REQUIRE(buf.at(0, 2) == Approx(5.0));
        REQUIRE(buf.at(1, 2) == Approx(6.0));
    }

    SECTION("Single precision data") {
        SampleBuffer buf(1, 2, std::vector<float>{1.5f, -2.5f});
        REQUIRE(buf.precision() == Precision::FLOAT32);
        REQUIRE(buf.float64().empty());
        REQUIRE(buf.at(0, 1) == Approx(-2.5));
    }

    SECTION("Mismatched shape throws") {
        REQUIRE_THROWS_AS(SampleBuffer(2, 2, std::vector<double>{1, 2, 3}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(SampleBuffer(1, 2, std::vector<float>{1.0f}),
                          std::invalid_argument);
    }

    SECTION("From rows") {
        auto buf = SampleBuffer::fromRows({{1.0, 2.0}, {3.0, 4.0}, {5.0, 6.0}});
        REQUIRE(buf.rows() == 3);
        REQUIRE(buf.columns() == 2);
        REQUIRE(buf.float64() == std::vector<double>{1, 3, 5, 2, 4, 6});
        REQUIRE(buf.column(1) == std::vector<double>{2, 4, 6});
    }

    SECTION("Ragged rows throw") {
        REQUIRE_THROWS_AS(SampleBuffer::fromRows({{1.0, 2.0}, {3.0}}),
                          std::invalid_argument);
    }

    SECTION("Overflowing shape throws") {
        const std::size_t huge = std::numeric_limits<std::size_t>::max() / 2 + 1;
        REQUIRE_THROWS_AS(SampleBuffer(huge, 2, std::vector<double>{}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(SampleBuffer(2, huge, std::vector<float>{}),
                          std::invalid_argument);
    }

    SECTION("Zero-row shape is empty") {
        SampleBuffer buf(0, 4, std::vector<double>{});
        REQUIRE(buf.empty());
    }
}

TEST_CASE("SampleBuffer moves", "[sample_buffer]") {
    auto source = SampleBuffer::fromRows({{1.0, 2.0}, {3.0, 4.0}});

    SECTION("Move construction empties the source") {
        SampleBuffer target(std::move(source));
        REQUIRE(target.rows() == 2);
        REQUIRE(target.at(1, 1) == Approx(4.0));
        REQUIRE(source.empty());
        REQUIRE(source.rows() == 0);
        REQUIRE(source.columns() == 0);
        REQUIRE_THROWS_AS(source.at(0, 0), std::out_of_range);
    }

    SECTION("Move assignment empties the source") {
        SampleBuffer target;
        target = std::move(source);
        REQUIRE(target.columns() == 2);
        REQUIRE(source.empty());
        REQUIRE(source.widen().empty());
    }
}

TEST_CASE("SampleBuffer access", "[sample_buffer]") {
    auto buf = SampleBuffer::fromRows({{1.0, 2.0}});

    SECTION("Out of range element") {
        REQUIRE_THROWS_AS(buf.at(1, 0), std::out_of_range);
        REQUIRE_THROWS_AS(buf.at(0, 2), std::out_of_range);
        REQUIRE_THROWS_AS(buf.column(2), std::out_of_range);
    }
}

TEST_CASE("SampleBuffer precision handling", "[sample_buffer]") {
    SECTION("Assign narrows to single precision") {
        auto buf = SampleBuffer::fromRows({{0.0, 0.0}}, Precision::FLOAT32);
        buf.assign({0.1, 1.0 / 3.0});
        REQUIRE(buf.precision() == Precision::FLOAT32);
        REQUIRE(buf.float32()[0] == 0.1f);
        REQUIRE(buf.float32()[1] == static_cast<float>(1.0 / 3.0));
    }

    SECTION("Assign keeps double precision") {
        auto buf = SampleBuffer::fromRows({{0.0, 0.0}});
        buf.assign({0.1, 1.0 / 3.0});
        REQUIRE(buf.float64()[1] == 1.0 / 3.0);
    }

    SECTION("Assign with wrong count throws") {
        auto buf = SampleBuffer::fromRows({{0.0, 0.0}});
        REQUIRE_THROWS_AS(buf.assign({1.0}), std::invalid_argument);
    }

    SECTION("Cast between precisions") {
        auto buf = SampleBuffer::fromRows({{0.1, 2.0}});
        auto narrow = buf.castTo(Precision::FLOAT32);
        REQUIRE(narrow.precision() == Precision::FLOAT32);
        REQUIRE(narrow.float32()[0] == 0.1f);

        auto wide = narrow.castTo(Precision::FLOAT64);
        REQUIRE(wide.precision() == Precision::FLOAT64);
        REQUIRE(wide.at(0, 0) == static_cast<double>(0.1f));
    }

    SECTION("Widen copies in column-major order") {
        auto buf = SampleBuffer::fromRows({{1.0, 2.0}, {3.0, 4.0}},
                                          Precision::FLOAT32);
        REQUIRE(buf.widen() == std::vector<double>{1, 3, 2, 4});
    }
}

TEST_CASE("SampleBuffer identity", "[sample_buffer]") {
    auto a = SampleBuffer::fromRows({{1.0, 2.0}});
    auto b = SampleBuffer::fromRows({{1.0, 2.0}});

    REQUIRE(a.identical(b));
    REQUIRE_FALSE(a.identical(a.castTo(Precision::FLOAT32)));
    REQUIRE_FALSE(a.identical(SampleBuffer::fromRows({{1.0}, {2.0}})));

    b.assign({1.0, std::nextafter(2.0, 3.0)});
    REQUIRE_FALSE(a.identical(b));

    REQUIRE(SampleBuffer().identical(SampleBuffer()));
}
