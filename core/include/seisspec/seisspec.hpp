#pragma once

/**
 * @file seisspec.hpp
 * @brief Main header for the seisspec library.
 *
 * Include this header to get access to all seisspec functionality.
 *
 * @example
 * @code
 * #include <seisspec/seisspec.hpp>
 *
 * int main() {
 *     std::vector<seisspec::Record> records;
 *     records.emplace_back(seisspec::FileType::REAL_IMAG,
 *                          seisspec::SampleBuffer::fromRows({{3.0, 4.0}}));
 *
 *     records = seisspec::algorithms::rlimToAmph(std::move(records));
 *     // records[0].dep().at(0, 0) == 5.0
 *     return 0;
 * }
 * @endcode
 */

// Core types
#include "types.hpp"
#include "errors.hpp"
#include "log.hpp"

// Data structures
#include "sample_buffer.hpp"
#include "record.hpp"
#include "validation.hpp"

// Algorithms
#include "algorithms/spectral_conversion.hpp"

/**
 * @namespace seisspec
 * @brief Root namespace for the seisspec library.
 */

/**
 * @namespace seisspec::algorithms
 * @brief Operations on batches of records.
 */

/**
 * @namespace seisspec::log
 * @brief Leveled logging used by the library.
 */
