#pragma once

#include <string>

namespace MgrsClassifier {

// Shortest plausible compact reference, e.g. "4QFJ123".
constexpr size_t kMinCoordinateLength = 7;

/**
 * @brief Cheap pre-filter deciding whether a cell plausibly holds a grid reference.
 * @details Matches zone digits, a latitude band letter (C..X without I and O),
 *          a two-letter 100 km square and 2..10 digits, optionally separated by
 *          whitespace. Digit parity and square validity are left to the converter.
 */
bool looksLikeCoordinate(const std::string& value);

} // namespace MgrsClassifier
