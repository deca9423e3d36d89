#pragma once
#include "GeoTypes.h"

#include <optional>
#include <string>

/**
 * @brief Boundary to the grid-to-geographic conversion capability.
 * @details Implementations receive a whitespace-free reference and report
 *          failure as nullopt; they must not throw for unparseable input.
 */
class CoordinateConverter {
public:
    virtual ~CoordinateConverter() = default;
    virtual std::optional<GeoPair> toLatLon(const std::string& normalized) const = 0;
};
