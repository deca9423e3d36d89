#pragma once
#include "CoordinateConverter.h"
#include "GeoTypes.h"

#include <string>

struct MgrsReference {
    int zone = 0;
    char band = 'N';
    char column = 'A';    // 100 km square easting letter
    char row = 'A';       // 100 km square northing letter
    double easting = 0.0; // meters within the square
    double northing = 0.0;
    int precision = 0;    // digits per axis, 0..5
};

/**
 * @brief Military grid reference conversion on WGS84 for the UTM region (bands C..X).
 * @details Polar (UPS) references are rejected.
 */
class MgrsConverter : public CoordinateConverter {
public:
    static constexpr int kMaxPrecision = 5;

    // Rejected references come back as nullopt; a missing projection
    // backend still throws Mgrs2LatLong::ProjectionException.
    std::optional<GeoPair> toLatLon(const std::string& normalized) const override;

    /**
     * @brief Splits a reference into zone, letters and in-square offsets.
     * @details Offsets are placed at the centre of the cell the digits describe.
     * @throws Mgrs2LatLong::ConversionException on any syntax violation.
     */
    static MgrsReference parse(const std::string& text);

    /**
     * @brief Resolves the 100 km square and latitude band into UTM.
     * @throws Mgrs2LatLong::ConversionException for squares that do not exist
     *         in the zone or positions outside the declared latitude band.
     */
    static UtmCoordinate toUtm(const MgrsReference& ref);

    /**
     * @throws Mgrs2LatLong::ConversionException when the reference is invalid.
     */
    static GeoPair toGeodetic(const std::string& text);

    /**
     * @brief Encodes a position as a compact reference such as "33TWN1234567890".
     * @param precision Digits per axis (0..5); 5 means 1 m.
     * @throws Mgrs2LatLong::ConversionException outside latitudes [-80, 84].
     */
    static std::string fromLatLon(double latitudeDeg, double longitudeDeg, int precision = kMaxPrecision);
};
