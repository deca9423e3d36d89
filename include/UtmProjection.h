#pragma once
#include "GeoTypes.h"

/**
 * UTM on WGS84 through GDAL/OSR: EPSG:4326 to and from EPSG:326zz (north)
 * or EPSG:327zz (south). Zone selection stays here; the projection itself is
 * left to PROJ.
 */
namespace UtmProjection {

constexpr int kWgs84Epsg = 4326;

double centralMeridian(int zone);

/**
 * @brief EPSG code of the WGS84 / UTM zone, 326zz north or 327zz south.
 * @throws Mgrs2LatLong::ConversionException for zones outside 1..60.
 */
int epsgCode(int zone, bool northern);

/**
 * @brief UTM zone for a position, honouring the 32V and 31X..37X exceptions.
 */
int naturalZone(double latitudeDeg, double longitudeDeg);

/**
 * @throws Mgrs2LatLong::ProjectionException when OSR cannot build the transformation.
 * @throws Mgrs2LatLong::ConversionException when a point cannot be transformed.
 */
UtmCoordinate forward(double latitudeDeg, double longitudeDeg, int zone);
GeoPair inverse(const UtmCoordinate& utm);

} // namespace UtmProjection
