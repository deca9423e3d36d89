#include "UtmProjection.h"
#include "Mgrs2LatLongExceptions.h"

#include <ogr_spatialref.h>

#include <cmath>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace UtmProjection {
namespace {
struct TransformDeleter {
    void operator()(OGRCoordinateTransformation* ct) const { OGRCoordinateTransformation::DestroyCT(ct); }
};
using TransformPtr = std::unique_ptr<OGRCoordinateTransformation, TransformDeleter>;

struct ZoneTransforms {
    TransformPtr toGrid;
    TransformPtr toGeographic;
};

double normalizeLongitude(double deg) {
    double out = std::fmod(deg + 180.0, 360.0);
    if (out < 0.0) out += 360.0;
    return out - 180.0;
}

void importEpsg(OGRSpatialReference& srs, int code) {
    if (srs.importFromEPSG(code) != OGRERR_NONE) {
        throw Mgrs2LatLong::ProjectionException("Cannot load spatial reference EPSG:" + std::to_string(code));
    }
    // x = longitude / easting, y = latitude / northing
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
}

// One pair of transformations per zone and hemisphere, built on first use.
const ZoneTransforms& transformsFor(int zone, bool northern) {
    thread_local std::map<int, ZoneTransforms> cache;

    const int code = epsgCode(zone, northern);
    const auto it = cache.find(code);
    if (it != cache.end()) return it->second;

    OGRSpatialReference geographic;
    importEpsg(geographic, kWgs84Epsg);
    OGRSpatialReference grid;
    importEpsg(grid, code);

    ZoneTransforms transforms;
    transforms.toGrid.reset(OGRCreateCoordinateTransformation(&geographic, &grid));
    transforms.toGeographic.reset(OGRCreateCoordinateTransformation(&grid, &geographic));
    if (!transforms.toGrid || !transforms.toGeographic) {
        throw Mgrs2LatLong::ProjectionException("Cannot create transformation between EPSG:" +
                                                 std::to_string(kWgs84Epsg) + " and EPSG:" + std::to_string(code));
    }
    return cache.emplace(code, std::move(transforms)).first->second;
}
} // namespace

double centralMeridian(int zone) {
    return static_cast<double>(zone) * 6.0 - 183.0;
}

int epsgCode(int zone, bool northern) {
    if (zone < 1 || zone > 60) {
        throw Mgrs2LatLong::ConversionException("UTM zone outside 1..60: " + std::to_string(zone));
    }
    return (northern ? 32600 : 32700) + zone;
}

int naturalZone(double latitudeDeg, double longitudeDeg) {
    const double lon = normalizeLongitude(longitudeDeg);
    int zone = static_cast<int>(std::floor((lon + 180.0) / 6.0)) + 1;
    if (zone > 60) zone = 60;

    if (latitudeDeg >= 56.0 && latitudeDeg < 64.0 && lon >= 3.0 && lon < 12.0) {
        return 32;
    }
    if (latitudeDeg >= 72.0 && latitudeDeg <= 84.0 && lon >= 0.0 && lon < 42.0) {
        if (lon < 9.0) return 31;
        if (lon < 21.0) return 33;
        if (lon < 33.0) return 35;
        return 37;
    }
    return zone;
}

UtmCoordinate forward(double latitudeDeg, double longitudeDeg, int zone) {
    UtmCoordinate utm;
    utm.zone = zone;
    utm.northern = latitudeDeg >= 0.0;

    double x = normalizeLongitude(longitudeDeg);
    double y = latitudeDeg;
    if (!transformsFor(zone, utm.northern).toGrid->Transform(1, &x, &y)) {
        throw Mgrs2LatLong::ConversionException("Cannot project " + std::to_string(latitudeDeg) + ", " +
                                                std::to_string(longitudeDeg) + " into UTM zone " +
                                                std::to_string(zone));
    }
    utm.easting = x;
    utm.northing = y;
    return utm;
}

GeoPair inverse(const UtmCoordinate& utm) {
    double x = utm.easting;
    double y = utm.northing;
    if (!transformsFor(utm.zone, utm.northern).toGeographic->Transform(1, &x, &y)) {
        throw Mgrs2LatLong::ConversionException("Cannot unproject UTM " + std::to_string(utm.zone) +
                                                (utm.northern ? "N " : "S ") + std::to_string(utm.easting) +
                                                " " + std::to_string(utm.northing));
    }

    GeoPair out;
    out.latitude = y;
    out.longitude = normalizeLongitude(x);
    return out;
}

} // namespace UtmProjection
