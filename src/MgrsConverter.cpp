#include "MgrsConverter.h"

#include "CommonUtils.h"
#include "Mgrs2LatLongExceptions.h"
#include "UtmProjection.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <string>

namespace {
constexpr double kOneHundredKm = 100000.0;
constexpr double kTwoMillion = 2000000.0;
constexpr double kMinLatitude = -80.0;
constexpr double kMaxLatitude = 84.0;
constexpr double kTruncationEpsilon = 4.99e-4;

struct LatitudeBand {
    char letter;
    double minNorthing;
    double north;
    double south;
    double northingOffset;
};

constexpr std::array<LatitudeBand, 20> kLatitudeBands = {{
    {'C', 1100000.0, -72.0, -80.5, 0.0},
    {'D', 2000000.0, -64.0, -72.0, 2000000.0},
    {'E', 2800000.0, -56.0, -64.0, 2000000.0},
    {'F', 3700000.0, -48.0, -56.0, 2000000.0},
    {'G', 4600000.0, -40.0, -48.0, 4000000.0},
    {'H', 5500000.0, -32.0, -40.0, 4000000.0},
    {'J', 6400000.0, -24.0, -32.0, 6000000.0},
    {'K', 7300000.0, -16.0, -24.0, 6000000.0},
    {'L', 8200000.0, -8.0, -16.0, 8000000.0},
    {'M', 9100000.0, 0.0, -8.0, 8000000.0},
    {'N', 0.0, 8.0, 0.0, 0.0},
    {'P', 800000.0, 16.0, 8.0, 0.0},
    {'Q', 1700000.0, 24.0, 16.0, 0.0},
    {'R', 2600000.0, 32.0, 24.0, 2000000.0},
    {'S', 3500000.0, 40.0, 32.0, 2000000.0},
    {'T', 4400000.0, 48.0, 40.0, 4000000.0},
    {'U', 5300000.0, 56.0, 48.0, 4000000.0},
    {'V', 6200000.0, 64.0, 56.0, 6000000.0},
    {'W', 7000000.0, 72.0, 64.0, 6000000.0},
    {'X', 7900000.0, 84.5, 72.0, 6000000.0}}};

const LatitudeBand* findBand(char letter) {
    const auto it = std::find_if(kLatitudeBands.begin(), kLatitudeBands.end(),
                                 [letter](const LatitudeBand& b) { return b.letter == letter; });
    return it == kLatitudeBands.end() ? nullptr : &*it;
}

bool inLatitudeBand(char letter, double latitudeDeg, double border) {
    const LatitudeBand* band = findBand(letter);
    if (!band) return false;
    return (band->south - border) <= latitudeDeg && latitudeDeg <= (band->north + border);
}

// Band letters skip I and O, so neighbours are found through the table.
std::array<char, 2> adjacentBands(char letter) {
    const LatitudeBand* band = findBand(letter);
    const size_t idx = static_cast<size_t>(band - kLatitudeBands.data());
    const char prev = idx > 0 ? kLatitudeBands[idx - 1].letter : letter;
    const char next = idx + 1 < kLatitudeBands.size() ? kLatitudeBands[idx + 1].letter : letter;
    return {prev, next};
}

// Column letter range and row pattern offset repeat every six zones.
struct GridValues {
    char columnLow;
    char columnHigh;
    double patternOffset;
};

GridValues gridValues(int zone) {
    int setNumber = zone % 6;
    if (setNumber == 0) setNumber = 6;

    GridValues values{'A', 'H', 0.0};
    if (setNumber == 2 || setNumber == 5) {
        values.columnLow = 'J';
        values.columnHigh = 'R';
    } else if (setNumber == 3 || setNumber == 6) {
        values.columnLow = 'S';
        values.columnHigh = 'Z';
    }
    values.patternOffset = (setNumber % 2 == 0) ? 500000.0 : 0.0;
    return values;
}

double cellSize(int precision) {
    return std::pow(10.0, static_cast<double>(MgrsConverter::kMaxPrecision - precision));
}

[[noreturn]] void reject(const std::string& text, const std::string& reason) {
    throw Mgrs2LatLong::ConversionException("Failed to parse MGRS coordinate: " + text + " (" + reason + ")");
}
} // namespace

std::optional<GeoPair> MgrsConverter::toLatLon(const std::string& normalized) const {
    try {
        return toGeodetic(normalized);
    } catch (const Mgrs2LatLong::ConversionException&) {
        return std::nullopt;
    }
}

MgrsReference MgrsConverter::parse(const std::string& text) {
    const std::string s = CommonUtils::toUpper(CommonUtils::removeWhitespace(text));
    size_t i = 0;

    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == 0 || i > 2) reject(text, "zone must have one or two digits");

    MgrsReference ref;
    ref.zone = std::stoi(s.substr(0, i));
    if (ref.zone < 1 || ref.zone > 60) reject(text, "zone out of range 1..60");

    const size_t lettersBegin = i;
    while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
    if (i - lettersBegin != 3) reject(text, "expected band letter and two square letters");

    ref.band = s[lettersBegin];
    ref.column = s[lettersBegin + 1];
    ref.row = s[lettersBegin + 2];
    for (char letter : {ref.band, ref.column, ref.row}) {
        if (letter == 'I' || letter == 'O') reject(text, "letters I and O are not used");
    }
    if (!findBand(ref.band)) reject(text, "latitude band must be C..X");

    const size_t digitsBegin = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i != s.size()) reject(text, "unexpected character");

    const size_t digitCount = i - digitsBegin;
    if (digitCount % 2 != 0 || digitCount > 2 * static_cast<size_t>(kMaxPrecision)) {
        reject(text, "easting and northing need the same number of digits, at most five each");
    }

    ref.precision = static_cast<int>(digitCount / 2);
    const double cell = cellSize(ref.precision);
    double east = 0.0;
    double north = 0.0;
    if (ref.precision > 0) {
        const size_t n = static_cast<size_t>(ref.precision);
        east = std::stod(s.substr(digitsBegin, n)) * cell;
        north = std::stod(s.substr(digitsBegin + n, n)) * cell;
    }
    ref.easting = east + cell / 2.0;
    ref.northing = north + cell / 2.0;
    return ref;
}

UtmCoordinate MgrsConverter::toUtm(const MgrsReference& ref) {
    const std::string label = std::to_string(ref.zone) + ref.band + ref.column + ref.row;

    if (ref.band == 'X' && (ref.zone == 32 || ref.zone == 34 || ref.zone == 36)) {
        reject(label, "zone does not exist in band X");
    }
    if (ref.band == 'V' && ref.zone == 31 && ref.column > 'D') {
        reject(label, "square lies in the zone 32V extension");
    }

    const LatitudeBand* band = findBand(ref.band);
    if (!band) reject(label, "latitude band must be C..X");

    const GridValues grid = gridValues(ref.zone);
    if (ref.column < grid.columnLow || ref.column > grid.columnHigh || ref.row > 'V') {
        reject(label, "100 km square does not exist in this zone");
    }

    double gridEasting = static_cast<double>(ref.column - grid.columnLow + 1) * kOneHundredKm;
    if (grid.columnLow == 'J' && ref.column > 'O') gridEasting -= kOneHundredKm;

    double rowNorthing = static_cast<double>(ref.row - 'A') * kOneHundredKm;
    if (ref.row > 'O') rowNorthing -= kOneHundredKm;
    if (ref.row > 'I') rowNorthing -= kOneHundredKm;
    if (rowNorthing >= kTwoMillion) rowNorthing -= kTwoMillion;

    double gridNorthing = rowNorthing - grid.patternOffset;
    if (gridNorthing < 0.0) gridNorthing += kTwoMillion;
    gridNorthing += band->northingOffset;
    if (gridNorthing < band->minNorthing) gridNorthing += kTwoMillion;

    UtmCoordinate utm;
    utm.zone = ref.zone;
    utm.northern = ref.band >= 'N';
    utm.easting = gridEasting + ref.easting;
    utm.northing = gridNorthing + ref.northing;

    // Coarser references get a proportionally wider tolerance at band edges.
    const double border = cellSize(ref.precision) / kOneHundredKm;
    const double latitude = UtmProjection::inverse(utm).latitude;
    if (!inLatitudeBand(ref.band, latitude, border)) {
        const auto neighbours = adjacentBands(ref.band);
        if (!inLatitudeBand(neighbours[0], latitude, border) && !inLatitudeBand(neighbours[1], latitude, border)) {
            reject(label, "position falls outside latitude band " + std::string(1, ref.band));
        }
    }
    return utm;
}

GeoPair MgrsConverter::toGeodetic(const std::string& text) {
    return UtmProjection::inverse(toUtm(parse(text)));
}

std::string MgrsConverter::fromLatLon(double latitudeDeg, double longitudeDeg, int precision) {
    if (!std::isfinite(latitudeDeg) || !std::isfinite(longitudeDeg)) {
        throw Mgrs2LatLong::ConversionException("Latitude and longitude must be finite");
    }
    if (latitudeDeg < kMinLatitude || latitudeDeg > kMaxLatitude) {
        throw Mgrs2LatLong::ConversionException("Latitude outside the MGRS/UTM range [-80, 84]: " +
                                                std::to_string(latitudeDeg));
    }
    if (precision < 0 || precision > kMaxPrecision) {
        throw Mgrs2LatLong::ConversionException("Precision must be within 0..5");
    }

    char bandLetter = 'X';
    if (latitudeDeg < 72.0) {
        const int idx = std::clamp(static_cast<int>(std::floor((latitudeDeg + 80.0) / 8.0)), 0, 18);
        bandLetter = kLatitudeBands[static_cast<size_t>(idx)].letter;
    }

    const int zone = UtmProjection::naturalZone(latitudeDeg, longitudeDeg);
    const UtmCoordinate utm = UtmProjection::forward(latitudeDeg, longitudeDeg, zone);

    const double cell = cellSize(precision);
    const double easting = std::floor((utm.easting + kTruncationEpsilon) / cell) * cell;
    double northing = std::floor((utm.northing + kTruncationEpsilon) / cell) * cell;
    if (!utm.northern && northing >= 10000000.0) northing = 0.0;

    const GridValues grid = gridValues(zone);

    double gridNorthing = std::fmod(northing, kTwoMillion) + grid.patternOffset;
    if (gridNorthing >= kTwoMillion) gridNorthing -= kTwoMillion;

    int rowIdx = static_cast<int>(gridNorthing / kOneHundredKm);
    if (rowIdx > 'H' - 'A') ++rowIdx;
    if (rowIdx > 'N' - 'A') ++rowIdx;

    int columnIdx = (grid.columnLow - 'A') + static_cast<int>(easting / kOneHundredKm) - 1;
    if (grid.columnLow == 'J' && columnIdx > 'N' - 'A') ++columnIdx;

    auto inSquare = [cell](double value) {
        double offset = std::fmod(value, kOneHundredKm);
        if (offset >= 99999.5) offset = 99999.0;
        return static_cast<long>((offset + kTruncationEpsilon) / cell);
    };

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02d%c%c%c", zone, bandLetter,
                  static_cast<char>('A' + columnIdx), static_cast<char>('A' + rowIdx));
    std::string out(buffer);
    if (precision > 0) {
        std::snprintf(buffer, sizeof(buffer), "%0*ld%0*ld", precision, inSquare(easting), precision, inSquare(northing));
        out += buffer;
    }
    return out;
}
