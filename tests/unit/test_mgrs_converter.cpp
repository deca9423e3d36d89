#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "Mgrs2LatLongExceptions.h"
#include "MgrsConverter.h"
#include "UtmProjection.h"

// ═══════════════════════════════════════════════════════════════════════════
// parse
// ═══════════════════════════════════════════════════════════════════════════

TEST(MgrsParse, Components)
{
    const MgrsReference ref = MgrsConverter::parse("33TWN1234567890");
    EXPECT_EQ(ref.zone, 33);
    EXPECT_EQ(ref.band, 'T');
    EXPECT_EQ(ref.column, 'W');
    EXPECT_EQ(ref.row, 'N');
    EXPECT_EQ(ref.precision, 5);
    EXPECT_DOUBLE_EQ(ref.easting, 12345.5);
    EXPECT_DOUBLE_EQ(ref.northing, 67890.5);
}

TEST(MgrsParse, LowerCaseAndSpaces)
{
    const MgrsReference ref = MgrsConverter::parse("4q fj 123 678");
    EXPECT_EQ(ref.zone, 4);
    EXPECT_EQ(ref.band, 'Q');
    EXPECT_EQ(ref.precision, 3);
    EXPECT_DOUBLE_EQ(ref.easting, 12350.0);
    EXPECT_DOUBLE_EQ(ref.northing, 67850.0);
}

TEST(MgrsParse, SquareOnlyIsCentred)
{
    const MgrsReference ref = MgrsConverter::parse("33TWN");
    EXPECT_EQ(ref.precision, 0);
    EXPECT_DOUBLE_EQ(ref.easting, 50000.0);
    EXPECT_DOUBLE_EQ(ref.northing, 50000.0);
}

TEST(MgrsParse, Rejections)
{
    const std::vector<std::string> invalid = {
        "",
        "TWN12345678",       // no zone
        "333TWN1234",        // three zone digits
        "0TWN1234",          // zone 0
        "61TWN1234",         // zone 61
        "33TWN123",          // odd digit count
        "33TWN123456789012", // six digits per axis
        "33IWN1234",         // band I
        "33AWN1234",         // polar band
        "33TON1234",         // column O
        "33TWI1234",         // row I
        "33TW1234",          // one square letter
        "33TWN1234X",        // trailing garbage
        "33TWN12-34",
    };
    for (const auto& s : invalid) {
        EXPECT_THROW(MgrsConverter::parse(s), Mgrs2LatLong::ConversionException) << s;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// toLatLon
// ═══════════════════════════════════════════════════════════════════════════

TEST(MgrsToLatLon, EquatorOnCentralMeridian)
{
    MgrsConverter converter;
    const auto p = converter.toLatLon("31NEA0000000000");
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->latitude, 0.0, 1e-4);
    EXPECT_NEAR(p->longitude, 3.0, 1e-4);
}

TEST(MgrsToLatLon, WashingtonMonument)
{
    MgrsConverter converter;
    const auto p = converter.toLatLon("18SUJ2348306479");
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->latitude, 38.8895, 0.01);
    EXPECT_NEAR(p->longitude, -77.0352, 0.01);
}

TEST(MgrsToLatLon, ScenarioValue)
{
    MgrsConverter converter;
    const auto p = converter.toLatLon("33TWN1234567890");
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->latitude, 47.56, 0.05);
    EXPECT_NEAR(p->longitude, 15.16, 0.05);
}

TEST(MgrsToLatLon, SouthernHemisphere)
{
    MgrsConverter converter;
    const std::string ref = MgrsConverter::fromLatLon(-33.8688, 151.2093);
    EXPECT_EQ(ref.substr(0, 3), "56H");
    const auto p = converter.toLatLon(ref);
    ASSERT_TRUE(p.has_value());
    EXPECT_NEAR(p->latitude, -33.8688, 1e-4);
    EXPECT_NEAR(p->longitude, 151.2093, 1e-4);
}

TEST(MgrsToLatLon, FailuresAreAbsentNotThrown)
{
    MgrsConverter converter;
    EXPECT_FALSE(converter.toLatLon("33TWN123").has_value());
    EXPECT_FALSE(converter.toLatLon("garbage").has_value());
    EXPECT_FALSE(converter.toLatLon("").has_value());
}

TEST(MgrsToLatLon, SquareNotInZoneSet)
{
    // Zone 33 uses column letters S..Z.
    MgrsConverter converter;
    EXPECT_FALSE(converter.toLatLon("33TAN1234567890").has_value());
    // Row letters stop at V.
    EXPECT_FALSE(converter.toLatLon("33TWW1234567890").has_value());
}

TEST(MgrsToLatLon, SvalbardGapZones)
{
    MgrsConverter converter;
    EXPECT_FALSE(converter.toLatLon("32XNL1234567890").has_value());
    EXPECT_FALSE(converter.toLatLon("34XDL1234567890").has_value());
    EXPECT_FALSE(converter.toLatLon("36XVL1234567890").has_value());
}

TEST(MgrsToLatLon, NorwayExtensionOf31V)
{
    MgrsConverter converter;
    EXPECT_FALSE(converter.toLatLon("31VEJ1234567890").has_value());
}

TEST(MgrsToLatLon, PositionOutsideDeclaredBand)
{
    // Row V in zone 31 band N lands near 17 degrees north (band Q).
    MgrsConverter converter;
    EXPECT_FALSE(converter.toLatLon("31NEV0000000000").has_value());
}

TEST(MgrsToLatLon, GeodeticThrowsWithReference)
{
    try {
        MgrsConverter::toGeodetic("33TWN123");
        FAIL() << "expected ConversionException";
    } catch (const Mgrs2LatLong::ConversionException& e) {
        EXPECT_NE(std::string(e.what()).find("33TWN123"), std::string::npos);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// fromLatLon
// ═══════════════════════════════════════════════════════════════════════════

TEST(MgrsFromLatLon, EquatorOnCentralMeridian)
{
    EXPECT_EQ(MgrsConverter::fromLatLon(0.0, 3.0), "31NEA0000000000");
}

TEST(MgrsFromLatLon, PrecisionControlsLength)
{
    EXPECT_EQ(MgrsConverter::fromLatLon(47.56, 15.16, 0).size(), 5u);
    EXPECT_EQ(MgrsConverter::fromLatLon(47.56, 15.16, 1).size(), 7u);
    EXPECT_EQ(MgrsConverter::fromLatLon(47.56, 15.16, 5).size(), 15u);
}

TEST(MgrsFromLatLon, ZoneExceptions)
{
    EXPECT_EQ(MgrsConverter::fromLatLon(60.0, 5.5).substr(0, 3), "32V");
    EXPECT_EQ(MgrsConverter::fromLatLon(78.2, 15.6).substr(0, 3), "33X");
    EXPECT_EQ(MgrsConverter::fromLatLon(78.2, 8.0).substr(0, 3), "31X");
}

TEST(MgrsFromLatLon, OutOfRange)
{
    EXPECT_THROW(MgrsConverter::fromLatLon(85.0, 0.0), Mgrs2LatLong::ConversionException);
    EXPECT_THROW(MgrsConverter::fromLatLon(-81.0, 0.0), Mgrs2LatLong::ConversionException);
    EXPECT_THROW(MgrsConverter::fromLatLon(10.0, 10.0, 6), Mgrs2LatLong::ConversionException);
}

// ═══════════════════════════════════════════════════════════════════════════
// Round trip through the inverse
// ═══════════════════════════════════════════════════════════════════════════

struct SamplePoint {
    double lat;
    double lon;
};

TEST(MgrsRoundTrip, MeterPrecision)
{
    const std::vector<SamplePoint> points = {
        {47.5642, 15.1644},  {38.8895, -77.0352}, {-33.8688, 151.2093}, {51.5007, -0.1246},
        {-22.9519, -43.2105}, {35.6586, 139.7454}, {60.0, 5.5},          {78.2, 15.6},
        {-79.5, -120.0},     {83.9, 40.0},        {0.5, -179.9},        {47.99999, 10.0},
        {1.2833, 103.8511},  {-54.8019, -68.3030},
    };

    MgrsConverter converter;
    for (const auto& pt : points) {
        const std::string ref = MgrsConverter::fromLatLon(pt.lat, pt.lon);
        const auto back = converter.toLatLon(ref);
        ASSERT_TRUE(back.has_value()) << ref;
        EXPECT_NEAR(back->latitude, pt.lat, 2e-5) << ref;
        EXPECT_NEAR(back->longitude, pt.lon, 1e-4) << ref;
    }
}

TEST(MgrsRoundTrip, ReferenceReencodesToItself)
{
    MgrsConverter converter;
    for (const std::string ref : {"33TWN1234567890", "18SUJ2348306479", "56HLH3436051993"}) {
        const auto p = converter.toLatLon(ref);
        ASSERT_TRUE(p.has_value()) << ref;
        EXPECT_EQ(MgrsConverter::fromLatLon(p->latitude, p->longitude), ref);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// UtmProjection
// ═══════════════════════════════════════════════════════════════════════════

TEST(UtmProjectionTest, CentralMeridian)
{
    EXPECT_DOUBLE_EQ(UtmProjection::centralMeridian(1), -177.0);
    EXPECT_DOUBLE_EQ(UtmProjection::centralMeridian(31), 3.0);
    EXPECT_DOUBLE_EQ(UtmProjection::centralMeridian(60), 177.0);
}

TEST(UtmProjectionTest, EpsgCode)
{
    EXPECT_EQ(UtmProjection::epsgCode(33, true), 32633);
    EXPECT_EQ(UtmProjection::epsgCode(1, false), 32701);
    EXPECT_EQ(UtmProjection::epsgCode(60, false), 32760);
    EXPECT_THROW(UtmProjection::epsgCode(0, true), Mgrs2LatLong::ConversionException);
    EXPECT_THROW(UtmProjection::epsgCode(61, false), Mgrs2LatLong::ConversionException);
}

TEST(UtmProjectionTest, NaturalZone)
{
    EXPECT_EQ(UtmProjection::naturalZone(0.0, -180.0), 1);
    EXPECT_EQ(UtmProjection::naturalZone(0.0, 179.9), 60);
    EXPECT_EQ(UtmProjection::naturalZone(0.0, 3.0), 31);
    EXPECT_EQ(UtmProjection::naturalZone(60.0, 5.5), 32);
    EXPECT_EQ(UtmProjection::naturalZone(75.0, 20.0), 33);
    EXPECT_EQ(UtmProjection::naturalZone(75.0, 40.0), 37);
}

TEST(UtmProjectionTest, EquatorScaleFactor)
{
    const UtmCoordinate utm = UtmProjection::forward(0.0, 3.0, 31);
    EXPECT_TRUE(utm.northern);
    EXPECT_NEAR(utm.easting, 500000.0, 1e-6);
    EXPECT_NEAR(utm.northing, 0.0, 1e-6);
}

TEST(UtmProjectionTest, ForwardInverse)
{
    const UtmCoordinate utm = UtmProjection::forward(-41.2865, 174.7762, 60);
    EXPECT_FALSE(utm.northern);
    const GeoPair back = UtmProjection::inverse(utm);
    EXPECT_NEAR(back.latitude, -41.2865, 1e-8);
    EXPECT_NEAR(back.longitude, 174.7762, 1e-8);
}

TEST(UtmProjectionTest, MatchesReferenceSolutions)
{
    // Cell centres of 18SUJ2348306479 (1 m) and 4QFJ12345678 (10 m).
    const GeoPair washington = MgrsConverter::toGeodetic("18SUJ2348306479");
    EXPECT_NEAR(washington.latitude, 38.889467394963006, 1e-7);
    EXPECT_NEAR(washington.longitude, -77.03523639044597, 1e-7);

    const GeoPair honolulu = MgrsConverter::toGeodetic("4QFJ12345678");
    EXPECT_NEAR(honolulu.latitude, 21.309478094061582, 1e-7);
    EXPECT_NEAR(honolulu.longitude, -157.91681890577362, 1e-7);
}

TEST(UtmProjectionTest, SouthernHemisphereUsesFalseNorthing)
{
    const UtmCoordinate utm = UtmProjection::forward(-0.000001, 3.0, 31);
    EXPECT_FALSE(utm.northern);
    EXPECT_NEAR(utm.northing, 10000000.0, 1.0);
}
