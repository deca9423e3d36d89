#pragma once

struct GeoPair {
    double latitude = 0.0;  // degrees, north positive
    double longitude = 0.0; // degrees, east positive
};

struct UtmCoordinate {
    int zone = 0;
    bool northern = true;
    double easting = 0.0;  // meters
    double northing = 0.0; // meters
};
