#ifndef MGRS2LATLONG_EXCEPTIONS_H
#define MGRS2LATLONG_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Mgrs2LatLong {

class Mgrs2LatLongException : public std::runtime_error {
public:
    explicit Mgrs2LatLongException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public Mgrs2LatLongException {
public:
    explicit IOException(const std::string& message) : Mgrs2LatLongException("IO Error: " + message) {}
};

class DatasetException : public Mgrs2LatLongException {
public:
    explicit DatasetException(const std::string& message) : Mgrs2LatLongException("Dataset Error: " + message) {}
};

class ConfigurationException : public Mgrs2LatLongException {
public:
    explicit ConfigurationException(const std::string& message) : Mgrs2LatLongException("Configuration Error: " + message) {}
};

class ConversionException : public Mgrs2LatLongException {
public:
    explicit ConversionException(const std::string& message) : Mgrs2LatLongException("Conversion Error: " + message) {}
};

// The projection backend could not be set up; unlike ConversionException this
// is never treated as a per-row failure.
class ProjectionException : public Mgrs2LatLongException {
public:
    explicit ProjectionException(const std::string& message) : Mgrs2LatLongException("Projection Error: " + message) {}
};

} // namespace Mgrs2LatLong

#endif // MGRS2LATLONG_EXCEPTIONS_H
