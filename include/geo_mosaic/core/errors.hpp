#pragma once

#include <stdexcept>
#include <string>

namespace geo_mosaic {

class GeoMosaicError : public std::runtime_error {
public:
    explicit GeoMosaicError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public GeoMosaicError {
public:
    explicit ConfigError(const std::string& message)
        : GeoMosaicError("Config error: " + message) {}
};

class ValidationError : public GeoMosaicError {
public:
    explicit ValidationError(const std::string& message)
        : GeoMosaicError("Validation error: " + message) {}
};

class IOError : public GeoMosaicError {
public:
    explicit IOError(const std::string& message)
        : GeoMosaicError("I/O error: " + message) {}
};

class RasterDecodeError : public IOError {
public:
    explicit RasterDecodeError(const std::string& message)
        : IOError("Raster decode error: " + message) {}
};

class OverlayDecodeError : public IOError {
public:
    explicit OverlayDecodeError(const std::string& message)
        : IOError("Overlay decode error: " + message) {}
};

class NormalizationError : public GeoMosaicError {
public:
    explicit NormalizationError(const std::string& message)
        : GeoMosaicError("Normalization error: " + message) {}
};

class EmptyMosaicError : public GeoMosaicError {
public:
    EmptyMosaicError() : GeoMosaicError("Empty mosaic: no tile extents were folded") {}
    explicit EmptyMosaicError(const std::string& message)
        : GeoMosaicError("Empty mosaic: " + message) {}
};

class RenderError : public GeoMosaicError {
public:
    explicit RenderError(const std::string& message)
        : GeoMosaicError("Render error: " + message) {}
};

} // namespace geo_mosaic
