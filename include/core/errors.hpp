#ifndef GEOSPLIT_ERRORS_HPP
#define GEOSPLIT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace geosplit {
namespace core {

// Base of every error raised by geosplit
class GeoSplitError : public std::runtime_error {
public:
    explicit GeoSplitError(const std::string& message) : std::runtime_error(message) {}
};

// Missing or ambiguous option; raised while constructing a source
class ConfigurationError : public GeoSplitError {
public:
    explicit ConfigurationError(const std::string& message) : GeoSplitError(message) {}
};

// No override and no embedded CRS while reprojection is enabled; raised at reader start
class CRSUndeterminedError : public GeoSplitError {
public:
    explicit CRSUndeterminedError(const std::string& message) : GeoSplitError(message) {}
};

// Retryable I/O failure (network hiccup, throttling)
class TransientIOError : public GeoSplitError {
public:
    explicit TransientIOError(const std::string& message) : GeoSplitError(message) {}
};

// Failure that aborts the owning range only
class RangeFailure : public GeoSplitError {
public:
    explicit RangeFailure(const std::string& message) : GeoSplitError(message) {}
};

} // namespace core
} // namespace geosplit

#endif // GEOSPLIT_ERRORS_HPP
