#ifndef LAGRANGE_ERROR_H
#define LAGRANGE_ERROR_H

#include <stdexcept>
#include <string>

namespace lagrange {

/// Invalid or inconsistent usage: bad filter frequencies, writes before a
/// group is selected, unknown groups, mismatched particle arrays.
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/// A request outside the data at hand, e.g. a center index beyond the
/// buffered window.
class DomainError : public std::runtime_error
{
public:
    explicit DomainError(const std::string& what) : std::runtime_error(what) {}
};

/// Failure to create, grow or read backing storage.
class ResourceError : public std::runtime_error
{
public:
    explicit ResourceError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace lagrange

#endif // LAGRANGE_ERROR_H
