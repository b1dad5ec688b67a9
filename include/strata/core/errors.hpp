#pragma once

#include <stdexcept>
#include <string>

namespace strata::core {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Target region is not resident in the block store.
class LoadError : public Error {
public:
    using Error::Error;
};

// Search frontier exhausted without reaching the goal.
class NoPathFound : public Error {
public:
    using Error::Error;
};

// A coordinate lies outside the scanned domain.
class OutOfBounds : public Error {
public:
    using Error::Error;
};

class InvalidShapeParams : public Error {
public:
    using Error::Error;
};

class TemplateFormatError : public Error {
public:
    using Error::Error;
};

} // namespace strata::core
