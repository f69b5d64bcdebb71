/**
 * @file errors.hpp
 * @brief Exception types raised by configuration, construction and run validation.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace core {

/**
 * @class InvalidConfiguration
 * @brief A configuration or market model field is out of bounds.
 */
class InvalidConfiguration : public std::invalid_argument {
public:
    explicit InvalidConfiguration(const std::string& what)
        : std::invalid_argument("InvalidConfiguration: " + what) {}
};

/**
 * @class TypeMismatch
 * @brief A supplied collection holds an element that is not a valid entity of the expected kind.
 */
class TypeMismatch : public std::invalid_argument {
public:
    explicit TypeMismatch(const std::string& what)
        : std::invalid_argument("TypeMismatch: " + what) {}
};

/**
 * @class InvalidArgument
 * @brief Run bounds or step size are invalid.
 */
class InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& what)
        : std::invalid_argument("InvalidArgument: " + what) {}
};

/**
 * @class DataInconsistency
 * @brief Historical data or collaborator state disagree with each other.
 */
class DataInconsistency : public std::runtime_error {
public:
    explicit DataInconsistency(const std::string& what)
        : std::runtime_error("DataInconsistency: " + what) {}
};

}
