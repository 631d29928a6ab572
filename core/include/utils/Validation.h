#ifndef VALIDATION_H
#define VALIDATION_H

#include <cstddef>
#include <stdexcept>
#include <string>

// Typed failures surfaced by the simulation core.
// Bad arguments (e.g. a voyage from an island to itself) use std::invalid_argument.
namespace validation {

// Lookup of an island id (or index) that is not registered
class NotFoundError : public std::out_of_range {
public:
    explicit NotFoundError(const std::string& what) : std::out_of_range(what) {}
};

// Operation is not possible in the current simulation state
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what) : std::logic_error(what) {}
};

inline void checkIndex(std::size_t index, std::size_t size, const char* context) {
    if (index >= size) {
        throw NotFoundError(std::string("Index out of range in ") + context + ": " +
                            std::to_string(index) + " >= " + std::to_string(size));
    }
}

inline void checkUnitInterval(double value, const char* field, const std::string& owner) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw std::invalid_argument(std::string(field) + " must be in [0,1] for '" + owner +
                                    "' (got " + std::to_string(value) + ")");
    }
}

} // namespace validation

#endif
