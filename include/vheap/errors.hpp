#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace vheap {

//! Base of all recoverable heap errors.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! A value was rejected before it could enter the heap.
class InvalidValue : public Error {
public:
    using Error::Error;
};

//! The key of a value could not be computed (projection threw or NaN).
class InvalidKey : public InvalidValue {
public:
    using InvalidValue::InvalidValue;
};

//! A mutating call was made while another one was in flight.
class ReentrantMutation : public Error {
public:
    explicit ReentrantMutation(const std::string &op)
        : Error("re-entrant heap mutation in '" + op + "'") {}
};

class EmptyHeap : public Error {
public:
    using Error::Error;
};

class IncompatibleHeaps : public Error {
public:
    using Error::Error;
};

/**
 * The heap property does not hold. This is a bug in the sift algorithms
 * or a key function that changed its mind, never an input error.
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace detail {

// Message of an in-flight exception, for error notifications
inline std::string describe(const std::exception_ptr &p) {
    try {
        std::rethrow_exception(p);
    } catch (const std::exception &e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace detail

} // namespace vheap
