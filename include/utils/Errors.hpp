#pragma once
#include <stdexcept>
#include <string>

namespace Pequod {

// I/O failures and constraint violations inside the local store.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A write that references a feed or entry that does not exist. Always a bug.
class ReferentialError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Handled exactly like FetchError by every caller.
class TimeoutError : public FetchError {
public:
    using FetchError::FetchError;
};

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ResolutionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
