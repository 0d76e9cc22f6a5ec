#pragma once
#include <stdexcept>
#include <string>

// I/O failures and unreadable on-disk pages.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

// A page, header or pool cannot be built from the given arguments.
class InvalidConstruction : public std::invalid_argument {
public:
    explicit InvalidConstruction(const std::string& what) : std::invalid_argument(what) {}
};

class UnsupportedOperation : public std::logic_error {
public:
    explicit UnsupportedOperation(const std::string& what) : std::logic_error(what) {}
};

class PageNotResident : public std::out_of_range {
public:
    explicit PageNotResident(const std::string& what) : std::out_of_range(what) {}
};
