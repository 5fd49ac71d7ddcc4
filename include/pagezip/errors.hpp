#pragma once
#include <stdexcept>
#include <string>

namespace pagezip {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Empty or malformed image reference, rejected before any network call.
class InvalidReference : public Error {
public:
    explicit InvalidReference(const std::string& what) : Error(what) {}
};

// Transport failure or non-success HTTP status. status == 0 when no response was received.
class FetchFailure : public Error {
public:
    FetchFailure(const std::string& url, long status, const std::string& what)
        : Error(what), url_(url), status_(status) {}

    const std::string& url() const { return url_; }
    long status() const { return status_; }

private:
    std::string url_;
    long status_;
};

class ArchiveFailure : public Error {
public:
    explicit ArchiveFailure(const std::string& what) : Error(what) {}
};

class PersistFailure : public Error {
public:
    explicit PersistFailure(const std::string& what) : Error(what) {}
};

} // namespace pagezip
