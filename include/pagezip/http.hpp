#pragma once
#include "pagezip/image.hpp"

#include <string>

namespace pagezip {

class Fetcher {
public:
    virtual ~Fetcher() = default;
    // Full response body of a single GET. Throws InvalidReference or FetchFailure.
    virtual Bytes fetch(const std::string& url) const = 0;
};

class HttpClient : public Fetcher {
public:
    HttpClient();
    Bytes fetch(const std::string& url) const override;

    std::string user_agent = "pagezip/1.0";
    bool follow_redirects = true;
};

} // namespace pagezip
