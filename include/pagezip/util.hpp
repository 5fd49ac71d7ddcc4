#pragma once
#include <string>

namespace pagezip {

// mkdir -p; throws PersistFailure if a component cannot be created.
void ensure_dir(const std::string& path);
bool is_http_url(const std::string& s);
// Final '/'-separated segment of a URL.
std::string basename_of(const std::string& url);
std::string sanitize_title(const std::string& title);

} // namespace pagezip
