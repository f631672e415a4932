#ifndef TFE_URL_HPP
#define TFE_URL_HPP

#include <map>
#include <string>

namespace tfe::http::api {
    // Multiple values per key are allowed; keys are emitted in sorted order.
    using QueryParams = std::multimap<std::string, std::string>;

    // Absolute URL with a scheme and a host.
    bool is_valid_address(const std::string& address);

    // Replaces the path, query and fragment of base. Throws http::error::ConfigError for a
    // bad base and http::error::ClientError for a path or query libcurl rejects.
    std::string compose_url(const std::string& base, const std::string& path, const QueryParams& query);
}  // namespace tfe::http::api

#endif
