#include "url.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>

#include "../error/errors.hpp"

namespace tfe::http::api {
    namespace {
        struct CurlUrlDeleter {
            void operator()(CURLU* u) const { curl_url_cleanup(u); }
        };
        using CurlUrl = std::unique_ptr<CURLU, CurlUrlDeleter>;

        CurlUrl parse(const std::string& address) {
            CurlUrl u(curl_url());
            if (!u || curl_url_set(u.get(), CURLUPART_URL, address.c_str(), 0) != CURLUE_OK) {
                return nullptr;
            }
            return u;
        }

        struct CurlEasyDeleter {
            void operator()(CURL* h) const { curl_easy_cleanup(h); }
        };

        // Percent-encodes everything outside the unreserved set, '=' and '&' included.
        std::string escape(CURL* h, const std::string& s) {
            char* out = curl_easy_escape(h, s.c_str(), static_cast<int>(s.size()));
            if (out == nullptr) {
                throw tfe::http::error::ClientError("Failed to encode query component: " + s);
            }
            std::string escaped(out);
            curl_free(out);
            return escaped;
        }

        void set_part(CURLU* u, CURLUPart part, const char* value, unsigned int flags, const std::string& what) {
            const auto rc = curl_url_set(u, part, value, flags);
            if (rc != CURLUE_OK) {
                throw tfe::http::error::ClientError("Invalid " + what + ": " + curl_url_strerror(rc));
            }
        }
    }  // namespace

    bool is_valid_address(const std::string& address) {
        CurlUrl u = parse(address);
        if (!u) {
            return false;
        }
        char* host = nullptr;
        if (curl_url_get(u.get(), CURLUPART_HOST, &host, 0) != CURLUE_OK) {
            return false;
        }
        const bool has_host = host != nullptr && host[0] != '\0';
        curl_free(host);
        return has_host;
    }

    std::string compose_url(const std::string& base, const std::string& path, const QueryParams& query) {
        CurlUrl u = parse(base);
        if (!u) {
            throw tfe::http::error::ConfigError("Invalid client address: " + base);
        }

        const std::string abs_path = (path.empty() || path.front() != '/') ? "/" + path : path;
        set_part(u.get(), CURLUPART_PATH, abs_path.c_str(), CURLU_URLENCODE, "request path");
        set_part(u.get(), CURLUPART_QUERY, nullptr, 0, "query");
        set_part(u.get(), CURLUPART_FRAGMENT, nullptr, 0, "fragment");
        if (!query.empty()) {
            const std::unique_ptr<CURL, CurlEasyDeleter> h(curl_easy_init());
            if (!h) {
                throw tfe::http::error::ClientError("Failed to create CURL easy handle");
            }
            for (const auto& [key, value] : query) {
                const std::string pair = escape(h.get(), key) + "=" + escape(h.get(), value);
                set_part(u.get(), CURLUPART_QUERY, pair.c_str(), CURLU_APPENDQUERY, "query parameter " + key);
            }
        }

        char* out = nullptr;
        const auto rc = curl_url_get(u.get(), CURLUPART_URL, &out, 0);
        if (rc != CURLUE_OK) {
            throw tfe::http::error::ClientError(std::string("Invalid request URL: ") + curl_url_strerror(rc));
        }
        std::string url(out);
        curl_free(out);
        return url;
    }
}  // namespace tfe::http::api
