#include "curl_global.hpp"

#include <curl/curl.h>

#include <string>

#include "../error/errors.hpp"

namespace tfe::http::transport {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw tfe::http::error::TransportError("", std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

    const CurlGlobal& CurlGlobal::instance() {
        static const CurlGlobal global;
        return global;
    }

}  // namespace tfe::http::transport
