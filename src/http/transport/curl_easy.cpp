#include "curl_easy.hpp"

#include <curl/curl.h>

#include <string>
#include <utility>
#include <vector>

#include "../../utils/string_utils.hpp"
#include "../error/errors.hpp"
#include "../model/model.hpp"
#include "curl_global.hpp"

namespace tfe::http::transport {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long CONNECT_TIMEOUT_MS = 30'000L;
        static constexpr long TIMEOUT_MS = 0L;  // no overall limit
        static constexpr const char* USER_AGENT = "tfe-cpp-client/1.0";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 30L;
        static constexpr long TCP_KEEPINTVL = 30L;
        static constexpr long MAX_CONNECTS = 16L;
        static constexpr long HTTP_GET = 1L;
        static constexpr long NO_BODY = 1L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
    };

    struct HeaderKeys {
        static constexpr const char* STATUS_LINE = "HTTP/";
        static constexpr const char* EXPECT = "Expect";
    };

    CurlEasy::CurlEasy() {
        CurlGlobal::instance();

        handle_ = curl_easy_init();
        if (handle_ == nullptr) {
            throw tfe::http::error::TransportError("", "Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
        enable_keepalive();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) {
        last_url_ = u;
        setopt(CURLOPT_URL, u.c_str());
    }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            curl_slist* next = curl_slist_append(headers_, h.c_str());
            if (next == nullptr) {
                throw tfe::http::error::TransportError(last_url_, "curl_slist_append failed");
            }
            headers_ = next;
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, CurlDefaults::CONNECT_TIMEOUT_MS);
        setopt(CURLOPT_TIMEOUT_MS, CurlDefaults::TIMEOUT_MS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_MAXCONNECTS, CurlDefaults::MAX_CONNECTS);
    }

    void CurlEasy::enable_keepalive() {
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::prepare_for_new_request(std::string& body) {
        // Clear per-request scratch
        last_response_headers_.clear();
        error_buf_[0] = '\0';
        body.clear();

        // Back to a plain GET before the method of this request is applied
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_NOBODY, 0L);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);
        setopt(CURLOPT_WRITEFUNCTION, &tfe::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
    }

    void CurlEasy::set_method(const tfe::http::model::Request& req) {
        if (req.method_ == "HEAD") {
            setopt(CURLOPT_NOBODY, CurlDefaults::NO_BODY);
            return;
        }

        if (req.body_) {
            setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(req.body_->size()));
            setopt(CURLOPT_POSTFIELDS, req.body_->c_str());
        }

        if (req.method_ != "GET" || req.body_) {
            setopt(CURLOPT_CUSTOMREQUEST, req.method_.c_str());
        }
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        // A new status line starts a new header block (redirects, 100 Continue).
        if (tfe::string_utils::ieq_prefix(buffer, bytes, HeaderKeys::STATUS_LINE)) {
            self->last_response_headers_.clear();
            return bytes;
        }

        const std::string line(buffer, bytes);
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return bytes;
        }

        self->last_response_headers_.add(tfe::string_utils::trim(line.substr(0, colon)), tfe::string_utils::trim(line.substr(colon + 1)));
        return bytes;
    }

    tfe::http::model::Response CurlEasy::send(const tfe::http::model::Request& req) {
        const std::lock_guard<std::mutex> lock(mutex_);

        std::vector<std::string> hdrs = req.headers_.to_lines();
        if (req.body_ && !req.headers_.has(HeaderKeys::EXPECT)) {
            hdrs.emplace_back("Expect:");
        }

        set_url(req.url_);
        set_headers(hdrs);

        std::string body;
        prepare_for_new_request(body);
        set_method(req);

        perform_throw(req.url_);
        return make_response(body);
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw tfe::http::error::TransportError(last_url_, std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }
    // explicit instantiations for used types (optional but can help some compilers)
    template void CurlEasy::setopt<long>(int, long);
    template void CurlEasy::setopt<const char*>(int, const char*);
    template void CurlEasy::setopt<void*>(int, void*);

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        std::string err = "curl_easy_perform failed: ";

        if (error_buf_[0] != '\0') {
            err += error_buf_.data();
        } else {
            err += curl_easy_strerror(rc);
        }

        throw tfe::http::error::TransportError(url, err);
    }

    tfe::http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        tfe::http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : last_url_;
        r.headers_ = std::move(last_response_headers_);
        return r;
    }

}  // namespace tfe::http::transport
