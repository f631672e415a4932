#ifndef TFE_CURL_EASY_HPP
#define TFE_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>
#include <string>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace tfe::http::transport {
    const size_t ERROR_BUFFER_SIZE = 256;

    // Default transport. One easy handle per instance so connections are reused
    // between requests; send() serializes access to it.
    class CurlEasy : public ITransport {
       public:
        CurlEasy();

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        tfe::http::model::Response send(const tfe::http::model::Request& req) override;

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void set_method(const tfe::http::model::Request& req);
        void perform_throw(const std::string& url);
        tfe::http::model::Response make_response(std::string& incoming_body);
        void set_defaults_once();
        void enable_keepalive();
        void prepare_for_new_request(std::string& body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        std::mutex mutex_;
        std::string last_url_;
        tfe::http::model::Headers last_response_headers_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace tfe::http::transport

#endif
