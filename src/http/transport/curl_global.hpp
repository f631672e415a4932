#ifndef TFE_CURL_GLOBAL_HPP
#define TFE_CURL_GLOBAL_HPP

namespace tfe::http::transport {

    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        // Process-wide instance, initialized on first use.
        static const CurlGlobal& instance();
    };

}  // namespace tfe::http::transport

#endif
