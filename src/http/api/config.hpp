#ifndef TFE_CONFIG_HPP
#define TFE_CONFIG_HPP

#include <memory>
#include <string>

#include "../transport/interface.hpp"

namespace tfe::http::api {
    struct Config {
        // Base address of the API. Empty means constants::DEFAULT_ADDRESS.
        std::string address_;

        // Bearer token. Required.
        std::string token_;

        // Custom transport. Empty means a default CurlEasy.
        std::shared_ptr<tfe::http::transport::ITransport> transport_;
    };

    Config default_config();
}  // namespace tfe::http::api

#endif
