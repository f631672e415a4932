#ifndef TFE_CLIENT_HPP
#define TFE_CLIENT_HPP

#include <memory>
#include <optional>
#include <string>

#include "../model/model.hpp"
#include "../transport/interface.hpp"
#include "config.hpp"
#include "request.hpp"

namespace tfe::http::api {
    // Connectivity and credentials for the API. Immutable once built, so one instance
    // can serve concurrent callers as long as its transport can.
    class Client {
       public:
        // Throws http::error::ConfigError on an empty token or an invalid address.
        explicit Client(const Config& config);

        [[nodiscard]] const std::string& address() const { return config_.address_; }
        [[nodiscard]] const std::string& token() const { return config_.token_; }
        [[nodiscard]] const std::shared_ptr<tfe::http::transport::ITransport>& transport() const { return transport_; }

        // Performs exactly one round trip. When r.output_ holds a sink the body is decoded into
        // it and std::nullopt is returned; otherwise the raw response is handed to the caller.
        std::optional<tfe::http::model::Response> execute(const ApiRequest& r) const;

        // Wire request for r, as execute() would send it.
        [[nodiscard]] tfe::http::model::Request build_request(const ApiRequest& r) const;

       private:
        Config config_;
        std::shared_ptr<tfe::http::transport::ITransport> transport_;
    };

    // Throws http::error::ConfigError("Missing client config") for a null config.
    std::unique_ptr<Client> new_client(const Config* config);
}  // namespace tfe::http::api

#endif
