#include "client.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "../../utils/constants.hpp"
#include "../error/errors.hpp"
#include "../transport/curl_easy.hpp"
#include "status.hpp"
#include "url.hpp"

namespace tfe::http::api {
    Client::Client(const Config& config) : config_(default_config()) {
        // No safe default exists for the token.
        if (config.token_.empty()) {
            throw tfe::http::error::ConfigError("Missing client token");
        }

        config_.token_ = config.token_;
        if (!config.address_.empty()) {
            config_.address_ = config.address_;
        }
        if (!is_valid_address(config_.address_)) {
            throw tfe::http::error::ConfigError("Invalid client address: " + config_.address_);
        }

        if (config.transport_) {
            transport_ = config.transport_;
        } else {
            transport_ = std::make_shared<tfe::http::transport::CurlEasy>();
        }
        config_.transport_ = transport_;
    }

    tfe::http::model::Request Client::build_request(const ApiRequest& r) const {
        tfe::http::model::Request req;
        req.method_ = r.method_;
        req.url_ = compose_url(config_.address_, r.path_, r.query_);

        // Prefer the input value over a raw body.
        if (r.input_) {
            req.body_ = r.input_();
        } else if (r.body_) {
            req.body_ = r.body_;
        }

        if (r.headers_) {
            req.headers_ = *r.headers_;
        }
        req.headers_.set(constants::AUTHORIZATION, std::string(constants::BEARER_PREFIX) + config_.token_);
        if (req.headers_.get(constants::CONTENT_TYPE).empty()) {
            req.headers_.set(constants::CONTENT_TYPE, constants::JSONAPI_MEDIA_TYPE);
        }
        return req;
    }

    std::optional<tfe::http::model::Response> Client::execute(const ApiRequest& r) const {
        const tfe::http::model::Request req = build_request(r);

        tfe::http::model::Response resp = transport_->send(req);
        if (resp.effective_url_.empty()) {
            resp.effective_url_ = req.url_;
        }
        check_response_code(resp);

        if (const auto* single = std::get_if<SingleSink>(&r.output_)) {
            single->decode_(resp.body_);
            return std::nullopt;
        }
        if (const auto* collection = std::get_if<CollectionSink>(&r.output_)) {
            collection->decode_(resp.body_);
            return std::nullopt;
        }
        return resp;
    }

    std::unique_ptr<Client> new_client(const Config* config) {
        if (config == nullptr) {
            throw tfe::http::error::ConfigError("Missing client config");
        }
        return std::make_unique<Client>(*config);
    }
}  // namespace tfe::http::api
