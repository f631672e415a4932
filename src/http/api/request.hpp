#ifndef TFE_REQUEST_HPP
#define TFE_REQUEST_HPP

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../../jsonapi/payload.hpp"
#include "../model/model.hpp"
#include "url.hpp"

namespace tfe::http::api {
    // Decodes a response body into one caller-owned value.
    struct SingleSink {
        std::function<void(const std::string& body)> decode_;
    };

    // Decodes a list response body into a caller-owned collection, in response order.
    struct CollectionSink {
        std::function<void(const std::string& body)> decode_;
    };

    using OutputSink = std::variant<std::monostate, SingleSink, CollectionSink>;

    template <typename T>
    SingleSink into(T& out) {
        return SingleSink{[&out](const std::string& body) { tfe::jsonapi::unmarshal_payload(body, out); }};
    }

    template <typename T>
    CollectionSink into(std::vector<T>& out) {
        return CollectionSink{[&out](const std::string& body) { out = tfe::jsonapi::unmarshal_many_payload<T>(body); }};
    }

    // Encodes value as a JSON:API document when the request is dispatched.
    template <typename T>
    std::function<std::string()> input(T value) {
        return [value = std::move(value)]() { return tfe::jsonapi::marshal_payload(value); };
    }

    template <typename T>
    std::function<std::string()> input(std::vector<T> values) {
        return [values = std::move(values)]() { return tfe::jsonapi::marshal_many_payload(values); };
    }

    // One API call. Built, handed to Client::execute once, then discarded.
    struct ApiRequest {
        std::string method_ = "GET";
        std::string path_;
        QueryParams query_;

        // When set, replaces the default (empty) header set instead of merging with it.
        std::optional<tfe::http::model::Headers> headers_;

        // Raw body. Ignored when input_ is set.
        std::optional<std::string> body_;
        std::function<std::string()> input_;

        OutputSink output_;
    };
}  // namespace tfe::http::api

#endif
