#include "payload.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <string>
#include <vector>

#include "../http/error/errors.hpp"
#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"

using namespace simdjson;

namespace tfe::jsonapi {
    namespace {
        std::string encode_document(nlohmann::json data) {
            try {
                nlohmann::json doc = nlohmann::json::object();
                doc["data"] = std::move(data);
                return doc.dump();
            } catch (const nlohmann::json::exception& e) {
                throw tfe::http::error::EncodeError("Failed to encode JSON:API payload: " + std::string(e.what()));
            }
        }

        std::string describe_errors(dom::array errors) {
            std::string msg = "JSON:API error document";
            for (dom::element e : errors) {
                std::string_view title;
                std::string_view detail;
                const bool has_title = e["title"].get(title) == SUCCESS;
                const bool has_detail = e["detail"].get(detail) == SUCCESS;
                if (!has_title && !has_detail) {
                    continue;
                }
                msg += "\n  ";
                msg += has_title ? title : detail;
                if (has_title && has_detail) {
                    msg += ": ";
                    msg += detail;
                }
            }
            return msg;
        }

        dom::element primary_data(const dom::object& doc) {
            dom::element data;
            if (doc["data"].get(data) == SUCCESS) {
                return data;
            }
            dom::array errors;
            if (doc["errors"].get(errors) == SUCCESS) {
                throw tfe::http::error::DecodeError("", describe_errors(errors));
            }
            throw tfe::http::error::DecodeError("", "payload has no primary \"data\" member");
        }

        ResourceReader checked_reader(const dom::element& el, const std::string& type) {
            dom::object obj;
            if (el.get(obj) != SUCCESS) {
                throw tfe::http::error::DecodeError("", "resource is not an object");
            }
            ResourceReader reader(obj);
            if (reader.type() != type) {
                throw tfe::http::error::DecodeError("", "resource type \"" + reader.type() + "\" does not match expected \"" + type + "\"");
            }
            return reader;
        }

        // Parses body and runs fn against its primary data, reporting every failure as a
        // DecodeError that carries a preview of the body.
        void with_primary_data(const std::string& body, const std::function<void(const dom::element&)>& fn) {
            const std::string preview = tfe::string_utils::preview(body, constants::BODY_PREVIEW_LENGTH);
            try {
                dom::parser parser;
                padded_string json(body);
                dom::object doc = parser.parse(json).get_object();
                fn(primary_data(doc));
            } catch (const simdjson_error& e) {
                throw tfe::http::error::DecodeError(preview, "Failed to parse JSON:API payload: " + std::string(e.what()));
            } catch (const tfe::http::error::DecodeError& e) {
                throw tfe::http::error::DecodeError(preview, e.what());
            }
        }
    }  // namespace

    std::string encode_one(const Resource& resource) { return encode_document(resource.to_json()); }

    std::string encode_many(const std::vector<Resource>& resources) {
        nlohmann::json data = nlohmann::json::array();
        for (const auto& r : resources) {
            data.push_back(r.to_json());
        }
        return encode_document(std::move(data));
    }

    void decode_one(const std::string& body, const std::string& type, const std::function<void(const ResourceReader&)>& fn) {
        with_primary_data(body, [&](const dom::element& data) {
            if (data.is_array()) {
                throw tfe::http::error::DecodeError("", "expected a single resource but \"data\" is an array");
            }
            if (data.is_null()) {
                throw tfe::http::error::DecodeError("", "expected a single resource but \"data\" is null");
            }
            fn(checked_reader(data, type));
        });
    }

    void decode_many(const std::string& body, const std::string& type, const std::function<void(const ResourceReader&)>& fn) {
        with_primary_data(body, [&](const dom::element& data) {
            dom::array items;
            if (data.get(items) != SUCCESS) {
                throw tfe::http::error::DecodeError("", "expected a list of resources but \"data\" is not an array");
            }
            for (dom::element item : items) {
                fn(checked_reader(item, type));
            }
        });
    }
}  // namespace tfe::jsonapi
