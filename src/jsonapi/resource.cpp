#include "resource.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <string>
#include <utility>

#include "../http/error/errors.hpp"

namespace tfe::jsonapi {
    namespace {
        [[noreturn]] void fail(const std::string& msg) { throw tfe::http::error::DecodeError("", msg); }

        template <typename T>
        T convert(const simdjson::dom::element& el, std::string_view key, const char* kind) {
            T value{};
            if (el.get(value) != simdjson::SUCCESS) {
                fail("attribute \"" + std::string(key) + "\" is not " + kind);
            }
            return value;
        }

        // Ids are strings on the wire; some servers send numbers anyway.
        std::string read_id(const simdjson::dom::object& obj) {
            simdjson::dom::element el;
            if (obj["id"].get(el) != simdjson::SUCCESS || el.is_null()) {
                return {};
            }
            std::string_view sv;
            if (el.get(sv) == simdjson::SUCCESS) {
                return std::string(sv);
            }
            int64_t n = 0;
            if (el.get(n) == simdjson::SUCCESS) {
                return std::to_string(n);
            }
            fail("resource \"id\" is not a string");
        }

        ResourceIdentifier read_identifier(const simdjson::dom::element& el, std::string_view name) {
            simdjson::dom::object obj;
            std::string_view type;
            if (el.get(obj) != simdjson::SUCCESS || obj["type"].get(type) != simdjson::SUCCESS) {
                fail("relationship \"" + std::string(name) + "\" holds an invalid resource identifier");
            }
            return ResourceIdentifier{.type_ = std::string(type), .id_ = read_id(obj)};
        }

        std::optional<simdjson::dom::object> optional_member_object(const simdjson::dom::object& obj, const char* key) {
            simdjson::dom::element el;
            const auto err = obj[key].get(el);
            if (err == simdjson::NO_SUCH_FIELD || (err == simdjson::SUCCESS && el.is_null())) {
                return std::nullopt;
            }
            simdjson::dom::object out;
            if (err != simdjson::SUCCESS || el.get(out) != simdjson::SUCCESS) {
                fail(std::string("resource \"") + key + "\" is not an object");
            }
            return out;
        }
    }  // namespace

    Resource::Resource(std::string type, std::string id) : type_(std::move(type)), id_(std::move(id)) {}

    Resource& Resource::with_attribute(const std::string& key, nlohmann::json value) {
        attributes_[key] = std::move(value);
        return *this;
    }

    Resource& Resource::with_to_one(const std::string& name, std::optional<ResourceIdentifier> target) {
        Relationship rel;
        if (target) {
            rel.data_.push_back(std::move(*target));
        }
        relationships_[name] = std::move(rel);
        return *this;
    }

    Resource& Resource::with_to_many(const std::string& name, std::vector<ResourceIdentifier> targets) {
        relationships_[name] = Relationship{.to_many_ = true, .data_ = std::move(targets)};
        return *this;
    }

    nlohmann::json Resource::to_json() const {
        auto identifier = [](const ResourceIdentifier& ri) { return nlohmann::json{{"type", ri.type_}, {"id", ri.id_}}; };

        nlohmann::json out = nlohmann::json::object();
        out["type"] = type_;
        if (!id_.empty()) {
            out["id"] = id_;
        }
        if (!attributes_.empty()) {
            out["attributes"] = attributes_;
        }
        if (relationships_.empty()) {
            return out;
        }

        nlohmann::json rels = nlohmann::json::object();
        for (const auto& [name, rel] : relationships_) {
            nlohmann::json data;
            if (rel.to_many_) {
                data = nlohmann::json::array();
                for (const auto& ri : rel.data_) {
                    data.push_back(identifier(ri));
                }
            } else if (!rel.data_.empty()) {
                data = identifier(rel.data_.front());
            }
            rels[name]["data"] = std::move(data);
        }
        out["relationships"] = std::move(rels);
        return out;
    }

    ResourceReader::ResourceReader(simdjson::dom::object resource) {
        std::string_view type;
        if (resource["type"].get(type) != simdjson::SUCCESS) {
            fail("resource object has no string \"type\"");
        }
        type_ = std::string(type);
        id_ = read_id(resource);
        attributes_ = optional_member_object(resource, "attributes");
        relationships_ = optional_member_object(resource, "relationships");
    }

    bool ResourceReader::has_attribute(std::string_view key) const { return find_attribute(key).has_value(); }

    std::optional<simdjson::dom::element> ResourceReader::find_attribute(std::string_view key) const {
        if (!attributes_) {
            return std::nullopt;
        }
        simdjson::dom::element el;
        if ((*attributes_)[key].get(el) != simdjson::SUCCESS) {
            return std::nullopt;
        }
        return el;
    }

    simdjson::dom::element ResourceReader::require_attribute(std::string_view key) const {
        auto el = find_attribute(key);
        if (!el) {
            fail("missing attribute \"" + std::string(key) + "\" on " + type_ + " resource");
        }
        return *el;
    }

    std::string ResourceReader::string_attribute(std::string_view key) const {
        return std::string(convert<std::string_view>(require_attribute(key), key, "a string"));
    }

    bool ResourceReader::bool_attribute(std::string_view key) const { return convert<bool>(require_attribute(key), key, "a boolean"); }

    int64_t ResourceReader::int_attribute(std::string_view key) const { return convert<int64_t>(require_attribute(key), key, "an integer"); }

    double ResourceReader::double_attribute(std::string_view key) const { return convert<double>(require_attribute(key), key, "a number"); }

    std::optional<std::string> ResourceReader::optional_string_attribute(std::string_view key) const {
        auto el = find_attribute(key);
        if (!el || el->is_null()) {
            return std::nullopt;
        }
        return std::string(convert<std::string_view>(*el, key, "a string"));
    }

    std::optional<bool> ResourceReader::optional_bool_attribute(std::string_view key) const {
        auto el = find_attribute(key);
        if (!el || el->is_null()) {
            return std::nullopt;
        }
        return convert<bool>(*el, key, "a boolean");
    }

    std::optional<int64_t> ResourceReader::optional_int_attribute(std::string_view key) const {
        auto el = find_attribute(key);
        if (!el || el->is_null()) {
            return std::nullopt;
        }
        return convert<int64_t>(*el, key, "an integer");
    }

    std::optional<double> ResourceReader::optional_double_attribute(std::string_view key) const {
        auto el = find_attribute(key);
        if (!el || el->is_null()) {
            return std::nullopt;
        }
        return convert<double>(*el, key, "a number");
    }

    std::optional<simdjson::dom::element> ResourceReader::find_linkage(std::string_view name) const {
        if (!relationships_) {
            return std::nullopt;
        }
        simdjson::dom::element rel;
        if ((*relationships_)[name].get(rel) != simdjson::SUCCESS) {
            return std::nullopt;
        }
        simdjson::dom::element data;
        if (!rel.is_object() || rel["data"].get(data) != simdjson::SUCCESS) {
            return std::nullopt;  // links-only relationship
        }
        return data;
    }

    std::optional<ResourceIdentifier> ResourceReader::to_one(std::string_view name) const {
        auto data = find_linkage(name);
        if (!data || data->is_null()) {
            return std::nullopt;
        }
        if (data->is_array()) {
            fail("relationship \"" + std::string(name) + "\" is to-many");
        }
        return read_identifier(*data, name);
    }

    std::vector<ResourceIdentifier> ResourceReader::to_many(std::string_view name) const {
        std::vector<ResourceIdentifier> out;
        auto data = find_linkage(name);
        if (!data || data->is_null()) {
            return out;
        }
        simdjson::dom::array items;
        if (data->get(items) != simdjson::SUCCESS) {
            fail("relationship \"" + std::string(name) + "\" is to-one");
        }
        for (simdjson::dom::element item : items) {
            out.push_back(read_identifier(item, name));
        }
        return out;
    }
}  // namespace tfe::jsonapi
