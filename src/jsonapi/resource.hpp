#ifndef TFE_JSONAPI_RESOURCE_HPP
#define TFE_JSONAPI_RESOURCE_HPP

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tfe::jsonapi {
    struct ResourceIdentifier {
        std::string type_;
        std::string id_;

        bool operator==(const ResourceIdentifier&) const = default;
    };

    struct Relationship {
        bool to_many_ = false;
        // to-one: empty means null linkage
        std::vector<ResourceIdentifier> data_;
    };

    // Write side of a resource object: {type, id, attributes, relationships}.
    class Resource {
       public:
        explicit Resource(std::string type, std::string id = {});

        Resource& with_attribute(const std::string& key, nlohmann::json value);
        Resource& with_to_one(const std::string& name, std::optional<ResourceIdentifier> target);
        Resource& with_to_many(const std::string& name, std::vector<ResourceIdentifier> targets);

        [[nodiscard]] const std::string& type() const { return type_; }
        [[nodiscard]] const std::string& id() const { return id_; }
        [[nodiscard]] nlohmann::json to_json() const;

       private:
        std::string type_;
        std::string id_;
        nlohmann::json attributes_ = nlohmann::json::object();
        std::map<std::string, Relationship> relationships_;
    };

    // Read side of a resource object. Only valid while the parsed document lives.
    // Accessors throw http::error::DecodeError naming the offending member.
    class ResourceReader {
       public:
        explicit ResourceReader(simdjson::dom::object resource);

        [[nodiscard]] const std::string& type() const { return type_; }
        [[nodiscard]] const std::string& id() const { return id_; }

        [[nodiscard]] bool has_attribute(std::string_view key) const;

        [[nodiscard]] std::string string_attribute(std::string_view key) const;
        [[nodiscard]] bool bool_attribute(std::string_view key) const;
        [[nodiscard]] int64_t int_attribute(std::string_view key) const;
        [[nodiscard]] double double_attribute(std::string_view key) const;

        // Missing and null members both read as std::nullopt.
        [[nodiscard]] std::optional<std::string> optional_string_attribute(std::string_view key) const;
        [[nodiscard]] std::optional<bool> optional_bool_attribute(std::string_view key) const;
        [[nodiscard]] std::optional<int64_t> optional_int_attribute(std::string_view key) const;
        [[nodiscard]] std::optional<double> optional_double_attribute(std::string_view key) const;

        [[nodiscard]] std::optional<ResourceIdentifier> to_one(std::string_view name) const;
        [[nodiscard]] std::vector<ResourceIdentifier> to_many(std::string_view name) const;

       private:
        [[nodiscard]] std::optional<simdjson::dom::element> find_attribute(std::string_view key) const;
        [[nodiscard]] simdjson::dom::element require_attribute(std::string_view key) const;
        [[nodiscard]] std::optional<simdjson::dom::element> find_linkage(std::string_view name) const;

        std::string type_;
        std::string id_;
        std::optional<simdjson::dom::object> attributes_;
        std::optional<simdjson::dom::object> relationships_;
    };

    // Specialize for every model type sent or received:
    //
    //   template <>
    //   struct ResourceTraits<Workspace> {
    //       static constexpr const char* TYPE = "workspaces";
    //       static Resource to_resource(const Workspace& w);
    //       static void from_resource(const ResourceReader& r, Workspace& out);
    //   };
    template <typename T>
    struct ResourceTraits;
}  // namespace tfe::jsonapi

#endif
