#ifndef TFE_JSONAPI_PAYLOAD_HPP
#define TFE_JSONAPI_PAYLOAD_HPP

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "resource.hpp"

namespace tfe::jsonapi {
    // {"data": {...}} and {"data": [...]}. Throw http::error::EncodeError.
    std::string encode_one(const Resource& resource);
    std::string encode_many(const std::vector<Resource>& resources);

    // Parse a document whose primary data is one resource / an array of resources of the
    // given type and hand each resource to fn in document order. Throw http::error::DecodeError.
    void decode_one(const std::string& body, const std::string& type, const std::function<void(const ResourceReader&)>& fn);
    void decode_many(const std::string& body, const std::string& type, const std::function<void(const ResourceReader&)>& fn);

    template <typename T>
    std::string marshal_payload(const T& value) {
        return encode_one(ResourceTraits<T>::to_resource(value));
    }

    template <typename T>
    std::string marshal_many_payload(const std::vector<T>& values) {
        std::vector<Resource> resources;
        resources.reserve(values.size());
        for (const auto& v : values) {
            resources.push_back(ResourceTraits<T>::to_resource(v));
        }
        return encode_many(resources);
    }

    template <typename T>
    void unmarshal_payload(const std::string& body, T& out) {
        decode_one(body, ResourceTraits<T>::TYPE, [&out](const ResourceReader& r) { ResourceTraits<T>::from_resource(r, out); });
    }

    template <typename T>
    std::vector<T> unmarshal_many_payload(const std::string& body) {
        std::vector<T> out;
        decode_many(body, ResourceTraits<T>::TYPE, [&out](const ResourceReader& r) {
            T value{};
            ResourceTraits<T>::from_resource(r, value);
            out.push_back(std::move(value));
        });
        return out;
    }
}  // namespace tfe::jsonapi

#endif
