#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "src/http/api/client.hpp"
#include "src/http/api/config.hpp"
#include "src/http/api/request.hpp"
#include "src/http/error/errors.hpp"
#include "src/jsonapi/resource.hpp"

struct Organization {
    std::string name_;
    std::string email_;
    std::string created_at_;
    std::vector<tfe::jsonapi::ResourceIdentifier> workspaces_;
};

namespace tfe::jsonapi {
    template <>
    struct ResourceTraits<Organization> {
        static constexpr const char* TYPE = "organizations";

        static Resource to_resource(const Organization& o) { return Resource(TYPE, o.name_).with_attribute("name", o.name_).with_attribute("email", o.email_); }

        static void from_resource(const ResourceReader& r, Organization& out) {
            out.name_ = r.id();
            out.email_ = r.optional_string_attribute("email").value_or("");
            out.created_at_ = r.optional_string_attribute("created-at").value_or("");
            out.workspaces_ = r.to_many("workspaces");
        }
    };
}  // namespace tfe::jsonapi

namespace {
    std::string get_env(const char* key) {
        const char* value = std::getenv(key);
        return value != nullptr ? std::string(value) : std::string{};
    }
}  // namespace

int main() {
    try {
        //
        // Collect
        //

        const std::string token = get_env("TFE_TOKEN");
        const std::string address = get_env("TFE_ADDRESS");

        if (token.empty()) {
            std::cout << "TFE_TOKEN not set" << std::endl;
            return 1;
        }

        const tfe::http::api::Config config{.address_ = address, .token_ = token, .transport_ = nullptr};
        const auto client = tfe::http::api::new_client(&config);

        //
        // List
        //

        std::vector<Organization> organizations;
        client->execute(tfe::http::api::ApiRequest{
            .method_ = "GET",
            .path_ = "/api/v2/organizations",
            .query_ = {{"page[size]", "100"}},
            .output_ = tfe::http::api::into(organizations),
        });

        for (const auto& org : organizations) {
            std::cout << org.name_ << "\t" << org.email_ << "\t" << org.workspaces_.size() << " workspaces\n";
        }
    } catch (const tfe::http::error::ConfigError& e) {
        std::cerr << "Config Error: " << e.what() << std::endl;
        return 1;
    } catch (const tfe::http::error::NotFoundError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const tfe::http::error::UnexpectedStatusError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const tfe::http::error::TransportError& e) {
        std::cerr << "Transport Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
};
