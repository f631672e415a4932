#ifndef TFE_TESTS_WIDGET_HPP
#define TFE_TESTS_WIDGET_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../src/jsonapi/resource.hpp"

namespace tfe::test {
    struct Widget {
        std::string id_;
        std::string name_;
        int64_t size_{};
        double ratio_{};
        bool enabled_{};
        std::optional<std::string> note_;
        std::optional<tfe::jsonapi::ResourceIdentifier> owner_;
        std::vector<tfe::jsonapi::ResourceIdentifier> tags_;

        bool operator==(const Widget&) const = default;
    };

    inline Widget sample_widget(const std::string& id, const std::string& name) {
        return Widget{
            .id_ = id,
            .name_ = name,
            .size_ = 42,
            .ratio_ = 0.5,
            .enabled_ = true,
            .note_ = "handle with care",
            .owner_ = tfe::jsonapi::ResourceIdentifier{.type_ = "users", .id_ = "user-1"},
            .tags_ = {{.type_ = "tags", .id_ = "tag-1"}, {.type_ = "tags", .id_ = "tag-2"}},
        };
    }
}  // namespace tfe::test

namespace tfe::jsonapi {
    template <>
    struct ResourceTraits<tfe::test::Widget> {
        static constexpr const char* TYPE = "widgets";

        static Resource to_resource(const tfe::test::Widget& w) {
            Resource r(TYPE, w.id_);
            r.with_attribute("name", w.name_)
                .with_attribute("size", w.size_)
                .with_attribute("ratio", w.ratio_)
                .with_attribute("enabled", w.enabled_)
                .with_attribute("note", w.note_ ? nlohmann::json(*w.note_) : nlohmann::json(nullptr))
                .with_to_one("owner", w.owner_)
                .with_to_many("tags", w.tags_);
            return r;
        }

        static void from_resource(const ResourceReader& r, tfe::test::Widget& out) {
            out.id_ = r.id();
            out.name_ = r.string_attribute("name");
            out.size_ = r.int_attribute("size");
            out.ratio_ = r.double_attribute("ratio");
            out.enabled_ = r.bool_attribute("enabled");
            out.note_ = r.optional_string_attribute("note");
            out.owner_ = r.to_one("owner");
            out.tags_ = r.to_many("tags");
        }
    };
}  // namespace tfe::jsonapi

#endif
