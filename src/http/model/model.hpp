#ifndef TFE_MODEL_HPP
#define TFE_MODEL_HPP

#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tfe::http::model {
    // Ordered header set with case-insensitive names.
    class Headers {
       public:
        Headers() = default;
        Headers(std::initializer_list<std::pair<std::string, std::string>> entries);

        // Replaces every existing value for name.
        void set(const std::string& name, std::string value);
        void add(std::string name, std::string value);
        void erase(const std::string& name);

        // First value for name, or empty when absent.
        [[nodiscard]] std::string get(const std::string& name) const;
        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] bool empty() const { return entries_.empty(); }
        [[nodiscard]] size_t size() const { return entries_.size(); }
        void clear() { entries_.clear(); }

        [[nodiscard]] const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }

        // "Name: value" lines as libcurl expects them.
        [[nodiscard]] std::vector<std::string> to_lines() const;

       private:
        std::vector<std::pair<std::string, std::string>> entries_;
    };

    struct Request {
        std::string method_ = "GET";
        std::string url_;
        std::optional<std::string> body_;

        Headers headers_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;

        Headers headers_;
    };
}  // namespace tfe::http::model

#endif
