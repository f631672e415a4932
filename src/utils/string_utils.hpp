#ifndef TFE_STRING_UTILS_HPP
#define TFE_STRING_UTILS_HPP

#include <cstddef>
#include <string>
#include <string_view>

namespace tfe::string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq(std::string_view a, std::string_view b);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);

    std::string preview(const std::string& body, size_t max_len);
}  // namespace tfe::string_utils

#endif
