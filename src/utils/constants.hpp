
#ifndef TFE_CONSTANTS_HPP
#define TFE_CONSTANTS_HPP

namespace tfe::constants {
    inline constexpr long HTTP_OK = 200;
    inline constexpr long HTTP_NOT_FOUND = 404;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
    inline constexpr long BODY_PREVIEW_LENGTH = 512;

    // The public SaaS service.
    inline constexpr const char* DEFAULT_ADDRESS = "https://app.terraform.io";
    inline constexpr const char* JSONAPI_MEDIA_TYPE = "application/vnd.api+json";
    inline constexpr const char* AUTHORIZATION = "Authorization";
    inline constexpr const char* CONTENT_TYPE = "Content-Type";
    inline constexpr const char* BEARER_PREFIX = "Bearer ";

}  // namespace tfe::constants

#endif
