#include "config.hpp"

#include "../../utils/constants.hpp"

namespace tfe::http::api {
    Config default_config() { return Config{.address_ = constants::DEFAULT_ADDRESS, .token_ = {}, .transport_ = nullptr}; }
}  // namespace tfe::http::api
