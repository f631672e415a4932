#ifndef TFE_STATUS_HPP
#define TFE_STATUS_HPP

#include "../model/model.hpp"

namespace tfe::http::api {
    // 404 throws NotFoundError; anything else outside [200, 299] throws UnexpectedStatusError,
    // taking the body out of resp. Success leaves resp untouched.
    void check_response_code(tfe::http::model::Response& resp);
}  // namespace tfe::http::api

#endif
