#include "status.hpp"

#include <string>
#include <utility>

#include "../../utils/constants.hpp"
#include "../error/errors.hpp"

namespace tfe::http::api {
    void check_response_code(tfe::http::model::Response& resp) {
        if (resp.status_ == constants::HTTP_NOT_FOUND) {
            throw tfe::http::error::NotFoundError(resp.effective_url_);
        }
        if (resp.status_ < constants::HTTP_OK || resp.status_ >= constants::HTTP_SUCCESS_UPPER_BOUNDARY) {
            std::string body = std::move(resp.body_);
            resp.body_.clear();
            throw tfe::http::error::UnexpectedStatusError(resp.status_, resp.effective_url_, std::move(body));
        }
    }
}  // namespace tfe::http::api
