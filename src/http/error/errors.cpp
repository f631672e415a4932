#include "errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "../../utils/constants.hpp"

namespace tfe::http::error {
    ClientError::ClientError(const std::string &msg) : std::runtime_error(msg) {}

    ConfigError::ConfigError(const std::string &msg) : ClientError(msg) {}

    TransportError::TransportError(std::string u, const std::string &msg) : ClientError(msg), url_(std::move(u)) {}

    NotFoundError::NotFoundError(std::string u) : ClientError("Resource not found"), status_(constants::HTTP_NOT_FOUND), url_(std::move(u)) {}

    UnexpectedStatusError::UnexpectedStatusError(long s, std::string u, std::string body)
        : ClientError("Unexpected status code: " + std::to_string(s) + "\n\nBody:\n" + body), status_(s), url_(std::move(u)), body_(std::move(body)) {}

    EncodeError::EncodeError(const std::string &msg) : ClientError(msg) {}

    DecodeError::DecodeError(std::string preview,
                             const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : ClientError(msg), body_preview_(std::move(preview)) {}
}  // namespace tfe::http::error
