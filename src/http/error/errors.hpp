#ifndef TFE_ERRORS_HPP
#define TFE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tfe::http::error {
    // Base of everything the client throws.
    struct ClientError : public std::runtime_error {
        explicit ClientError(const std::string &msg);
    };

    // Missing or invalid client configuration. No client is produced.
    struct ConfigError : public ClientError {
        explicit ConfigError(const std::string &msg);
    };

    // The request never produced a response (DNS, refused connection, timeout).
    struct TransportError : public ClientError {
        std::string url_;
        explicit TransportError(std::string u, const std::string &msg);
    };

    struct NotFoundError : public ClientError {
        long status_;
        std::string url_;
        explicit NotFoundError(std::string u);
    };

    // Any non-2xx status other than 404. Owns the full response body.
    struct UnexpectedStatusError : public ClientError {
        long status_;
        std::string url_;
        std::string body_;
        explicit UnexpectedStatusError(long s, std::string u, std::string body);
    };

    // The input value could not be written as a JSON:API document.
    struct EncodeError : public ClientError {
        explicit EncodeError(const std::string &msg);
    };

    // Malformed payload, or a payload that does not fit the requested output.
    struct DecodeError : public ClientError {
        std::string body_preview_;
        explicit DecodeError(std::string preview, const std::string &msg);
    };
}  // namespace tfe::http::error

#endif
