#ifndef TFE_TRANSPORT_INTERFACE_HPP
#define TFE_TRANSPORT_INTERFACE_HPP

#include "../model/model.hpp"

namespace tfe::http::transport {
    // Sends one request and returns whatever the server answered, whatever the status.
    // Failures to obtain a response throw http::error::TransportError.
    class ITransport {
       public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(const ITransport&) = delete;
        virtual ITransport& operator=(const ITransport&) = delete;
        ITransport(ITransport&&) = delete;
        virtual ITransport& operator=(ITransport&&) = delete;

        virtual tfe::http::model::Response send(const tfe::http::model::Request& req) = 0;
    };
}  // namespace tfe::http::transport

#endif
