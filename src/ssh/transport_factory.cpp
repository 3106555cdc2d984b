#include "transport_factory.hpp"
#include "library_transport.hpp"
#include "async_transport.hpp"

std::unique_ptr<Transport> make_transport(TransportBackend backend,
                                          const Settings& settings,
                                          const CancellationToken& cancel,
                                          boost::asio::io_context& ioc) {
    switch (backend) {
        case TransportBackend::LIBRARY:
        case TransportBackend::DEBUG:
            return std::make_unique<LibraryTransport>(settings.connect_timeout_secs, cancel, backend);
        case TransportBackend::ASYNC:
            return std::make_unique<AsyncTransport>(ioc, settings.connect_timeout_secs, cancel);
        case TransportBackend::EXEC_REPLACE:
            return nullptr;
    }
    return nullptr;
}
