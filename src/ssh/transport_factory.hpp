#pragma once

#include <memory>
#include <boost/asio/io_context.hpp>
#include <core/cancellation.hpp>
#include <core/config.hpp>
#include "transport.hpp"

// Builds the transport for a backend. EXEC_REPLACE has no transport (see
// delegated_session.hpp) and yields nullptr. ASYNC runs on ioc.
std::unique_ptr<Transport> make_transport(TransportBackend backend,
                                          const Settings& settings,
                                          const CancellationToken& cancel,
                                          boost::asio::io_context& ioc);
