#ifndef BROKER_TRANSPORT_HPP
#define BROKER_TRANSPORT_HPP

#include "client_config.hpp"
#include "message.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Classic AMQP reply codes, used for close reasons and shutdown reports
namespace reply_code {
constexpr uint16_t success			  = 200;
constexpr uint16_t no_route			  = 312;
constexpr uint16_t connection_forced  = 320;
constexpr uint16_t not_found		  = 404;
constexpr uint16_t resource_error	  = 506;
constexpr uint16_t internal_error	  = 541;
} // namespace reply_code

enum class shutdown_initiator { application, peer, library };

std::string to_string(shutdown_initiator initiator);

struct shutdown_info {
	uint16_t code = reply_code::success;
	std::string text;
	shutdown_initiator initiator = shutdown_initiator::library;
};

struct close_reason {
	uint16_t code = reply_code::success;
	std::string text;
};

// A mandatory message the broker could not route or refused
struct returned_message {
	uint16_t reply_code = reply_code::no_route;
	std::string reply_text;
	std::string exchange;
	std::string routing_key;
	std::vector<unsigned char> body;
};

// Connection-level notifications. Implementations must return promptly and not throw.
class connection_listener {
  public:
    virtual ~connection_listener() = default;
    virtual void on_shutdown(const shutdown_info& info) = 0;
    virtual void on_callback_error(const std::string& what) = 0;
    virtual void on_blocked(const std::string& reason) = 0;
    virtual void on_unblocked() = 0;
    virtual void on_recovered() = 0;
};

// Channel-level notifications. Same rules as connection_listener.
class channel_listener {
  public:
    virtual ~channel_listener() = default;
    virtual void on_shutdown(const shutdown_info& info) = 0;
    virtual void on_return(const returned_message& msg) = 0;
};

class broker_channel {
  public:
    virtual ~broker_channel() = default;

    // Live broker-side state; false once the session or its connection is gone
    virtual bool is_open() const = 0;

    // Hands the message to the transport. Throws publish_failed_error.
    virtual void publish(const Message& msg) = 0;

    // Graceful close, blocks until confirmed or the operation timeout expires
    virtual void close(const close_reason& reason) = 0;
};

class broker_connection {
  public:
    virtual ~broker_connection() = default;
    virtual bool is_open() const = 0;

    // Throws channel_unavailable_error
    virtual std::shared_ptr<broker_channel> open_channel(channel_listener& listener) = 0;

    virtual void close(const close_reason& reason) = 0;
};

class broker_transport {
  public:
    virtual ~broker_transport() = default;

    // Blocks until the connection is open. Throws connection_init_error.
    virtual std::shared_ptr<broker_connection> open_connection(const ClientConfig& config,
                                                               connection_listener& listener) = 0;

    // Stops delivering notifications; no listener is called after this returns
    virtual void shutdown() = 0;
};

#endif // BROKER_TRANSPORT_HPP
