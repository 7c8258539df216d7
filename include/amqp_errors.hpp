#ifndef AMQP_ERRORS_HPP
#define AMQP_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base for every error raised by the publishing client
class amqp_error : public std::runtime_error {
  public:
    explicit amqp_error(const std::string& msg) : std::runtime_error(msg) {}
};

// A connection attempt failed. Never escapes ConnectionSupervisor; reported as a status event.
class connection_init_error : public amqp_error {
  public:
    explicit connection_init_error(const std::string& msg) : amqp_error(msg) {}
};

// No usable channel after one reinitialization attempt
class channel_unavailable_error : public amqp_error {
  public:
    explicit channel_unavailable_error(const std::string& msg) : amqp_error(msg) {}
};

// The transport did not accept a specific message
class publish_failed_error : public amqp_error {
  public:
    explicit publish_failed_error(const std::string& msg) : amqp_error(msg) {}
};

// Operation invoked after dispose()
class client_disposed_error : public amqp_error {
  public:
    explicit client_disposed_error(const std::string& msg) : amqp_error(msg) {}
};

#endif // AMQP_ERRORS_HPP
