#ifndef ADDRESS_HPP
#define ADDRESS_HPP

#include <string>

// Percent-encodes everything outside the RFC 3986 unreserved set
std::string percentEncode(const std::string& text);

// AMQP 1.0 target address for an exchange and routing key (RabbitMQ v2 address format):
//   /exchanges/{exchange}/{key}, /exchanges/{exchange} for an empty key,
//   /queues/{key} for the default exchange
std::string exchangeAddress(const std::string& exchange, const std::string& routing_key);

#endif // ADDRESS_HPP
