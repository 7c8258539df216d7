#ifndef MESSAGE_HPP
#define MESSAGE_HPP

#include <string>
#include <utility>
#include <vector>

// An outgoing message. Always persistent; immutable once built.
class Message {
public:
	Message(std::string exchange, std::string routing_key, std::vector<unsigned char> body, bool mandatory = false) :
	  exchange_(std::move(exchange)),
	  routing_key_(std::move(routing_key)),
	  body_(std::move(body)),
	  mandatory_(mandatory) {}

	const std::string& exchange() const { return exchange_; }
	const std::string& routingKey() const { return routing_key_; }
	const std::vector<unsigned char>& body() const { return body_; }
	bool persistent() const { return true; }
	bool mandatory() const { return mandatory_; }

private:
	std::string exchange_;
	std::string routing_key_;
	std::vector<unsigned char> body_;
	bool mandatory_;
};

#endif // MESSAGE_HPP
