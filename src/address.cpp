#include "address.hpp"
#include <cctype>
#include <stdexcept>

std::string percentEncode(const std::string& text) {
	static const char hex[] = "0123456789ABCDEF";
	std::string out;
	out.reserve(text.size());
	for (unsigned char c : text) {
		if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
			out += static_cast<char>(c);
		} else {
			out += '%';
			out += hex[c >> 4];
			out += hex[c & 0x0F];
		}
	}
	return out;
}

std::string exchangeAddress(const std::string& exchange, const std::string& routing_key) {
	if (exchange.empty()) {
		if (routing_key.empty())
			throw std::invalid_argument("default exchange requires a routing key");
		return "/queues/" + percentEncode(routing_key);
	}
	std::string address = "/exchanges/" + percentEncode(exchange);
	if (!routing_key.empty())
		address += "/" + percentEncode(routing_key);
	return address;
}
