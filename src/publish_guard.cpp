#include "publish_guard.hpp"
#include "amqp_errors.hpp"
#include "message.hpp"
#include <spdlog/spdlog.h>

std::shared_ptr<broker_channel> PublishGuard::usableChannel() {
	auto channel = lifecycle_.channel();
	if (channel && channel->is_open())
		return channel;

	spdlog::warn("Channel is not open. Attempting to re-initialize connection/channel.");
	lifecycle_.reinitialize();

	channel = lifecycle_.channel();
	if (!channel || !channel->is_open()) {
		spdlog::error("Failed to re-establish channel. Message not sent.");
		throw channel_unavailable_error("AmqpTemplate channel is not available.");
	}
	return channel;
}

void PublishGuard::send(const std::string& exchange,
						const std::string& routing_key,
						const std::vector<unsigned char>& body,
						bool mandatory) {
	if (lifecycle_.disposed())
		throw client_disposed_error("AmqpTemplate has been disposed");

	auto channel = usableChannel();
	Message msg(exchange, routing_key, body, mandatory);

	try {
		channel->publish(msg);
	} catch (const publish_failed_error& e) {
		spdlog::error("Failed to send message to exchange '{}' with routing key '{}': {}", exchange, routing_key, e.what());
		throw;
	} catch (const std::exception& e) {
		spdlog::error("Failed to send message to exchange '{}' with routing key '{}': {}", exchange, routing_key, e.what());
		throw publish_failed_error(e.what());
	}
	spdlog::info("Message sent to exchange '{}' with routing key '{}'.", exchange, routing_key);
}
