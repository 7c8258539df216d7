#include "channel_manager.hpp"
#include "amqp_errors.hpp"
#include <spdlog/spdlog.h>

ChannelManager::ChannelManager(StatusNotifier& notifier) :
  notifier_(notifier) {}

std::shared_ptr<broker_channel> ChannelManager::createChannel(const std::shared_ptr<broker_connection>& connection) {
	if (!connection || !connection->is_open()) {
		throw channel_unavailable_error("Cannot create channel: connection is not open");
	}

	auto channel = connection->open_channel(*this);
	std::shared_ptr<broker_channel> previous;
	{
		std::lock_guard<std::mutex> l(lock_);
		previous = std::move(channel_);
		channel_ = channel;
	}
	if (previous && previous->is_open()) {
		try {
			previous->close(close_reason{reply_code::success, "Replaced by a new channel"});
		} catch (const std::exception& e) {
			spdlog::warn("Failed to close replaced channel: {}", e.what());
		}
	}

	spdlog::info("Channel created.");
	return channel;
}

bool ChannelManager::isOpen() const {
	auto channel = handle();
	return channel && channel->is_open();
}

std::shared_ptr<broker_channel> ChannelManager::handle() const {
	std::lock_guard<std::mutex> l(lock_);
	return channel_;
}

void ChannelManager::close(const close_reason& reason) {
	auto channel = handle();
	if (channel && channel->is_open()) {
		channel->close(reason);
		spdlog::info("Channel closed.");
	}
}

void ChannelManager::release() {
	std::lock_guard<std::mutex> l(lock_);
	channel_.reset();
}

void ChannelManager::onReturned(ReturnHandler handler) {
	std::lock_guard<std::mutex> l(lock_);
	return_handlers_.push_back(std::move(handler));
}

void ChannelManager::on_shutdown(const shutdown_info& info) {
	notifier_.report(StatusCategory::ChannelShutdown,
					 "Channel Shutdown: " + info.text + " (" + std::to_string(info.code) + ", initiated by " +
					   to_string(info.initiator) + ")");
}

void ChannelManager::on_return(const returned_message& msg) {
	std::vector<ReturnHandler> handlers;
	{
		std::lock_guard<std::mutex> l(lock_);
		handlers = return_handlers_;
	}
	if (handlers.empty()) {
		spdlog::warn("Returned message to exchange '{}' with routing key '{}' has no handler",
					 msg.exchange,
					 msg.routing_key);
		return;
	}
	for (const auto& handler : handlers) {
		try {
			handler(msg);
		} catch (const std::exception& e) {
			spdlog::error("Returned-message handler failed: {}", e.what());
		} catch (...) {
			spdlog::error("Returned-message handler failed: unknown exception");
		}
	}
}
