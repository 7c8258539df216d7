#include "disposal_coordinator.hpp"
#include <spdlog/spdlog.h>

DisposalCoordinator::DisposalCoordinator(ChannelManager& channels,
										 ConnectionSupervisor& supervisor,
										 std::shared_ptr<broker_transport> transport) :
  channels_(channels),
  supervisor_(supervisor),
  transport_(std::move(transport)) {}

void DisposalCoordinator::dispose() {
	disposed_ = true;
	std::call_once(once_, [this]() {
		closeChannel();
		closeConnection();
		try {
			transport_->shutdown();
		} catch (const std::exception& e) {
			spdlog::warn("Error stopping AMQP transport: {}", e.what());
		}
		spdlog::debug("AMQP client disposed.");
	});
}

void DisposalCoordinator::closeChannel() {
	try {
		channels_.close(close_reason{reply_code::success, "Closing channel via Dispose"});
	} catch (const std::exception& e) {
		spdlog::warn("Error closing channel during dispose: {}", e.what());
	}
	channels_.release();
	spdlog::info("Channel disposed.");
}

void DisposalCoordinator::closeConnection() {
	try {
		supervisor_.close(close_reason{reply_code::success, "Closing connection via Dispose"});
	} catch (const std::exception& e) {
		spdlog::warn("Error closing connection during dispose: {}", e.what());
	}
	supervisor_.release();
	spdlog::info("Connection disposed.");
}
