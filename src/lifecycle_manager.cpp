#include "lifecycle_manager.hpp"
#include "amqp_errors.hpp"
#include <spdlog/spdlog.h>

LifecycleManager::LifecycleManager(ClientConfig config, std::shared_ptr<broker_transport> transport) :
  supervisor_(std::move(config), transport, notifier_),
  channels_(notifier_),
  disposal_(channels_, supervisor_, transport) {}

LifecycleManager::~LifecycleManager() {
	dispose();
	// The task captures this; callers may hold their own copy of the future
	if (initialization_.valid())
		initialization_.wait();
}

std::shared_future<bool> LifecycleManager::initialize() {
	initialization_ = std::async(std::launch::async, [this]() {
						  std::lock_guard<std::mutex> l(lock_);
						  if (disposal_.disposed())
							  return false;
						  return openConnectionAndChannel();
					  }).share();
	return initialization_;
}

std::shared_ptr<broker_channel> LifecycleManager::channel() const {
	return channels_.handle();
}

bool LifecycleManager::reinitialize() {
	std::lock_guard<std::mutex> l(lock_);
	if (disposal_.disposed())
		throw client_disposed_error("AmqpTemplate has been disposed");

	// Another caller may have recovered the channel while we waited
	if (channels_.isOpen())
		return true;
	return openConnectionAndChannel();
}

bool LifecycleManager::disposed() const {
	return disposal_.disposed();
}

void LifecycleManager::dispose() {
	std::lock_guard<std::mutex> l(lock_);
	disposal_.dispose();
}

bool LifecycleManager::openConnectionAndChannel() {
	if (!supervisor_.isOpen() && !supervisor_.connect())
		return false;

	try {
		channels_.createChannel(supervisor_.handle());
	} catch (const channel_unavailable_error& e) {
		notifier_.report(StatusCategory::ChannelShutdown, std::string("Channel Shutdown: failed to open channel: ") + e.what());
		return false;
	}
	return channels_.isOpen();
}
