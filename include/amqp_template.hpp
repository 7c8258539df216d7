#pragma once

#include "broker_transport.hpp"
#include "channel_manager.hpp"
#include "client_config.hpp"
#include "lifecycle_manager.hpp"
#include "publish_guard.hpp"
#include "status_notifier.hpp"
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

class AmqpTemplate;

// Raw handles for out-of-band topology setup. Not part of the publish path.
class InfrastructureAccess {
public:
	std::shared_ptr<broker_connection> connection() const;
	std::shared_ptr<broker_channel> channel() const;

private:
	friend class AmqpTemplate;
	explicit InfrastructureAccess(LifecycleManager& lifecycle) : lifecycle_(lifecycle) {}

	LifecycleManager& lifecycle_;
};

// Long-lived publishing handle. Construction starts connecting in the background
// and does not block; connectivity is reported through status handlers.
class AmqpTemplate {
public:
	using StatusHandler = std::function<void(const std::string&)>;

	// Uses the Proton transport
	explicit AmqpTemplate(ClientConfig config = ClientConfig());
	AmqpTemplate(ClientConfig config, std::shared_ptr<broker_transport> transport);
	~AmqpTemplate();

	AmqpTemplate(const AmqpTemplate&)			 = delete;
	AmqpTemplate& operator=(const AmqpTemplate&) = delete;

	void send(const std::string& exchange,
			  const std::string& routing_key,
			  const std::vector<unsigned char>& body,
			  bool mandatory = false);
	void send(const std::string& exchange, const std::string& routing_key, const std::string& body, bool mandatory = false);

	std::size_t onStatusChanged(StatusHandler handler);
	std::size_t onStatusEvent(StatusNotifier::Handler handler);
	bool removeStatusHandler(std::size_t id);

	// Reports mandatory messages the broker could not route
	void onReturned(ChannelManager::ReturnHandler handler);

	// Completes with true once the first connection and channel are open
	std::shared_future<bool> initialization() const;

	InfrastructureAccess infrastructure();

	void dispose();
	bool disposed() const;

private:
	void ensureNotDisposed() const;

	std::unique_ptr<LifecycleManager> lifecycle_;
	PublishGuard guard_;
	std::shared_future<bool> initialization_;
};
