#pragma once

#include "broker_transport.hpp"
#include "channel_manager.hpp"
#include "client_config.hpp"
#include "connection_supervisor.hpp"
#include "disposal_coordinator.hpp"
#include "status_notifier.hpp"
#include <future>
#include <memory>
#include <mutex>

// What the publishing side needs from the connection/channel lifecycle
class ChannelLifecycle {
public:
	virtual ~ChannelLifecycle() = default;

	virtual std::shared_ptr<broker_channel> channel() const = 0;

	// One synchronous attempt to get back to an open channel, reconnecting first if needed
	virtual bool reinitialize() = 0;

	virtual bool disposed() const = 0;
};

// Connection, channel, status events and disposal for one client.
// Handle replacement (initialize, reinitialize, dispose) is serialized by one lock.
class LifecycleManager : public ChannelLifecycle {
public:
	LifecycleManager(ClientConfig config, std::shared_ptr<broker_transport> transport);
	~LifecycleManager() override;

	LifecycleManager(const LifecycleManager&)			 = delete;
	LifecycleManager& operator=(const LifecycleManager&) = delete;

	// Connects and opens the channel on a background task. Failures are status events only.
	std::shared_future<bool> initialize();

	std::shared_ptr<broker_channel> channel() const override;
	bool reinitialize() override;
	bool disposed() const override;

	void dispose();

	StatusNotifier& notifier() { return notifier_; }
	ConnectionSupervisor& supervisor() { return supervisor_; }
	ChannelManager& channels() { return channels_; }

private:
	bool openConnectionAndChannel();

	StatusNotifier notifier_;
	ConnectionSupervisor supervisor_;
	ChannelManager channels_;
	DisposalCoordinator disposal_;

	std::mutex lock_;
	std::shared_future<bool> initialization_;
};
