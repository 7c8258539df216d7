#ifndef DISPOSAL_COORDINATOR_HPP
#define DISPOSAL_COORDINATOR_HPP

#include "broker_transport.hpp"
#include "channel_manager.hpp"
#include "connection_supervisor.hpp"
#include <atomic>
#include <memory>
#include <mutex>

// Ordered, blocking, idempotent teardown: channel, then connection, then the transport.
// Errors are logged; dispose() always completes.
class DisposalCoordinator {
public:
	DisposalCoordinator(ChannelManager& channels,
						ConnectionSupervisor& supervisor,
						std::shared_ptr<broker_transport> transport);

	void dispose();
	bool disposed() const { return disposed_; }

private:
	void closeChannel();
	void closeConnection();

	ChannelManager& channels_;
	ConnectionSupervisor& supervisor_;
	std::shared_ptr<broker_transport> transport_;

	std::atomic<bool> disposed_{false};
	std::once_flag once_;
};

#endif // DISPOSAL_COORDINATOR_HPP
