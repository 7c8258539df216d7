#ifndef PUBLISH_GUARD_HPP
#define PUBLISH_GUARD_HPP

#include "lifecycle_manager.hpp"
#include <string>
#include <vector>

// Checks channel health before every publish and makes at most one
// reinitialization attempt per call. The check and the publish are not atomic:
// a channel closing in between surfaces as publish_failed_error.
class PublishGuard {
public:
	explicit PublishGuard(ChannelLifecycle& lifecycle) : lifecycle_(lifecycle) {}

	// Throws client_disposed_error, channel_unavailable_error or publish_failed_error
	void send(const std::string& exchange,
			  const std::string& routing_key,
			  const std::vector<unsigned char>& body,
			  bool mandatory = false);

private:
	std::shared_ptr<broker_channel> usableChannel();

	ChannelLifecycle& lifecycle_;
};

#endif // PUBLISH_GUARD_HPP
