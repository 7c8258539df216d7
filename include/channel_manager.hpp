#ifndef CHANNEL_MANAGER_HPP
#define CHANNEL_MANAGER_HPP

#include "broker_transport.hpp"
#include "status_notifier.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

// Owns the single publishing channel derived from a live connection
class ChannelManager : private channel_listener {
public:
	using ReturnHandler = std::function<void(const returned_message&)>;

	explicit ChannelManager(StatusNotifier& notifier);

	// Replaces the current channel. Throws channel_unavailable_error if the connection is not live.
	std::shared_ptr<broker_channel> createChannel(const std::shared_ptr<broker_connection>& connection);

	// Broker-side state, not merely "a handle exists"
	bool isOpen() const;

	std::shared_ptr<broker_channel> handle() const;
	void close(const close_reason& reason);
	void release();

	void onReturned(ReturnHandler handler);

private:
	void on_shutdown(const shutdown_info& info) override;
	void on_return(const returned_message& msg) override;

	StatusNotifier& notifier_;

	mutable std::mutex lock_;
	std::shared_ptr<broker_channel> channel_;
	std::vector<ReturnHandler> return_handlers_;
};

#endif // CHANNEL_MANAGER_HPP
