#ifndef CONNECTION_SUPERVISOR_HPP
#define CONNECTION_SUPERVISOR_HPP

#include "broker_transport.hpp"
#include "client_config.hpp"
#include "status_notifier.hpp"
#include <memory>
#include <mutex>

// Owns the single logical connection. Connection failures never escape this class:
// they are logged and reported through the StatusNotifier.
class ConnectionSupervisor : private connection_listener {
public:
	ConnectionSupervisor(ClientConfig config, std::shared_ptr<broker_transport> transport, StatusNotifier& notifier);

	// One synchronous attempt. Replaces any previous handle. Never throws.
	// LifecycleManager runs the first attempt on a background task.
	bool connect();

	std::shared_ptr<broker_connection> handle() const;
	bool isOpen() const;

	// Closes the current connection if it is open; errors propagate to the caller
	void close(const close_reason& reason);
	void release();

	const ClientConfig& config() const { return config_; }

private:
	void on_shutdown(const shutdown_info& info) override;
	void on_callback_error(const std::string& what) override;
	void on_blocked(const std::string& reason) override;
	void on_unblocked() override;
	void on_recovered() override;

	ClientConfig config_;
	std::shared_ptr<broker_transport> transport_;
	StatusNotifier& notifier_;

	std::mutex connect_lock_;
	mutable std::mutex lock_;
	std::shared_ptr<broker_connection> connection_;
};

#endif // CONNECTION_SUPERVISOR_HPP
