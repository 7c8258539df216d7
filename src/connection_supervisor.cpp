#include "connection_supervisor.hpp"
#include "amqp_errors.hpp"
#include <spdlog/spdlog.h>

ConnectionSupervisor::ConnectionSupervisor(ClientConfig config,
										   std::shared_ptr<broker_transport> transport,
										   StatusNotifier& notifier) :
  config_(std::move(config)),
  transport_(std::move(transport)),
  notifier_(notifier) {
	config_.validate();
}

bool ConnectionSupervisor::connect() {
	std::lock_guard<std::mutex> attempt(connect_lock_);

	std::shared_ptr<broker_connection> previous;
	{
		std::lock_guard<std::mutex> l(lock_);
		previous = std::move(connection_);
	}
	// A dropped connection may still be retrying in the background; stop it too
	if (previous) {
		try {
			previous->close(close_reason{reply_code::success, "Replaced by a new connection"});
		} catch (const std::exception& e) {
			spdlog::warn("Failed to close replaced connection: {}", e.what());
		}
	}

	try {
		auto conn = transport_->open_connection(config_, *this);
		{
			std::lock_guard<std::mutex> l(lock_);
			connection_ = conn;
		}
		notifier_.report(StatusCategory::Connected, "Connection established to " + config_.endpoint());
		return true;
	} catch (const connection_init_error& e) {
		notifier_.report(StatusCategory::ConnectionFailed, std::string("Failed to establish connection: ") + e.what());
	} catch (const std::exception& e) {
		spdlog::error("Failed to initialize AMQP connection: {}", e.what());
		notifier_.report(StatusCategory::ConnectionFailed, "Failed to initialize AMQP connection.");
	}
	return false;
}

std::shared_ptr<broker_connection> ConnectionSupervisor::handle() const {
	std::lock_guard<std::mutex> l(lock_);
	return connection_;
}

bool ConnectionSupervisor::isOpen() const {
	auto conn = handle();
	return conn && conn->is_open();
}

void ConnectionSupervisor::close(const close_reason& reason) {
	auto conn = handle();
	if (conn && conn->is_open()) {
		conn->close(reason);
		spdlog::info("Connection closed.");
	}
}

void ConnectionSupervisor::release() {
	std::lock_guard<std::mutex> l(lock_);
	connection_.reset();
}

void ConnectionSupervisor::on_shutdown(const shutdown_info& info) {
	notifier_.report(StatusCategory::ConnectionShutdown,
					 "Connection Shutdown: " + info.text + " (" + std::to_string(info.code) + ", initiated by " +
					   to_string(info.initiator) + ")");
}

void ConnectionSupervisor::on_callback_error(const std::string& what) {
	notifier_.report(StatusCategory::CallbackError, "Callback Exception: " + what);
}

void ConnectionSupervisor::on_blocked(const std::string& reason) {
	notifier_.report(StatusCategory::ConnectionBlocked, "Connection Blocked: " + reason);
}

void ConnectionSupervisor::on_unblocked() {
	notifier_.report(StatusCategory::ConnectionUnblocked, "Connection Unblocked.");
}

void ConnectionSupervisor::on_recovered() {
	notifier_.report(StatusCategory::Connected, "Connection recovered to " + config_.endpoint());
}
