#ifndef FAKE_TRANSPORT_HPP
#define FAKE_TRANSPORT_HPP

#include "amqp_errors.hpp"
#include "broker_transport.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// In-memory broker used by the unit tests. Everything runs on the calling thread
// except what a test triggers itself.
struct fake_broker {
	std::mutex mutex;
	std::condition_variable gate_cv;

	bool reachable				 = true;
	bool channel_refused		 = false;
	bool publish_throws			 = false;
	bool channel_close_throws	 = false;
	bool connection_close_throws = false;
	bool gate_closed			 = false; // open_connection blocks while true
	std::set<std::string> bound_keys{"key"};

	std::atomic<int> connection_attempts{0};
	std::atomic<int> channel_attempts{0};
	std::vector<Message> published;
	std::vector<std::string> operations; // close order, shutdown

	void record(const std::string& op) {
		std::lock_guard<std::mutex> l(mutex);
		operations.push_back(op);
	}

	void open_gate() {
		{
			std::lock_guard<std::mutex> l(mutex);
			gate_closed = false;
		}
		gate_cv.notify_all();
	}

	std::size_t published_count() {
		std::lock_guard<std::mutex> l(mutex);
		return published.size();
	}
};

class fake_connection;

class fake_channel : public broker_channel {
public:
	fake_channel(std::shared_ptr<fake_broker> broker, std::weak_ptr<fake_connection> connection, channel_listener& listener) :
	  broker_(std::move(broker)),
	  connection_(std::move(connection)),
	  listener_(listener) {}

	bool is_open() const override;

	void publish(const Message& msg) override {
		if (!is_open())
			throw publish_failed_error("channel closed");
		bool unroutable;
		{
			std::lock_guard<std::mutex> l(broker_->mutex);
			if (broker_->publish_throws)
				throw publish_failed_error("broker refused the message");
			broker_->published.push_back(msg);
			unroutable = broker_->bound_keys.count(msg.routingKey()) == 0;
		}
		if (unroutable && msg.mandatory()) {
			returned_message returned;
			returned.reply_code	 = reply_code::no_route;
			returned.reply_text	 = "NO_ROUTE";
			returned.exchange	 = msg.exchange();
			returned.routing_key = msg.routingKey();
			returned.body		 = msg.body();
			listener_.on_return(returned);
		}
	}

	void close(const close_reason& reason) override {
		broker_->record("channel.close");
		{
			std::lock_guard<std::mutex> l(broker_->mutex);
			if (broker_->channel_close_throws)
				throw amqp_error("channel close timed out");
		}
		if (open_.exchange(false))
			listener_.on_shutdown(shutdown_info{reason.code, reason.text, shutdown_initiator::application});
	}

	// Broker closes the channel
	void kill(uint16_t code, const std::string& text) {
		if (open_.exchange(false))
			listener_.on_shutdown(shutdown_info{code, text, shutdown_initiator::peer});
	}

	bool raw_open() const { return open_; }

private:
	std::shared_ptr<fake_broker> broker_;
	std::weak_ptr<fake_connection> connection_;
	channel_listener& listener_;
	std::atomic<bool> open_{true};
};

class fake_connection : public broker_connection, public std::enable_shared_from_this<fake_connection> {
public:
	fake_connection(std::shared_ptr<fake_broker> broker, connection_listener& listener) :
	  broker_(std::move(broker)),
	  listener_(listener) {}

	bool is_open() const override { return open_; }

	std::shared_ptr<broker_channel> open_channel(channel_listener& listener) override {
		++broker_->channel_attempts;
		if (!open_)
			throw channel_unavailable_error("connection closed");
		{
			std::lock_guard<std::mutex> l(broker_->mutex);
			if (broker_->channel_refused)
				throw channel_unavailable_error("channel refused");
		}
		auto ch = std::make_shared<fake_channel>(broker_, weak_from_this(), listener);
		std::lock_guard<std::mutex> l(mutex_);
		channels_.push_back(ch);
		return ch;
	}

	void close(const close_reason& reason) override {
		broker_->record("connection.close");
		{
			std::lock_guard<std::mutex> l(broker_->mutex);
			if (broker_->connection_close_throws)
				throw amqp_error("connection close timed out");
		}
		if (open_.exchange(false))
			listener_.on_shutdown(shutdown_info{reason.code, reason.text, shutdown_initiator::application});
	}

	// Broker forcibly closes the connection; its channels go with it
	void force_close(uint16_t code, const std::string& text) {
		if (!open_.exchange(false))
			return;
		std::vector<std::shared_ptr<fake_channel>> channels;
		{
			std::lock_guard<std::mutex> l(mutex_);
			channels = channels_;
		}
		for (auto& ch : channels)
			ch->kill(code, text);
		listener_.on_shutdown(shutdown_info{code, text, shutdown_initiator::peer});
	}

	void block(const std::string& reason) { listener_.on_blocked(reason); }
	void unblock() { listener_.on_unblocked(); }
	void callback_failed(const std::string& what) { listener_.on_callback_error(what); }

	std::shared_ptr<fake_channel> last_channel() {
		std::lock_guard<std::mutex> l(mutex_);
		return channels_.empty() ? nullptr : channels_.back();
	}

private:
	std::shared_ptr<fake_broker> broker_;
	connection_listener& listener_;
	std::atomic<bool> open_{true};
	std::mutex mutex_;
	std::vector<std::shared_ptr<fake_channel>> channels_;
};

inline bool fake_channel::is_open() const {
	auto conn = connection_.lock();
	return open_ && conn && conn->is_open();
}

class fake_transport : public broker_transport {
public:
	explicit fake_transport(std::shared_ptr<fake_broker> broker) : broker_(std::move(broker)) {}

	std::shared_ptr<broker_connection> open_connection(const ClientConfig& config,
													   connection_listener& listener) override {
		++broker_->connection_attempts;
		{
			std::unique_lock<std::mutex> l(broker_->mutex);
			broker_->gate_cv.wait(l, [this] { return !broker_->gate_closed; });
			if (!broker_->reachable)
				throw connection_init_error("Connection refused: " + config.endpoint());
		}
		auto conn = std::make_shared<fake_connection>(broker_, listener);
		std::lock_guard<std::mutex> l(mutex_);
		connections_.push_back(conn);
		return conn;
	}

	void shutdown() override { broker_->record("transport.shutdown"); }

	std::shared_ptr<fake_connection> last_connection() {
		std::lock_guard<std::mutex> l(mutex_);
		return connections_.empty() ? nullptr : connections_.back();
	}

private:
	std::shared_ptr<fake_broker> broker_;
	std::mutex mutex_;
	std::vector<std::shared_ptr<fake_connection>> connections_;
};

#endif // FAKE_TRANSPORT_HPP
