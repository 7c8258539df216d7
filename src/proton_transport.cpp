#include "proton_transport.hpp"
#include "address.hpp"
#include "amqp_errors.hpp"
#include "ssl_utils.hpp"
#include <algorithm>
#include <future>
#include <proton/binary.hpp>
#include <proton/delivery_mode.hpp>
#include <proton/duration.hpp>
#include <proton/message.hpp>
#include <proton/reconnect_options.hpp>
#include <proton/sender_options.hpp>
#include <proton/ssl.hpp>
#include <proton/target.hpp>
#include <spdlog/spdlog.h>

uint16_t reply_code_for(const proton::error_condition& error) {
	if (error.empty())
		return reply_code::success;
	const std::string name = error.name();
	if (name == "amqp:connection:forced")
		return reply_code::connection_forced;
	if (name == "amqp:not-found")
		return reply_code::not_found;
	if (name == "amqp:resource-limit-exceeded")
		return reply_code::resource_error;
	return reply_code::internal_error;
}

shutdown_info to_shutdown_info(const proton::error_condition& error, shutdown_initiator initiator) {
	shutdown_info info;
	info.code	   = reply_code_for(error);
	info.initiator = initiator;
	if (error.empty())
		info.text = "closed";
	else
		info.text = error.description().empty() ? error.name() : error.description();
	return info;
}

// ---------------------------------------------------------------------------
// proton_channel

proton_channel::proton_channel(std::weak_ptr<proton_connection> connection,
							   channel_listener& listener,
							   std::chrono::milliseconds timeout) :
  connection_(std::move(connection)),
  listener_(listener),
  timeout_(timeout) {}

bool proton_channel::is_open() const {
	auto conn = connection_.lock();
	return open_ && conn && conn->is_open();
}

void proton_channel::wait_open() {
	std::unique_lock<std::mutex> l(lock_);
	bool done = state_changed_.wait_for(l, timeout_, [this] { return open_.load() || closed_; });
	if (open_)
		return;
	if (!done) {
		abandoned_ = true;
		throw channel_unavailable_error("Timed out opening channel after " + std::to_string(timeout_.count()) + " ms");
	}
	throw channel_unavailable_error("Channel refused: " + failure_);
}

void proton_channel::attach(proton::session s) {
	session_ = s;
}

void proton_channel::fail(const std::string& reason) {
	{
		std::lock_guard<std::mutex> l(lock_);
		closed_	 = true;
		failure_ = reason;
	}
	state_changed_.notify_all();
}

bool proton_channel::owns(const proton::session& s) const {
	return session_ == s;
}

void proton_channel::on_session_open() {
	{
		std::lock_guard<std::mutex> l(lock_);
		if (abandoned_) {
			session_.close();
			return;
		}
		open_	= true;
		closed_ = false;
	}
	state_changed_.notify_all();
	spdlog::debug("Channel session opened");
}

void proton_channel::on_session_close(const proton::error_condition& error) {
	bool was_open;
	{
		std::lock_guard<std::mutex> l(lock_);
		was_open = open_.exchange(false);
		closed_	 = true;
		if (!error.empty())
			failure_ = error.what();
	}
	state_changed_.notify_all();

	senders_.clear();
	blocked_ = false;
	if (!pending_.empty()) {
		spdlog::warn("Channel closed with {} mandatory message(s) unconfirmed", pending_.size());
		pending_.clear();
	}

	if (!was_open && !closing_)
		return;

	shutdown_info info;
	if (closing_) {
		info.code	   = closing_reason_.code;
		info.text	   = closing_reason_.text;
		info.initiator = shutdown_initiator::application;
	} else {
		info = to_shutdown_info(error, shutdown_initiator::peer);
	}
	listener_.on_shutdown(info);
}

void proton_channel::on_connection_lost(const shutdown_info& info, bool final) {
	bool was_open;
	{
		std::lock_guard<std::mutex> l(lock_);
		was_open = open_.exchange(false);
		if (final)
			closed_ = true;
	}
	state_changed_.notify_all();
	blocked_ = false;

	if (was_open)
		listener_.on_shutdown(info);
}

void proton_channel::publish(const Message& msg) {
	auto conn = connection_.lock();
	if (!conn || !is_open())
		throw publish_failed_error("Channel is closed");

	const std::string address = exchangeAddress(msg.exchange(), msg.routingKey());
	auto done				  = std::make_shared<std::promise<void>>();
	auto result				  = done->get_future();
	auto self				  = shared_from_this();

	bool posted = conn->post([self, msg, address, done]() {
		try {
			self->do_publish(msg, address);
			done->set_value();
		} catch (const std::exception& e) {
			done->set_exception(std::make_exception_ptr(publish_failed_error(e.what())));
		}
	});
	if (!posted)
		throw publish_failed_error("Connection is shutting down");

	if (result.wait_for(timeout_) != std::future_status::ready)
		throw publish_failed_error("Timed out handing message to the transport after " +
								   std::to_string(timeout_.count()) + " ms");
	result.get();
}

void proton_channel::do_publish(const Message& msg, const std::string& address) {
	if (!open_)
		throw publish_failed_error("Channel closed before publish");

	proton::message m;
	m.durable(msg.persistent());
	m.to(address);
	m.body(proton::binary(msg.body().begin(), msg.body().end()));

	proton::sender s = sender_for(address);
	if (s.active() && s.credit() <= 0 && !blocked_) {
		blocked_ = true;
		if (auto conn = connection_.lock())
			conn->notify_blocked("no link credit for " + address);
	}

	proton::tracker t = s.send(m);
	if (msg.mandatory()) {
		returned_message returned;
		returned.exchange	 = msg.exchange();
		returned.routing_key = msg.routingKey();
		returned.body		 = msg.body();
		pending_.push_back(pending_return{t, address, std::move(returned)});
	}
}

proton::sender proton_channel::sender_for(const std::string& address) {
	auto it = senders_.find(address);
	if (it != senders_.end() && !it->second.closed())
		return it->second;

	proton::sender_options so;
	so.delivery_mode(proton::delivery_mode::AT_LEAST_ONCE);
	proton::sender s   = session_.open_sender(address, so);
	senders_[address] = s;
	spdlog::debug("Opened sender link to '{}'", address);
	return s;
}

void proton_channel::close(const close_reason& reason) {
	{
		std::lock_guard<std::mutex> l(lock_);
		if (closed_)
			return;
	}

	auto conn	= connection_.lock();
	auto self	= shared_from_this();
	bool posted = conn && conn->post([self, reason]() {
		self->closing_		  = true;
		self->closing_reason_ = reason;
		if (reason.code == reply_code::success)
			self->session_.close();
		else
			self->session_.close(proton::error_condition("amqp:internal-error", reason.text));
	});
	if (!posted) {
		fail("connection gone");
		return;
	}

	std::unique_lock<std::mutex> l(lock_);
	if (!state_changed_.wait_for(l, timeout_, [this] { return closed_; }))
		throw amqp_error("Timed out closing channel after " + std::to_string(timeout_.count()) + " ms");
}

void proton_channel::on_sendable(proton::sender& s) {
	if (blocked_) {
		blocked_ = false;
		if (auto conn = connection_.lock())
			conn->notify_unblocked();
	}
}

void proton_channel::on_sender_error(proton::sender& s) {
	const proton::error_condition error = s.error();
	std::string address;
	for (auto it = senders_.begin(); it != senders_.end(); ++it) {
		if (it->second == s) {
			address = it->first;
			senders_.erase(it);
			break;
		}
	}
	spdlog::warn("Sender link to '{}' failed: {}", address, error.what());

	// Deliveries on a detached link will never settle
	for (auto it = pending_.begin(); it != pending_.end();) {
		if (it->address == address) {
			it->msg.reply_code = reply_code_for(error);
			it->msg.reply_text = error.empty() ? "LINK_DETACHED" : error.what();
			return_message(std::move(it->msg));
			it = pending_.erase(it);
		} else {
			++it;
		}
	}
}

std::list<proton_channel::pending_return>::iterator proton_channel::find_pending(const proton::tracker& t) {
	return std::find_if(pending_.begin(), pending_.end(), [&t](const pending_return& p) { return p.tracker == t; });
}

void proton_channel::return_message(returned_message msg) {
	spdlog::warn("Message to exchange '{}' with routing key '{}' returned: {} {}",
				 msg.exchange,
				 msg.routing_key,
				 msg.reply_code,
				 msg.reply_text);
	listener_.on_return(msg);
}

void proton_channel::on_tracker_accept(proton::tracker& t) {
	auto it = find_pending(t);
	if (it != pending_.end())
		pending_.erase(it);
}

void proton_channel::on_tracker_reject(proton::tracker& t) {
	auto it = find_pending(t);
	if (it == pending_.end()) {
		spdlog::warn("Broker rejected a message");
		return;
	}
	it->msg.reply_code = reply_code::internal_error;
	it->msg.reply_text = "REJECTED";
	return_message(std::move(it->msg));
	pending_.erase(it);
}

void proton_channel::on_tracker_release(proton::tracker& t) {
	auto it = find_pending(t);
	if (it == pending_.end()) {
		spdlog::debug("Broker released an unroutable message (not mandatory, dropped)");
		return;
	}
	it->msg.reply_code = reply_code::no_route;
	it->msg.reply_text = "NO_ROUTE";
	return_message(std::move(it->msg));
	pending_.erase(it);
}

void proton_channel::on_tracker_settle(proton::tracker& t) {
	auto it = find_pending(t);
	if (it != pending_.end())
		pending_.erase(it);
}

// ---------------------------------------------------------------------------
// proton_connection

proton_connection::proton_connection(const ClientConfig& config, connection_listener& listener) :
  config_(config),
  listener_(listener),
  work_queue_(0) {}

bool proton_connection::is_open() const {
	return open_;
}

bool proton_connection::finished() const {
	std::lock_guard<std::mutex> l(lock_);
	return finished_;
}

void proton_connection::wait_open() {
	std::unique_lock<std::mutex> l(lock_);
	bool done = state_changed_.wait_for(l, config_.operation_timeout, [this] { return state_ != state::connecting; });
	if (state_ == state::open)
		return;
	if (!done) {
		abandoned_ = true;
		throw connection_init_error("Timed out after " + std::to_string(config_.operation_timeout.count()) +
									" ms connecting to " + config_.endpoint());
	}
	throw connection_init_error(failure_.empty() ? "connection closed while opening" : failure_);
}

bool proton_connection::post(std::function<void()> f) {
	std::lock_guard<std::mutex> l(lock_);
	if (!work_queue_)
		return false;
	return work_queue_->add(std::move(f));
}

std::shared_ptr<broker_channel> proton_connection::open_channel(channel_listener& listener) {
	if (!is_open())
		throw channel_unavailable_error("Connection to " + config_.endpoint() + " is not open");

	auto ch	  = std::make_shared<proton_channel>(weak_from_this(), listener, config_.operation_timeout);
	auto self = shared_from_this();
	bool posted = post([self, ch]() {
		try {
			ch->attach(self->connection_.open_session());
			self->channels_.push_back(ch);
		} catch (const std::exception& e) {
			ch->fail(e.what());
		}
	});
	if (!posted)
		throw channel_unavailable_error("Connection to " + config_.endpoint() + " is shutting down");

	ch->wait_open();
	return ch;
}

void proton_connection::close(const close_reason& reason) {
	{
		std::lock_guard<std::mutex> l(lock_);
		if (finished_ || state_ == state::closed || state_ == state::failed)
			return;
	}

	auto self	= shared_from_this();
	bool posted = post([self, reason]() {
		self->closing_		  = true;
		self->closing_reason_ = reason;
		if (reason.code == reply_code::success)
			self->connection_.close();
		else
			self->connection_.close(proton::error_condition("amqp:connection:forced", reason.text));
	});
	if (!posted)
		return;

	std::unique_lock<std::mutex> l(lock_);
	bool done = state_changed_.wait_for(l, config_.operation_timeout, [this] {
		return finished_ || state_ == state::closed || state_ == state::failed;
	});
	if (!done)
		throw amqp_error("Timed out closing connection to " + config_.endpoint());
}

void proton_connection::notify_blocked(const std::string& reason) {
	guarded("blocked", [&] { listener_.on_blocked(reason); });
}

void proton_connection::notify_unblocked() {
	guarded("unblocked", [&] { listener_.on_unblocked(); });
}

void proton_connection::report_callback_error(const std::string& what) {
	try {
		listener_.on_callback_error(what);
	} catch (const std::exception& e) {
		spdlog::error("Callback error handler failed: {} (original error: {})", e.what(), what);
	} catch (...) {
		spdlog::error("Callback error handler failed with unknown exception (original error: {})", what);
	}
}

std::shared_ptr<proton_channel> proton_connection::channel_for(const proton::session& s) const {
	for (const auto& ch : channels_) {
		if (ch->owns(s))
			return ch;
	}
	return nullptr;
}

void proton_connection::connection_lost(const shutdown_info& info, bool final) {
	for (const auto& ch : channels_) {
		guarded("channel shutdown", [&] { ch->on_connection_lost(info, final); });
	}
	if (final)
		channels_.clear();
}

void proton_connection::on_connection_open(proton::connection& c) {
	bool recovered;
	{
		std::lock_guard<std::mutex> l(lock_);
		connection_ = c;
		work_queue_ = &c.work_queue();
		if (abandoned_) {
			spdlog::warn("Connection to {} opened after the caller gave up, closing it", config_.endpoint());
			c.close();
			return;
		}
		recovered	 = ever_opened_;
		ever_opened_ = true;
		state_		 = state::open;
		open_		 = true;
	}
	state_changed_.notify_all();

	if (config_.tlsEnabled()) {
		try {
			spdlog::debug("Broker certificate {}", find_CN(c.transport().ssl().remote_subject()));
		} catch (const std::exception& e) {
			spdlog::debug("Broker certificate subject unavailable: {}", e.what());
		}
	}

	if (recovered)
		guarded("recovery", [&] { listener_.on_recovered(); });
}

void proton_connection::on_connection_error(proton::connection& c) {
	spdlog::error("Connection to {} failed: {}", config_.endpoint(), c.error().what());
}

void proton_connection::on_connection_close(proton::connection& c) {
	bool was_open;
	{
		std::lock_guard<std::mutex> l(lock_);
		was_open = open_.exchange(false);
		if (state_ == state::connecting) {
			state_	 = state::failed;
			failure_ = c.error().empty() ? "connection refused" : c.error().what();
		} else {
			state_ = state::closed;
		}
	}
	state_changed_.notify_all();

	shutdown_info info;
	if (closing_) {
		info.code	   = closing_reason_.code;
		info.text	   = closing_reason_.text;
		info.initiator = shutdown_initiator::application;
	} else {
		info = to_shutdown_info(c.error(), shutdown_initiator::peer);
	}

	connection_lost(info, true);
	if (was_open || closing_)
		guarded("connection shutdown", [&] { listener_.on_shutdown(info); });
}

void proton_connection::on_transport_error(proton::transport& t) {
	const proton::error_condition error = t.error();
	bool was_open;
	bool never_opened;
	{
		std::lock_guard<std::mutex> l(lock_);
		was_open	 = open_.exchange(false);
		never_opened = !ever_opened_;
		if (never_opened) {
			state_	 = state::failed;
			failure_ = error.what();
		} else if (state_ == state::open) {
			state_ = state::reconnecting;
		}
	}
	state_changed_.notify_all();

	if (never_opened) {
		// Initial failures are reported to the caller; stop the automatic retries
		spdlog::debug("Connection attempt to {} failed: {}", config_.endpoint(), error.what());
		t.connection().close();
		return;
	}
	if (closing_ || !was_open) {
		spdlog::debug("Transport error while reconnecting to {}: {}", config_.endpoint(), error.what());
		return;
	}

	shutdown_info info = to_shutdown_info(error,
										  reply_code_for(error) == reply_code::connection_forced
											? shutdown_initiator::peer
											: shutdown_initiator::library);
	connection_lost(info, false);
	guarded("connection shutdown", [&] { listener_.on_shutdown(info); });
}

void proton_connection::on_transport_close(proton::transport& t) {
	{
		std::lock_guard<std::mutex> l(lock_);
		open_ = false;
		if (state_ == state::connecting) {
			state_	 = state::failed;
			failure_ = "transport closed";
		} else if (state_ != state::failed) {
			state_ = state::closed;
		}
		work_queue_ = 0;
		finished_	= true;
	}
	state_changed_.notify_all();
	connection_lost(shutdown_info{reply_code::success, "transport closed", shutdown_initiator::library}, true);
}

void proton_connection::on_session_open(proton::session& s) {
	guarded("session open", [&] {
		if (auto ch = channel_for(s))
			ch->on_session_open();
	});
}

void proton_connection::on_session_error(proton::session& s) {
	spdlog::error("Session error: {}", s.error().what());
}

void proton_connection::on_session_close(proton::session& s) {
	auto ch = channel_for(s);
	if (!ch)
		return;
	guarded("channel shutdown", [&] { ch->on_session_close(s.error()); });
	channels_.erase(std::remove(channels_.begin(), channels_.end(), ch), channels_.end());
}

void proton_connection::on_sendable(proton::sender& s) {
	guarded("sendable", [&] {
		if (auto ch = channel_for(s.session()))
			ch->on_sendable(s);
	});
}

void proton_connection::on_sender_error(proton::sender& s) {
	guarded("sender error", [&] {
		if (auto ch = channel_for(s.session()))
			ch->on_sender_error(s);
	});
}

void proton_connection::on_tracker_accept(proton::tracker& t) {
	guarded("tracker accept", [&] {
		if (auto ch = channel_for(t.sender().session()))
			ch->on_tracker_accept(t);
	});
}

void proton_connection::on_tracker_reject(proton::tracker& t) {
	guarded("tracker reject", [&] {
		if (auto ch = channel_for(t.sender().session()))
			ch->on_tracker_reject(t);
	});
}

void proton_connection::on_tracker_release(proton::tracker& t) {
	guarded("returned message", [&] {
		if (auto ch = channel_for(t.sender().session()))
			ch->on_tracker_release(t);
	});
}

void proton_connection::on_tracker_settle(proton::tracker& t) {
	guarded("tracker settle", [&] {
		if (auto ch = channel_for(t.sender().session()))
			ch->on_tracker_settle(t);
	});
}

void proton_connection::on_error(const proton::error_condition& e) {
	report_callback_error(e.what());
}

// ---------------------------------------------------------------------------
// proton_transport

proton_transport::proton_transport(const std::string& container_id) :
  container_(std::make_unique<proton::container>(container_id)) {
	container_->auto_stop(false);

	container_thread_ = std::thread([this]() {
		try {
			container_->run();
		} catch (const std::exception& e) {
			spdlog::error("AMQP container error: {}", e.what());
		} catch (...) {
			spdlog::error("AMQP container error: unknown exception");
		}
	});
}

proton_transport::~proton_transport() {
	shutdown();
	if (container_thread_.joinable()) {
		spdlog::error("AMQP transport destroyed on its own container thread");
		container_thread_.detach();
	}
}

proton::connection_options proton_transport::connection_options(const ClientConfig& config) const {
	proton::connection_options opts;
	opts.user(config.username)
	  .password(config.password)
	  .sasl_enabled(true)
	  .sasl_allow_insecure_mechs(!config.tlsEnabled())
	  .sasl_allowed_mechs(config.tlsEnabled() ? "EXTERNAL PLAIN" : "PLAIN");

	if (!config.virtual_host.empty()) {
		opts.virtual_host("vhost:" + config.virtual_host);
	}

	if (config.tlsEnabled()) {
		opts.ssl_client_options(make_ssl_client_options(config));
		spdlog::info("SSL enabled for AMQP connection");
	}

	// Automatic recovery: fixed interval, unlimited attempts
	const auto interval = static_cast<proton::duration::numeric_type>(config.recovery_interval.count());
	opts.reconnect(proton::reconnect_options()
					 .delay(proton::duration(interval))
					 .delay_multiplier(1.0)
					 .max_delay(proton::duration(interval)));
	return opts;
}

std::shared_ptr<broker_connection> proton_transport::open_connection(const ClientConfig& config,
																	 connection_listener& listener) {
	auto conn = std::make_shared<proton_connection>(config, listener);
	{
		std::lock_guard<std::mutex> l(lock_);
		if (stopped_)
			throw connection_init_error("AMQP transport is shut down");
		connections_.erase(std::remove_if(connections_.begin(),
										  connections_.end(),
										  [](const std::shared_ptr<proton_connection>& c) { return c->finished(); }),
						   connections_.end());
		connections_.push_back(conn);
	}

	try {
		proton::connection_options opts = connection_options(config);
		opts.handler(*conn);
		spdlog::debug("Opening AMQP connection to {}", config.url());
		container_->open_connection(config.url(), opts);
	} catch (const std::exception& e) {
		throw connection_init_error(e.what());
	}

	conn->wait_open();
	return conn;
}

void proton_transport::shutdown() {
	{
		std::lock_guard<std::mutex> l(lock_);
		if (stopped_)
			return;
		stopped_ = true;
	}

	container_->stop();
	if (!container_thread_.joinable())
		return;
	if (container_thread_.get_id() == std::this_thread::get_id()) {
		spdlog::error("AMQP transport shutdown requested from a transport callback; not joining");
		return;
	}
	container_thread_.join();
}
