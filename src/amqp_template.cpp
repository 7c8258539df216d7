#include "amqp_template.hpp"
#include "amqp_errors.hpp"
#include "proton_transport.hpp"
#include <spdlog/spdlog.h>

std::shared_ptr<broker_connection> InfrastructureAccess::connection() const {
	if (lifecycle_.disposed())
		throw client_disposed_error("AmqpTemplate has been disposed");
	return lifecycle_.supervisor().handle();
}

std::shared_ptr<broker_channel> InfrastructureAccess::channel() const {
	if (lifecycle_.disposed())
		throw client_disposed_error("AmqpTemplate has been disposed");
	return lifecycle_.channels().handle();
}

AmqpTemplate::AmqpTemplate(ClientConfig config) :
  AmqpTemplate(config, std::make_shared<proton_transport>(config.container_id)) {}

AmqpTemplate::AmqpTemplate(ClientConfig config, std::shared_ptr<broker_transport> transport) :
  lifecycle_(std::make_unique<LifecycleManager>(std::move(config), std::move(transport))),
  guard_(*lifecycle_) {
	initialization_ = lifecycle_->initialize();
}

AmqpTemplate::~AmqpTemplate() {
	dispose();
}

void AmqpTemplate::send(const std::string& exchange,
						const std::string& routing_key,
						const std::vector<unsigned char>& body,
						bool mandatory) {
	guard_.send(exchange, routing_key, body, mandatory);
}

void AmqpTemplate::send(const std::string& exchange,
						const std::string& routing_key,
						const std::string& body,
						bool mandatory) {
	send(exchange, routing_key, std::vector<unsigned char>(body.begin(), body.end()), mandatory);
}

std::size_t AmqpTemplate::onStatusChanged(StatusHandler handler) {
	ensureNotDisposed();
	return lifecycle_->notifier().subscribe([handler](const StatusEvent& event) { handler(event.description); });
}

std::size_t AmqpTemplate::onStatusEvent(StatusNotifier::Handler handler) {
	ensureNotDisposed();
	return lifecycle_->notifier().subscribe(std::move(handler));
}

std::shared_future<bool> AmqpTemplate::initialization() const {
	ensureNotDisposed();
	return initialization_;
}

bool AmqpTemplate::removeStatusHandler(std::size_t id) {
	ensureNotDisposed();
	return lifecycle_->notifier().unsubscribe(id);
}

void AmqpTemplate::onReturned(ChannelManager::ReturnHandler handler) {
	ensureNotDisposed();
	lifecycle_->channels().onReturned(std::move(handler));
}

InfrastructureAccess AmqpTemplate::infrastructure() {
	ensureNotDisposed();
	return InfrastructureAccess(*lifecycle_);
}

void AmqpTemplate::dispose() {
	lifecycle_->dispose();
}

bool AmqpTemplate::disposed() const {
	return lifecycle_->disposed();
}

void AmqpTemplate::ensureNotDisposed() const {
	if (lifecycle_->disposed())
		throw client_disposed_error("AmqpTemplate has been disposed");
}
