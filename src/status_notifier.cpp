#include "status_notifier.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

std::string toString(StatusCategory category) {
	switch (category) {
	case StatusCategory::Connected:
		return "Connected";
	case StatusCategory::ConnectionFailed:
		return "ConnectionFailed";
	case StatusCategory::ConnectionShutdown:
		return "ConnectionShutdown";
	case StatusCategory::ConnectionBlocked:
		return "ConnectionBlocked";
	case StatusCategory::ConnectionUnblocked:
		return "ConnectionUnblocked";
	case StatusCategory::CallbackError:
		return "CallbackError";
	case StatusCategory::ChannelShutdown:
		return "ChannelShutdown";
	}
	return "Unknown";
}

void to_json(nlohmann::json& j, const StatusEvent& event) {
	j = nlohmann::json{{"category", toString(event.category)}, {"description", event.description}};
}

std::size_t StatusNotifier::subscribe(Handler handler) {
	std::lock_guard<std::mutex> lock(mutex_);
	std::size_t id = next_id_++;
	subscribers_.emplace_back(id, std::move(handler));
	return id;
}

bool StatusNotifier::unsubscribe(std::size_t id) {
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = std::find_if(subscribers_.begin(), subscribers_.end(), [id](const auto& s) { return s.first == id; });
	if (it == subscribers_.end())
		return false;
	subscribers_.erase(it);
	return true;
}

void StatusNotifier::emit(const StatusEvent& event) {
	// Handlers run outside the lock so they may subscribe or unsubscribe
	std::vector<std::pair<std::size_t, Handler>> snapshot;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		snapshot = subscribers_;
	}

	for (const auto& subscriber : snapshot) {
		try {
			subscriber.second(event);
		} catch (const std::exception& e) {
			spdlog::error("Status subscriber {} failed on {}: {}", subscriber.first, toString(event.category), e.what());
		} catch (...) {
			spdlog::error("Status subscriber {} failed on {}: unknown exception", subscriber.first, toString(event.category));
		}
	}
}

void StatusNotifier::report(StatusCategory category, const std::string& description) {
	switch (category) {
	case StatusCategory::Connected:
	case StatusCategory::ConnectionUnblocked:
		spdlog::info(description);
		break;
	case StatusCategory::ConnectionShutdown:
	case StatusCategory::ConnectionBlocked:
	case StatusCategory::ChannelShutdown:
		spdlog::warn(description);
		break;
	case StatusCategory::ConnectionFailed:
	case StatusCategory::CallbackError:
		spdlog::error(description);
		break;
	}
	emit(StatusEvent{category, description});
}

std::size_t StatusNotifier::subscriberCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return subscribers_.size();
}
