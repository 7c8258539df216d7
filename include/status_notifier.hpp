#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

enum class StatusCategory {
	Connected,
	ConnectionFailed,
	ConnectionShutdown,
	ConnectionBlocked,
	ConnectionUnblocked,
	CallbackError,
	ChannelShutdown
};

std::string toString(StatusCategory category);

struct StatusEvent {
	StatusCategory category;
	std::string description;
};

void to_json(nlohmann::json& j, const StatusEvent& event);

// Fans status events out to subscribers, synchronously and in registration order.
// A throwing subscriber is logged and skipped; the others still receive the event.
class StatusNotifier {
public:
	using Handler = std::function<void(const StatusEvent&)>;

	std::size_t subscribe(Handler handler);
	bool unsubscribe(std::size_t id);
	void emit(const StatusEvent& event);

	// Logs the event at a level matching its category, then emits it
	void report(StatusCategory category, const std::string& description);

	std::size_t subscriberCount() const;

private:
	mutable std::mutex mutex_;
	std::vector<std::pair<std::size_t, Handler>> subscribers_;
	std::size_t next_id_ = 1;
};
