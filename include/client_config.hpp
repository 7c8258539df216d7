#ifndef CLIENT_CONFIG_HPP
#define CLIENT_CONFIG_HPP

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

// Endpoint, credentials and timing for one AmqpTemplate.
// Automatic recovery is always enabled; only its interval is configurable.
struct ClientConfig {
	static constexpr int AMQP_PORT	= 5672;
	static constexpr int AMQPS_PORT = 5671;

	std::string host	 = "localhost";
	int port			 = 0; // 0 selects the protocol default
	std::string username = "guest";
	std::string password = "guest";
	std::string virtual_host;
	std::string container_id = "amqp-template";

	// TLS is enabled when cert_dir is set
	std::string cert_dir;
	std::string cert_name = "client";

	std::chrono::milliseconds recovery_interval{5000};
	std::chrono::milliseconds operation_timeout{10000};

	bool tlsEnabled() const { return !cert_dir.empty(); }
	int effectivePort() const;
	std::string endpoint() const;
	std::string url() const;

	// Throws std::invalid_argument describing the first bad field
	void validate() const;

	static ClientConfig fromJson(const nlohmann::json& j);
	static ClientConfig fromFile(const std::string& path);
};

void to_json(nlohmann::json& j, const ClientConfig& config);

#endif // CLIENT_CONFIG_HPP
