#include "client_config.hpp"
#include <fstream>
#include <stdexcept>

int ClientConfig::effectivePort() const {
	if (port != 0)
		return port;
	return tlsEnabled() ? AMQPS_PORT : AMQP_PORT;
}

std::string ClientConfig::endpoint() const {
	// Bracket IPv6 literals so the port separator stays unambiguous
	std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
	return h + ":" + std::to_string(effectivePort());
}

std::string ClientConfig::url() const {
	return (tlsEnabled() ? "amqps://" : "amqp://") + endpoint();
}

void ClientConfig::validate() const {
	if (host.empty())
		throw std::invalid_argument("host must not be empty");
	if (port < 0 || port > 65535)
		throw std::invalid_argument("port out of range: " + std::to_string(port));
	if (recovery_interval.count() <= 0)
		throw std::invalid_argument("recovery interval must be positive");
	if (operation_timeout.count() <= 0)
		throw std::invalid_argument("operation timeout must be positive");
	if (container_id.empty())
		throw std::invalid_argument("container id must not be empty");
}

ClientConfig ClientConfig::fromJson(const nlohmann::json& j) {
	ClientConfig config;
	config.host			= j.value("host", config.host);
	config.port			= j.value("port", config.port);
	config.username		= j.value("username", config.username);
	config.password		= j.value("password", config.password);
	config.virtual_host = j.value("virtual_host", config.virtual_host);
	config.container_id = j.value("container_id", config.container_id);
	config.cert_dir		= j.value("cert_dir", config.cert_dir);
	config.cert_name	= j.value("cert_name", config.cert_name);

	if (j.contains("recovery_interval_ms")) {
		config.recovery_interval = std::chrono::milliseconds(j["recovery_interval_ms"].get<long>());
	}
	if (j.contains("operation_timeout_ms")) {
		config.operation_timeout = std::chrono::milliseconds(j["operation_timeout_ms"].get<long>());
	}

	config.validate();
	return config;
}

ClientConfig ClientConfig::fromFile(const std::string& path) {
	std::ifstream in(path);
	if (!in) {
		throw std::runtime_error("Cannot open config file: " + path);
	}
	return fromJson(nlohmann::json::parse(in));
}

void to_json(nlohmann::json& j, const ClientConfig& config) {
	// Password is never serialized
	j = nlohmann::json{{"host", config.host},
					   {"port", config.effectivePort()},
					   {"username", config.username},
					   {"virtual_host", config.virtual_host},
					   {"container_id", config.container_id},
					   {"tls", config.tlsEnabled()},
					   {"recovery_interval_ms", config.recovery_interval.count()},
					   {"operation_timeout_ms", config.operation_timeout.count()}};
}
