#include "amqp_errors.hpp"
#include "amqp_template.hpp"
#include "client_config.hpp"
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>
#include <thread>

namespace {

std::atomic<bool> running{true};

std::string env_or(const char* name, const std::string& fallback) {
	const char* value = getenv(name);
	return value ? value : fallback;
}

int env_or(const char* name, int fallback) {
	const char* value = getenv(name);
	return value ? std::stoi(value) : fallback;
}

void set_log_level(const std::string& log_level) {
	if (log_level == "debug") {
		spdlog::set_level(spdlog::level::debug);
	} else if (log_level == "info") {
		spdlog::set_level(spdlog::level::info);
	} else if (log_level == "warn") {
		spdlog::set_level(spdlog::level::warn);
	} else if (log_level == "error") {
		spdlog::set_level(spdlog::level::err);
	} else {
		throw std::runtime_error("Invalid log level: " + log_level);
	}
}

} // namespace

int main(int argc, char** argv) {
	try {
		namespace po = boost::program_options;

		po::options_description desc("Allowed options");
		desc.add_options()
			("help,h", "produce help message")
			("config,f", po::value<std::string>()->default_value(env_or("AMQP_CONFIG", "")),
			 "JSON client configuration file (command line options override it)")
			("log-level,l", po::value<std::string>()->default_value(env_or("LOG_LEVEL", "info")),
			 "logging level (debug, info, warn, error)")
			("host", po::value<std::string>()->default_value(env_or("AMQP_HOST", "localhost")), "broker host")
			("port", po::value<int>()->default_value(env_or("AMQP_PORT", 0)), "broker port (0 = protocol default)")
			("user", po::value<std::string>()->default_value(env_or("AMQP_USER", "guest")), "user name")
			("password", po::value<std::string>()->default_value(env_or("AMQP_PASSWORD", "guest")), "password")
			("vhost", po::value<std::string>()->default_value(env_or("AMQP_VHOST", "")), "virtual host")
			("cert-dir,c", po::value<std::string>()->default_value(env_or("CERT_DIR", "")),
			 "directory containing SSL certificates (enables TLS)")
			("exchange,e", po::value<std::string>()->default_value(env_or("AMQP_EXCHANGE", "amq.direct")),
			 "exchange to publish to")
			("routing-key,k", po::value<std::string>()->default_value(env_or("AMQP_ROUTING_KEY", "my.routing.key")),
			 "routing key")
			("message,m", po::value<std::string>()->default_value("Hello RabbitMQ!"), "message body")
			("mandatory", po::bool_switch()->default_value(false), "publish with the mandatory flag")
			("unroutable-key", po::value<std::string>()->default_value(""),
			 "also send a mandatory message with this routing key to show returns")
			("repeat,r", po::value<int>()->default_value(1), "number of messages to send (0 = until SIGINT)")
			("interval-ms", po::value<int>()->default_value(1000), "delay between repeated messages")
			("wait-ms", po::value<int>()->default_value(2000), "time to wait for the initial connection");

		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, desc), vm);
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << desc << "\n";
			return 0;
		}

		set_log_level(vm["log-level"].as<std::string>());

		ClientConfig config;
		const bool from_file = !vm["config"].as<std::string>().empty();
		if (from_file) {
			config = ClientConfig::fromFile(vm["config"].as<std::string>());
		}
		// Explicit options override the file
		auto given = [&](const char* name) { return !from_file || !vm[name].defaulted(); };
		if (given("host"))
			config.host = vm["host"].as<std::string>();
		if (given("port"))
			config.port = vm["port"].as<int>();
		if (given("user"))
			config.username = vm["user"].as<std::string>();
		if (given("password"))
			config.password = vm["password"].as<std::string>();
		if (given("vhost"))
			config.virtual_host = vm["vhost"].as<std::string>();
		if (given("cert-dir"))
			config.cert_dir = vm["cert-dir"].as<std::string>();

		std::signal(SIGINT, [](int) { running = false; });
		std::signal(SIGTERM, [](int) { running = false; });

		nlohmann::json printable = config;
		spdlog::info("Client configuration: {}", printable.dump());

		AmqpTemplate amqp(config);
		amqp.onStatusEvent([](const StatusEvent& event) {
			spdlog::info("[AmqpTemplate Status Update]: {}", nlohmann::json(event).dump());
		});
		amqp.onReturned([](const returned_message& msg) {
			spdlog::warn("Returned by broker: exchange '{}', routing key '{}', {} {}",
						 msg.exchange,
						 msg.routing_key,
						 msg.reply_code,
						 msg.reply_text);
		});

		auto ready = amqp.initialization();
		if (ready.wait_for(std::chrono::milliseconds(vm["wait-ms"].as<int>())) != std::future_status::ready ||
			!ready.get()) {
			spdlog::warn("Not connected yet; the first send will retry");
		}

		const std::string exchange	  = vm["exchange"].as<std::string>();
		const std::string routing_key = vm["routing-key"].as<std::string>();
		const std::string body		  = vm["message"].as<std::string>();
		const bool mandatory		  = vm["mandatory"].as<bool>();
		const int repeat			  = vm["repeat"].as<int>();
		const auto interval			  = std::chrono::milliseconds(vm["interval-ms"].as<int>());

		int failures = 0;
		for (int sent = 0; running && (repeat == 0 || sent < repeat); ++sent) {
			try {
				amqp.send(exchange, routing_key, body, mandatory);
			} catch (const amqp_error& e) {
				++failures;
				spdlog::error("Send failed: {}", e.what());
			}
			if (repeat == 0 || sent + 1 < repeat)
				std::this_thread::sleep_for(interval);
		}

		const std::string unroutable = vm["unroutable-key"].as<std::string>();
		if (running && !unroutable.empty()) {
			try {
				amqp.send(exchange, unroutable, "This should be returned!", true);
				// Returns arrive asynchronously
				std::this_thread::sleep_for(std::chrono::seconds(1));
			} catch (const amqp_error& e) {
				++failures;
				spdlog::error("Send failed: {}", e.what());
			}
		}

		amqp.dispose();
		spdlog::info("Application exited.");
		return failures == 0 ? 0 : 2;
	} catch (const nlohmann::json::exception& e) {
		spdlog::error("Invalid configuration file: {}", e.what());
		return 1;
	} catch (const std::exception& e) {
		spdlog::error("Error: {}", e.what());
		return 1;
	}
}
