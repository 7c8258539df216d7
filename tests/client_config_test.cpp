#include "client_config.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

class ClientConfigTest : public ::testing::Test {
protected:
	ClientConfig config;
};

TEST_F(ClientConfigTest, Defaults) {
	EXPECT_EQ(config.host, "localhost");
	EXPECT_EQ(config.username, "guest");
	EXPECT_EQ(config.password, "guest");
	EXPECT_EQ(config.recovery_interval, std::chrono::milliseconds(5000));
	EXPECT_FALSE(config.tlsEnabled());
	EXPECT_EQ(config.effectivePort(), 5672);
	EXPECT_EQ(config.url(), "amqp://localhost:5672");
	EXPECT_NO_THROW(config.validate());
}

TEST_F(ClientConfigTest, CertificateDirectoryEnablesTls) {
	config.cert_dir = "/etc/certs";
	EXPECT_TRUE(config.tlsEnabled());
	EXPECT_EQ(config.effectivePort(), 5671);
	EXPECT_EQ(config.url(), "amqps://localhost:5671");

	config.port = 15671;
	EXPECT_EQ(config.endpoint(), "localhost:15671");
}

TEST_F(ClientConfigTest, Ipv6HostIsBracketed) {
	config.host = "::1";
	EXPECT_EQ(config.endpoint(), "[::1]:5672");
}

TEST_F(ClientConfigTest, ValidationRejectsBadFields) {
	config.host = "";
	EXPECT_THROW(config.validate(), std::invalid_argument);

	config		= ClientConfig();
	config.port = -1;
	EXPECT_THROW(config.validate(), std::invalid_argument);

	config					 = ClientConfig();
	config.recovery_interval = std::chrono::milliseconds(0);
	EXPECT_THROW(config.validate(), std::invalid_argument);

	config				= ClientConfig();
	config.container_id = "";
	EXPECT_THROW(config.validate(), std::invalid_argument);
}

TEST_F(ClientConfigTest, LoadsFromJsonKeepingDefaults) {
	auto loaded = ClientConfig::fromJson(
	  nlohmann::json{{"host", "rabbit.local"}, {"port", 5673}, {"recovery_interval_ms", 250}});

	EXPECT_EQ(loaded.host, "rabbit.local");
	EXPECT_EQ(loaded.port, 5673);
	EXPECT_EQ(loaded.recovery_interval, std::chrono::milliseconds(250));
	EXPECT_EQ(loaded.username, "guest");
	EXPECT_EQ(loaded.operation_timeout, std::chrono::milliseconds(10000));
}

TEST_F(ClientConfigTest, JsonLoadingValidates) {
	EXPECT_THROW(ClientConfig::fromJson(nlohmann::json{{"port", 99999}}), std::invalid_argument);
	EXPECT_THROW(ClientConfig::fromJson(nlohmann::json{{"port", "not a number"}}), nlohmann::json::exception);
}

TEST_F(ClientConfigTest, LoadsFromFile) {
	const std::string path = testing::TempDir() + "client_config_test.json";
	{
		std::ofstream out(path);
		out << R"({"host": "file.host", "virtual_host": "/prod"})";
	}
	auto loaded = ClientConfig::fromFile(path);
	std::remove(path.c_str());

	EXPECT_EQ(loaded.host, "file.host");
	EXPECT_EQ(loaded.virtual_host, "/prod");
	EXPECT_THROW(ClientConfig::fromFile(path), std::runtime_error);
}

TEST_F(ClientConfigTest, SerializationOmitsPassword) {
	config.password	 = "secret";
	nlohmann::json j = config;

	EXPECT_FALSE(j.contains("password"));
	EXPECT_EQ(j["host"], "localhost");
	EXPECT_EQ(j["port"], 5672);
	EXPECT_EQ(j["tls"], false);
}
