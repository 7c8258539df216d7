#include "amqp_errors.hpp"
#include "amqp_template.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <gtest/gtest.h>
#include <thread>

using namespace std::chrono_literals;

// Runs against a live RabbitMQ with the AMQP 1.0 plugin. Set AMQP_TEST_HOST to enable.
class BrokerIntegrationTest : public ::testing::Test {
protected:
	void SetUp() override {
		const char* host = getenv("AMQP_TEST_HOST");
		if (host == nullptr) {
			GTEST_SKIP() << "AMQP_TEST_HOST not set";
		}
		config.host = host;
		if (const char* port = getenv("AMQP_TEST_PORT"))
			config.port = std::stoi(port);
		config.recovery_interval = 1s;
		config.operation_timeout = 5s;
	}

	ClientConfig config;
};

TEST_F(BrokerIntegrationTest, ConnectsAndPublishes) {
	AmqpTemplate amqp(config);
	auto ready = amqp.initialization();
	ASSERT_EQ(ready.wait_for(10s), std::future_status::ready);
	ASSERT_TRUE(ready.get());

	EXPECT_NO_THROW(amqp.send("amq.direct", "integration.key", std::string("Hello RabbitMQ!")));
	amqp.dispose();
	EXPECT_THROW(amqp.send("amq.direct", "integration.key", std::string("late")), client_disposed_error);
}

TEST_F(BrokerIntegrationTest, UnreachablePortFailsWithoutThrowing) {
	config.host = "127.0.0.1";
	config.port = 1;
	config.operation_timeout = 2s;

	std::vector<StatusEvent> events;
	std::mutex events_mutex;
	std::unique_ptr<AmqpTemplate> amqp;
	ASSERT_NO_THROW(amqp = std::make_unique<AmqpTemplate>(config));
	amqp->onStatusEvent([&](const StatusEvent& e) {
		std::lock_guard<std::mutex> l(events_mutex);
		events.push_back(e);
	});

	EXPECT_FALSE(amqp->initialization().get());
	EXPECT_THROW(amqp->send("amq.direct", "key", std::string("x")), channel_unavailable_error);
	amqp->dispose();

	std::lock_guard<std::mutex> l(events_mutex);
	EXPECT_TRUE(std::any_of(events.begin(), events.end(), [](const StatusEvent& e) {
		return e.category == StatusCategory::ConnectionFailed;
	}));
}

TEST_F(BrokerIntegrationTest, MandatoryUnroutableIsReturned) {
	AmqpTemplate amqp(config);
	ASSERT_TRUE(amqp.initialization().get());

	std::mutex returned_mutex;
	std::condition_variable returned_cv;
	bool returned = false;
	amqp.onReturned([&](const returned_message&) {
		std::lock_guard<std::mutex> l(returned_mutex);
		returned = true;
		returned_cv.notify_all();
	});

	EXPECT_NO_THROW(amqp.send("amq.direct", "non.existent.key", std::string("This should be returned!"), true));

	std::unique_lock<std::mutex> l(returned_mutex);
	EXPECT_TRUE(returned_cv.wait_for(l, 5s, [&] { return returned; }));
}
