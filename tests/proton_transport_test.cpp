#include "proton_transport.hpp"
#include <gtest/gtest.h>

class ErrorConditionMappingTest : public ::testing::Test {
protected:
	proton::error_condition none;
	proton::error_condition forced{"amqp:connection:forced", "Closed via management plugin"};
	proton::error_condition not_found{"amqp:not-found", "no exchange 'missing'"};
	proton::error_condition resource{"amqp:resource-limit-exceeded", "memory alarm"};
	proton::error_condition other{"amqp:internal-error", "boom"};
};

TEST_F(ErrorConditionMappingTest, ReplyCodes) {
	EXPECT_EQ(reply_code_for(none), reply_code::success);
	EXPECT_EQ(reply_code_for(forced), reply_code::connection_forced);
	EXPECT_EQ(reply_code_for(not_found), reply_code::not_found);
	EXPECT_EQ(reply_code_for(resource), reply_code::resource_error);
	EXPECT_EQ(reply_code_for(other), reply_code::internal_error);
	EXPECT_EQ(reply_code_for(proton::error_condition("amqp:unauthorized-access", "")), reply_code::internal_error);
}

TEST_F(ErrorConditionMappingTest, ShutdownInfoCarriesDescription) {
	shutdown_info info = to_shutdown_info(forced, shutdown_initiator::peer);
	EXPECT_EQ(info.code, 320);
	EXPECT_EQ(info.text, "Closed via management plugin");
	EXPECT_EQ(info.initiator, shutdown_initiator::peer);
}

TEST_F(ErrorConditionMappingTest, EmptyConditionReadsClosed) {
	shutdown_info info = to_shutdown_info(none, shutdown_initiator::library);
	EXPECT_EQ(info.code, 200);
	EXPECT_EQ(info.text, "closed");
	EXPECT_EQ(info.initiator, shutdown_initiator::library);
}

TEST_F(ErrorConditionMappingTest, MissingDescriptionFallsBackToName) {
	shutdown_info info = to_shutdown_info(proton::error_condition("amqp:not-found", ""), shutdown_initiator::peer);
	EXPECT_EQ(info.code, 404);
	EXPECT_EQ(info.text, "amqp:not-found");
}
