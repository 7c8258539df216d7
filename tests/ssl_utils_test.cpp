#include "ssl_utils.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(SslUtilsTest, CertPathJoinsDirectoryAndFile) {
	EXPECT_EQ(cert_path("/etc/certs", "ca.pem"), "/etc/certs/ca.pem");
	EXPECT_EQ(cert_path("/etc/certs/", "ca.pem"), "/etc/certs/ca.pem");
	EXPECT_EQ(cert_path("", "ca.pem"), "ca.pem");
}

TEST(SslUtilsTest, MissingFilesAreReported) {
	const std::string dir = testing::TempDir() + "no-such-cert-dir";
	EXPECT_THROW(platform_CA(dir, "ca"), std::runtime_error);
	EXPECT_THROW(platform_certificate(dir, "client", ""), std::runtime_error);

	ClientConfig config;
	config.cert_dir = dir;
	EXPECT_THROW(make_ssl_client_options(config), std::runtime_error);
}

TEST(SslUtilsTest, FindsCommonName) {
	EXPECT_EQ(find_CN("C=SE, O=RISE, CN=publisher-01"), "publisher-01");
	EXPECT_EQ(find_CN("CN=broker.local, O=Example"), "broker.local");
	EXPECT_THROW(find_CN("O=Example"), std::runtime_error);
}
