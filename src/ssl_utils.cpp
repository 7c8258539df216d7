#include "ssl_utils.hpp"
#include <filesystem>
#include <stdexcept>

std::string cert_path(const std::string& dir, const std::string& file_name) {
	if (dir.empty() || dir.back() == '/')
		return dir + file_name;
	return dir + '/' + file_name;
}

ssl_certificate platform_certificate(const std::string& dir, const std::string& base_name, const std::string& passwd) {
	std::string crt = cert_path(dir, base_name + ".crt");
	std::string key = cert_path(dir, base_name + ".key");

	if (!std::filesystem::exists(crt)) {
		throw std::runtime_error("Certificate file not found: " + crt);
	}
	if (!std::filesystem::exists(key)) {
		throw std::runtime_error("Key file not found: " + key);
	}

	return ssl_certificate(crt, key, passwd);
}

std::string platform_CA(const std::string& dir, const std::string& base_name) {
	std::string ca = cert_path(dir, base_name + ".pem");
	if (!std::filesystem::exists(ca)) {
		throw std::runtime_error("CA file not found: " + ca);
	}
	return ca;
}

std::string find_CN(const std::string& subject) {
	size_t pos = subject.find("CN=");
	if (pos == std::string::npos)
		throw std::runtime_error("No common name in certificate subject");
	std::string cn = subject.substr(pos + 3);
	pos			   = cn.find(',');
	return pos == std::string::npos ? cn : cn.substr(0, pos);
}

proton::ssl_client_options make_ssl_client_options(const ClientConfig& config) {
	ssl_certificate client_cert = platform_certificate(config.cert_dir, config.cert_name, "");
	std::string server_CA		= platform_CA(config.cert_dir, "ca");
	return proton::ssl_client_options(client_cert, server_CA, proton::ssl::VERIFY_PEER);
}
