#ifndef SSL_UTILS_HPP
#define SSL_UTILS_HPP

#include "client_config.hpp"
#include <proton/ssl.hpp>
#include <string>

using proton::ssl_certificate;

std::string cert_path(const std::string& dir, const std::string& file_name);
std::string platform_CA(const std::string& dir, const std::string& base_name);
ssl_certificate platform_certificate(const std::string& dir, const std::string& base_name, const std::string& passwd);
std::string find_CN(const std::string& subject);

// Client certificate <cert_name>.crt/.key and trust store ca.pem from config.cert_dir
proton::ssl_client_options make_ssl_client_options(const ClientConfig& config);

#endif // SSL_UTILS_HPP
