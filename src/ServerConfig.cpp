#include "ServerConfig.hpp"

#include "spdlog/spdlog.h"

#include <cstdlib>   // getenv
#include <stdexcept> // runtime_error
#include <string>

unsigned short get_required_port_env_var(const std::string& var_name, unsigned short default_port) {
    const char* value_str = std::getenv(var_name.c_str());
    if (value_str == nullptr) {
        spdlog::info("Environment variable '{}' not set. Using default value: {}", var_name, default_port);
        return default_port;
    }
    int port_int = 0;
    try {
        std::size_t consumed = 0;
        port_int = std::stoi(value_str, &consumed);
        if (consumed != std::string(value_str).size()) {
            throw std::invalid_argument("trailing characters");
        }
    }
    catch (const std::invalid_argument& ia) {
        throw std::runtime_error(fmt::format(
            "Failed to convert environment variable '{}' value '{}' to integer: {}", var_name, value_str, ia.what()));
    }
    catch (const std::out_of_range& oor) {
        throw std::runtime_error(fmt::format(
            "Environment variable '{}' value '{}' is out of integer range: {}", var_name, value_str, oor.what()));
    }

    if (port_int <= 0 || port_int > 65535) {
        throw std::runtime_error(fmt::format(
            "Environment variable '{}' value '{}' is out of valid port range (1-65535).", var_name, value_str));
    }
    spdlog::info("Read environment variable '{}': {}", var_name, port_int);
    return static_cast<unsigned short>(port_int);
}

std::string get_env_var(const std::string& var_name, const std::string& default_value) {
    const char* value = std::getenv(var_name.c_str());
    if (value == nullptr) {
        spdlog::info("Environment variable '{}' not set. Using default value: '{}'", var_name, default_value);
        return default_value;
    }
    spdlog::info("Read environment variable '{}': '{}'", var_name, value);
    return std::string(value);
}

int get_int_env_var(const std::string& var_name, int default_value) {
    const char* value_str = std::getenv(var_name.c_str());
    if (value_str == nullptr) {
        spdlog::info("Environment variable '{}' not set. Using default value: {}", var_name, default_value);
        return default_value;
    }
    try {
        int value_int = std::stoi(value_str);
        spdlog::info("Read environment variable '{}': {}", var_name, value_int);
        return value_int;
    }
    catch (const std::exception& e) { // stoi 실패 (invalid_argument, out_of_range)
        spdlog::warn("Failed to convert environment variable '{}' value '{}' to integer ({}). Using default value: {}",
                     var_name, value_str, e.what(), default_value);
        return default_value;
    }
}

ServerConfig load_server_config() {
    ServerConfig config;
    config.port = get_required_port_env_var("CHAT_SERVER_PORT", config.port);
    config.bind_ip = get_env_var("CHAT_BIND_IP", config.bind_ip);
    config.service_name = get_env_var("CHAT_SERVICE_NAME", config.service_name);

    config.io_threads = get_int_env_var("CHAT_THREADS", config.io_threads);
    if (config.io_threads < 1) {
        spdlog::warn("CHAT_THREADS must be at least 1 (got {}). Using 1.", config.io_threads);
        config.io_threads = 1;
    }

    // from_str는 모르는 이름에 대해 off를 돌려주므로 "off"만 명시적으로 허용한다.
    std::string level_name = get_env_var("LOG_LEVEL", "info");
    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
        spdlog::warn("Unknown LOG_LEVEL '{}'. Falling back to 'info'.", level_name);
        level = spdlog::level::info;
    }
    config.log_level = level;
    return config;
}
