/**
 * @file ServerConfig.hpp
 * @brief 환경 변수에서 서버 설정을 읽어오는 헬퍼 함수와 설정 구조체를 선언합니다.
 */
#pragma once

#include <string>

#include "spdlog/common.h"

/**
 * @struct ServerConfig
 * @brief 채팅 서버 실행에 필요한 설정 값 모음.
 */
struct ServerConfig {
    unsigned short port = 5005;                       ///< CHAT_SERVER_PORT
    std::string bind_ip = "0.0.0.0";                  ///< CHAT_BIND_IP
    std::string service_name = "TalkRoom";            ///< CHAT_SERVICE_NAME
    int io_threads = 1;                               ///< CHAT_THREADS (최소 1)
    spdlog::level::level_enum log_level = spdlog::level::info; ///< LOG_LEVEL
};

/**
 * @brief 환경 변수에서 포트 번호를 읽어온다. 없으면 기본값을 사용한다.
 * @param var_name 읽어올 환경 변수 이름.
 * @param default_port 환경 변수가 없을 경우 사용할 기본 포트 번호.
 * @return 읽어온 포트 번호.
 * @throw std::runtime_error 값이 유효한 포트 범위(1-65535)가 아니거나 숫자로 변환 불가능한 경우.
 */
unsigned short get_required_port_env_var(const std::string& var_name, unsigned short default_port);

/**
 * @brief 환경 변수에서 문자열 값을 읽어온다. 없으면 기본값을 사용한다.
 */
std::string get_env_var(const std::string& var_name, const std::string& default_value);

/**
 * @brief 환경 변수에서 정수 값을 읽어온다. 없거나 유효하지 않으면 기본값을 사용한다.
 */
int get_int_env_var(const std::string& var_name, int default_value);

/**
 * @brief 모든 채팅 서버 설정을 환경 변수에서 읽어 모은다.
 * @throw std::runtime_error 포트 값이 잘못된 경우.
 */
ServerConfig load_server_config();
