#include "ChatServer.hpp"              // Chat Server 헤더
#include "ServerConfig.hpp"            // 환경 변수 설정
#include "spdlog/spdlog.h"
#include <boost/asio/io_context.hpp>   // Asio io_context
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>   // SIGINT, SIGTERM 처리
#include <boost/system/error_code.hpp>
#include <iostream>
#include <stdexcept>                   // runtime_error
#include <string>
#include <thread>                      // std::thread
#include <vector>
#include <csignal>                     // SIGINT, SIGTERM
#include <memory>                      // std::shared_ptr
#include <system_error>                // std::system_error (예외 처리)

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h> // SetConsoleOutputCP, SetConsoleCP
#endif

namespace net = boost::asio;

/**
 * @file main.cpp
 * @brief TalkRoom 채팅 서버 애플리케이션의 메인 진입점 파일.
 *
 * 환경 변수에서 설정을 읽어 Chat 서버를 생성하고 실행한다.
 * POSIX 시그널(SIGINT, SIGTERM)을 처리하여 서버의 정상 종료(graceful shutdown)를 지원한다.
 */

/**
 * @brief 애플리케이션 메인 함수.
 * @return 성공 시 0, 오류 시 1.
 */
int main(int /*argc*/, char* /*argv*/[]) {
#ifdef _WIN32
    // 콘솔 입출력 코드 페이지를 UTF-8로 설정
    if (!SetConsoleOutputCP(CP_UTF8) || !SetConsoleCP(CP_UTF8)) {
        std::cerr << "Warning: Failed to set console codepage to UTF-8. Error code: " << GetLastError() << std::endl;
    }
#endif

    try {
        // --- 설정 값 읽기 (환경 변수 사용) ---
        ServerConfig config = load_server_config();
        spdlog::set_level(config.log_level);

        net::io_context ioc{config.io_threads};
        auto chat_server = std::make_shared<ChatServer>(ioc, config.port, config.service_name, config.bind_ip);

        // --- signal_set 핸들러 설정 (서버 객체 생성 후) ---
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, chat_server](const boost::system::error_code& ec, int signal_number) {
                if (ec) {
                    if (ec != net::error::operation_aborted) {
                        spdlog::error("Signal wait error: {}", ec.message());
                    }
                    return;
                }
                spdlog::info("Shutdown signal ({}) received. Initiating graceful shutdown...", signal_number);
                chat_server->stop();
                // 스트랜드는 FIFO이므로 서버 종료 시퀀스(퇴장 브로드캐스트, 소켓 종료)가 끝난 뒤에 멈춘다.
                net::post(chat_server->get_strand(), [&ioc]() { ioc.stop(); });
            });

        // --- 서버 시작 ---
        chat_server->run();
        if (chat_server->stopped()) {
            spdlog::critical("Chat server failed to start on {}:{}", config.bind_ip, config.port);
            return 1;
        }
        spdlog::info("Chat server '{}' starting on {}:{} ({} threads)",
                     config.service_name, config.bind_ip, chat_server->listening_port(), config.io_threads);

        // --- io_context 실행 스레드 시작 ---
        std::vector<std::thread> io_threads;
        io_threads.reserve(config.io_threads);
        for (int i = 0; i < config.io_threads; ++i) {
            io_threads.emplace_back([&ioc, i]() {
                spdlog::debug("[IO Thread {}] Starting io_context::run()...", i);
                try {
                    ioc.run();
                    spdlog::debug("[IO Thread {}] io_context::run() finished.", i);
                } catch (const std::exception& e) {
                    spdlog::error("[IO Thread {}] Exception: {}", i, e.what());
                    ioc.stop();
                }
            });
        }

        spdlog::info("Server running. Press Ctrl+C or send SIGTERM to exit.");

        // 시그널 핸들러가 stop()을 호출하고 io_context를 중지시킬 때까지 대기
        for (auto& t : io_threads) {
            if (t.joinable()) {
                t.join();
            }
        }
        spdlog::info("Main thread exiting after IO threads finished.");
    }
    catch (const std::system_error& e) {
        spdlog::critical("System error during server setup or execution: {} (code: {})", e.what(), e.code().value());
        return 1;
    }
    catch (const std::runtime_error& e) {
        spdlog::critical("Runtime error during server setup: {}", e.what());
        return 1;
    }
    catch (const std::exception& e) {
        spdlog::critical("Unhandled standard exception in main: {}", e.what());
        return 1;
    }

    spdlog::info("Server application finished gracefully.");
    return 0;
}
