/**
 * @file ChatSession.cpp
 * @brief `ChatSession` 클래스의 구현부입니다.
 * @details 이 파일은 `ChatSession.hpp`에 선언된 멤버 함수들을 실제로 정의합니다.
 */

#include "ChatSession.hpp" // 해당 클래스의 헤더를 가장 먼저 인클루드합니다.

#include "spdlog/spdlog.h" // 로깅 라이브러리 spdlog 인클루드

// 필요한 Boost.Asio 헤더들
#include <boost/asio/bind_executor.hpp> // 비동기 작업 핸들러를 특정 executor(strand)에 바인딩
#include <boost/asio/buffer.hpp>        // 데이터 버퍼 관리를 위함
#include <boost/asio/dispatch.hpp>      // 핸들러를 executor 컨텍스트 내에서 즉시 실행
#include <boost/asio/read_until.hpp>    // 특정 구분자까지 데이터를 읽는 비동기 작업
#include <boost/asio/write.hpp>         // 데이터를 쓰는 비동기 작업

// 표준 라이브러리 헤더들
#include <exception>
#include <memory>
#include <string>

namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace beast = boost::beast;

//------------------------------------------------------------------------------
// ChatSession 클래스 멤버 함수 구현
//------------------------------------------------------------------------------

/**
 * @details 소켓과 서버 포인터를 저장하고, 서버의 스트랜드를 공유합니다.
 *          클라이언트의 원격 엔드포인트 정보(IP:PORT)를 `remote_id_`로 설정합니다.
 */
ChatSession::ChatSession(tcp::socket socket, std::shared_ptr<ChatServer> server)
    : SessionInterface(server),
      socket_(std::move(socket)),
      strand_(server->get_strand())
{
    try {
        remote_id_ = socket_.remote_endpoint().address().to_string() + ":" +
                     std::to_string(socket_.remote_endpoint().port());
        spdlog::info("[ChatSession {} - {}] Created.", static_cast<void*>(this), remote_id_);
    } catch (const std::exception& e) {
        spdlog::error("[ChatSession {} - ???] Failed to get remote endpoint: {}", static_cast<void*>(this), e.what());
        remote_id_ = "UnknownClient";
    }
}

ChatSession::~ChatSession() {
    spdlog::info("[ChatSession {} - {}] Destroyed.", static_cast<void*>(this), remote_id_);
}

/**
 * @details 서버 등록과 첫 읽기를 스트랜드 위에서 수행하므로,
 *          이름 선택 안내 메시지가 첫 입력 처리보다 먼저 전송됩니다.
 */
void ChatSession::start()
{
    auto self = shared_from_this();
    net::dispatch(strand_, [this, self]() {
        if (stopped_.load()) {
            spdlog::warn("[ChatSession {}] start() called on stopped session.", static_cast<void*>(this));
            return;
        }
        spdlog::info("[ChatSession {}] Starting session for {}.", static_cast<void*>(this), remote_id_);
        server_->on_connect(self);
        if (!stopped_.load()) {
            do_read();
        }
    });
}

/**
 * @details `stopped_` 플래그로 중복 실행을 막습니다.
 *          로직 해제(방 퇴장, 이름 해제, 서버 세션 목록 제거)는 이 호출 안에서 끝나고,
 *          소켓은 진행 중인 쓰기가 없으면 즉시, 있으면 큐가 비는 시점에 닫힙니다.
 */
void ChatSession::stop_session() {
    auto self = shared_from_this(); // Keep alive while dispatching
    net::dispatch(strand_, [this, self]() {
        if (stopped_.exchange(true)) return; // Ensure stop logic runs only once

        spdlog::info("[ChatSession {} - {}] Stopping session ('{}').",
                     static_cast<void*>(this), remote_id_, nickname());
        change_logic(nullptr);

        if (!writing_flag_) {
            close_socket();
        }
    });
}

void ChatSession::deliver(const std::string& msg) {
    auto self = shared_from_this();
    net::dispatch(strand_, [this, self, msg]() {
        if (stopped_) {
            spdlog::trace("[ChatSession {}] deliver called but stopped, ignoring msg: {}", static_cast<void*>(this), msg);
            return;
        }

        write_msgs_.push_back(msg + "\r\n");
        spdlog::trace("[ChatSession {}] Queued msg ({}): '{}'. Queue size: {}",
                      static_cast<void*>(this), msg.length(), msg, write_msgs_.size());

        if (!writing_flag_) {
            do_write_strand();
        }
    });
}

const std::string& ChatSession::remote_id() const { return remote_id_; }

// --- Private Methods ---

/**
 * @details `read_buffer_`에는 이전 읽기에서 남은 불완전한 데이터가 유지됩니다.
 *          종결 문자 없이 `max_line_length`를 넘으면 `not_found` 에러로 완료됩니다.
 */
void ChatSession::do_read() {
    if (stopped_ || !socket_.is_open()) return;
    auto self = shared_from_this();
    net::async_read_until(socket_, net::dynamic_buffer(read_buffer_, max_line_length), "\n",
        // Ensure handler runs on the strand
        net::bind_executor(strand_,
            [this, self](beast::error_code ec, std::size_t length) {
                on_read(ec, length);
            }
        )
    );
}

/**
 * @details 에러가 없으면 버퍼 앞에서 한 줄을 떼어 내 끝의 CR을 제거한 뒤 `submit_line`으로 넘깁니다.
 *          빈 줄도 그대로 넘깁니다. 세션이 살아있으면 다음 줄을 읽습니다.
 *          에러(EOF, 연결 리셋, 너무 긴 줄 등)가 발생하면 세션을 종료합니다.
 */
void ChatSession::on_read(beast::error_code ec, std::size_t length) {
    if (stopped_) return;

    if (!ec) {
        std::string line = read_buffer_.substr(0, length - 1);
        read_buffer_.erase(0, length);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        try {
            submit_line(line);
        } catch (const std::exception& e) {
            spdlog::error("[ChatSession {} - {}] Exception during line processing: {}",
                          static_cast<void*>(this), remote_id_, e.what());
            stop_session();
            return;
        }

        if (!stopped_) {
            do_read();
        }
        return;
    }

    if (ec == net::error::not_found) {
        spdlog::warn("[ChatSession {} - {}] Line exceeds {} bytes without terminator, closing.",
                     static_cast<void*>(this), remote_id_, max_line_length);
    } else if (ec == net::error::eof) {
        spdlog::info("[ChatSession {} - {}] Connection closed by peer (EOF).", static_cast<void*>(this), remote_id_);
    } else if (ec == net::error::connection_reset) {
        spdlog::info("[ChatSession {} - {}] Connection reset by peer.", static_cast<void*>(this), remote_id_);
    } else if (ec == net::error::operation_aborted) {
        spdlog::info("[ChatSession {} - {}] Read operation aborted.", static_cast<void*>(this), remote_id_);
    } else {
        spdlog::error("[ChatSession {} - {}] Read error: {} ({})", static_cast<void*>(this), remote_id_, ec.message(), ec.value());
    }
    stop_session();
}

void ChatSession::do_write_strand() {
    if (write_msgs_.empty() || writing_flag_ || !socket_.is_open()) {
        return;
    }

    writing_flag_ = true; // Mark that a write operation is now in progress
    auto self = shared_from_this();
    net::async_write(socket_,
        net::buffer(write_msgs_.front()),
        net::bind_executor(strand_,
            [this, self](beast::error_code ec, std::size_t length) {
                on_write(ec, length);
            }
        )
    );
}

/**
 * @details 성공하면 보낸 메시지를 큐에서 제거하고 다음 메시지를 씁니다.
 *          세션이 중지된 상태에서 큐가 비면 소켓을 닫습니다.
 *          에러가 나면 큐를 비우고 세션을 종료합니다.
 */
void ChatSession::on_write(beast::error_code ec, std::size_t /*length*/) {
    writing_flag_ = false;

    if (ec) {
        if (ec != net::error::operation_aborted) {
            spdlog::error("[ChatSession {} - {}] Write error: {} ({})",
                          static_cast<void*>(this), remote_id_, ec.message(), ec.value());
        }
        write_msgs_.clear();
        if (stopped_) {
            close_socket();
        } else {
            stop_session();
        }
        return;
    }

    write_msgs_.pop_front();
    if (!write_msgs_.empty()) {
        do_write_strand();
    } else if (stopped_) {
        close_socket();
    }
}

void ChatSession::close_socket() {
    if (!socket_.is_open()) {
        return;
    }
    beast::error_code ignored_ec;

    // Cancel any pending asynchronous operations (read, write)
    socket_.cancel(ignored_ec);

    // Gracefully shutdown the socket
    socket_.shutdown(tcp::socket::shutdown_both, ignored_ec);

    // Close the socket
    socket_.close(ignored_ec);
    if (ignored_ec) {
        spdlog::error("[ChatSession {} - {}] Socket close error: {}",
                      static_cast<void*>(this), remote_id_, ignored_ec.message());
    } else {
        spdlog::info("[ChatSession {} - {}] Socket closed successfully.", static_cast<void*>(this), remote_id_);
    }
}
