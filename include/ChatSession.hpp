/**
 * @file ChatSession.hpp
 * @brief TCP 클라이언트와의 채팅 세션을 관리하는 클래스를 정의합니다.
 * @details 각 클라이언트는 하나의 `ChatSession` 인스턴스를 가지며,
 * 이 클래스는 바이트 수신과 줄 단위 분리, 메시지 전송 큐를 담당합니다.
 * 들어온 줄의 해석은 `SessionInterface`를 통해 현재 바인딩된 `ChatLogic`에 위임됩니다.
 * 비동기 I/O 작업을 위해 Boost.Asio를 사용하며, 모든 핸들러는 서버 스트랜드에서 실행됩니다.
 */
#pragma once

#include <memory>
#include <string>
#include <deque>
#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/error.hpp> // For beast::error_code
#include "ChatServer.hpp"
#include "SessionInterface.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace beast = boost::beast;

/**
 * @class ChatSession
 * @brief 개별 TCP 클라이언트와의 통신을 담당하는 클래스.
 * @details SessionInterface를 구현하며, 클라이언트의 연결부터 종료까지 전체 생명주기를 관리합니다.
 *          수신 데이터는 개행 단위로 잘라 `submit_line`으로 넘기고, 전송은 큐에 쌓아 순서대로 씁니다.
 * @see SessionInterface
 * @see ChatServer
 */
class ChatSession : public SessionInterface, public std::enable_shared_from_this<ChatSession> {
public:
    /// 종결 문자 없이 버퍼에 쌓일 수 있는 최대 바이트 수
    static constexpr std::size_t max_line_length = 4096;

private:
    tcp::socket socket_;
    ChatServer::strand_type strand_;
    std::string read_buffer_;
    std::deque<std::string> write_msgs_;
    bool writing_flag_ = false;
    std::string remote_id_;
    std::atomic<bool> stopped_{false};

public:
    /**
     * @brief ChatSession 생성자.
     * @param socket 클라이언트와 연결된 TCP 소켓. `std::move`를 통해 소유권이 이전됩니다.
     * @param server 세션이 속한 `ChatServer`의 `shared_ptr`.
     */
    explicit ChatSession(tcp::socket socket, std::shared_ptr<ChatServer> server);
    ~ChatSession() override;

    /**
     * @brief 세션 처리를 시작합니다.
     * @details 스트랜드 위에서 ChatServer에 세션을 등록(이름 선택 로직 바인딩)한 후 비동기 읽기 작업을 시작합니다.
     */
    void start();

    // SessionInterface implementation
    /**
     * @brief 세션을 중지하고 연결을 종료합니다.
     * @details 스트랜드 위에서 로직 해제(`change_logic(nullptr)`)까지 동기적으로 마치고,
     *          큐에 남은 메시지를 모두 보낸 뒤 소켓을 닫습니다.
     * @override
     */
    void stop_session() override;
    /**
     * @brief 클라이언트에게 한 줄을 전송합니다.
     * @details "\r\n"을 붙여 전송 큐에 추가하고, 쓰기 작업이 진행 중이 아니면 비동기 쓰기 작업을 시작합니다.
     * @param msg 전송할 메시지 문자열.
     * @override
     */
    void deliver(const std::string& msg) override;
    /**
     * @brief 현재 세션의 원격 ID(IP:Port)를 반환합니다.
     * @return const std::string& 원격 ID.
     * @override
     */
    const std::string& remote_id() const override;

private:
    /**
     * @brief 클라이언트로부터 비동기적으로 데이터를 읽기 시작합니다.
     * @details 개행 문자('\n')를 만날 때까지 데이터를 읽습니다.
     */
    void do_read();
    /**
     * @brief 비동기 읽기 작업의 완료 콜백 핸들러.
     * @param ec 작업 결과 에러 코드.
     * @param length 개행 문자까지 포함한 줄의 길이.
     */
    void on_read(beast::error_code ec, std::size_t length);
    /**
     * @brief 전송 큐에 있는 메시지를 비동기적으로 쓰기 시작합니다.
     * @details 이 메서드는 반드시 스트랜드 내에서 호출되어야 합니다.
     */
    void do_write_strand();
    /**
     * @brief 비동기 쓰기 작업의 완료 콜백 핸들러.
     * @param ec 작업 결과 에러 코드.
     * @param length 전송한 데이터의 길이.
     */
    void on_write(beast::error_code ec, std::size_t length);
    /// 소켓을 정상 종료(shutdown)한 후 닫습니다.
    void close_socket();
};
