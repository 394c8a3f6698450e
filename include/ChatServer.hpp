#pragma once

// Standard Library Includes first
#include <memory>
#include <string>
#include <set>
#include <vector>
#include <mutex>
#include <atomic>

// Boost Includes
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include "NameDirectory.hpp"
#include "RoomRegistry.hpp"
#include "SessionInterface.hpp"

// Forward declarations
class ChatListener;
class ChatRoom;
class NameSelectionLogic;

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * @class ChatServer
 * @brief Boost.Asio TCP 기반 채팅 서버.
 *
 * @details 모든 세션의 단독 소유자이며, 이름 디렉터리와 방 레지스트리를 멤버로 가진다.
 * 새 세션은 공유된 이름 선택 로직에 바인딩되고, 이름을 고르면 홀로 이동한다.
 * 모든 채팅 로직은 서버 스트랜드 위에서 실행되므로 한 줄의 처리(브로드캐스트 포함)가
 * 끝난 뒤에 다음 이벤트가 처리된다. 쓰기는 세션별 큐로 비동기 처리되어
 * 한 연결이 느려도 다른 연결의 읽기를 막지 않는다.
 * @see ChatSession, ChatListener, ChatRoom, NameSelectionLogic
 */
class ChatServer : public std::enable_shared_from_this<ChatServer> {
public:
    using strand_type = net::strand<net::io_context::executor_type>;

private:
    // 서버 기본 자원
    net::io_context& ioc_;                ///< 서버가 사용할 io_context 참조
    std::string bind_address_;            ///< 리슨할 주소
    unsigned short port_;                 ///< 서버가 수신할 포트 번호
    std::string service_name_;            ///< 홀 이름과 환영 메시지에 쓰이는 서비스 이름
    std::shared_ptr<ChatListener> listener_ = nullptr; ///< 클라이언트 연결 수신 리스너

    // 세션 관리
    std::set<SessionPtr> sessions_;       ///< 현재 연결된 모든 세션 (단독 소유)
    mutable std::mutex sessions_mutex_;   ///< sessions_ 보호 뮤텍스

    // 이름/채팅방 관리
    NameDirectory names_;                 ///< 사용 중인 이름 목록
    RoomRegistry rooms_;                  ///< 홀 + 사용자 방 목록
    std::shared_ptr<NameSelectionLogic> name_selection_; ///< 모든 신규 세션이 처음 바인딩되는 로직

    // 스레드 안전 및 동시성 제어
    strand_type strand_;                  ///< 채팅 로직 직렬화를 위한 스트랜드

    // 상태 플래그
    std::atomic<bool> stopped_{false};    ///< 서버 중지 상태 플래그 (원자적 접근)

public:
    /**
     * @brief ChatServer 생성자 (io_context 주입 방식).
     * @param ioc 서버가 사용할 io_context 참조.
     * @param port 리슨할 포트 번호.
     * @param service_name 서비스 표시 이름. 홀 이름은 "<service_name> Hall"이 된다.
     * @param bind_address 리슨할 주소.
     */
    ChatServer(net::io_context& ioc,
               unsigned short port,
               const std::string& service_name = "TalkRoom",
               const std::string& bind_address = "0.0.0.0");

    /**
     * @brief ChatServer 소멸자.
     */
    ~ChatServer();

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    /**
     * @brief 서버 시작.
     * @details 리스너를 생성 및 시작한다. io_context 실행은 외부에서 담당한다.
     *          리스너 생성에 실패하면 에러 로그를 남기고 서버를 중지 상태로 둔다.
     */
    void run();

    /**
     * @brief 서버 중지 요청.
     * @details 스트랜드 위에서 리스너를 닫고 모든 세션을 종료시킨다.
     *          io_context 중지는 외부에서 담당한다.
     */
    void stop();

    /// 서버가 중지되었는지 여부.
    bool stopped() const { return stopped_.load(); }

    /**
     * @brief 새 클라이언트 세션 등록.
     * @param session 등록할 세션의 `shared_ptr`.
     * @details 세션을 `sessions_`에 보관(단독 소유)하고 이름 선택 로직에 바인딩한다.
     *          스트랜드 위에서 호출되어야 한다.
     */
    void on_connect(SessionPtr session);

    /**
     * @brief 세션이 로직에서 완전히 빠져나갔을 때 호출된다.
     * @param session 종료된 세션.
     * @details 세션의 이름을 해제하고 `sessions_`에서 제거한다. 없는 세션이면 아무 일도 하지 않는다.
     */
    void on_session_exit(SessionInterface& session);

    // --- 방 관리 (RoomRegistry 위임) ---

    /**
     * @brief 방이 없으면 만든다.
     * @param room_name 만들 방 이름.
     * @return 새로 만들었으면 true.
     */
    bool add_room(const std::string& room_name);

    /**
     * @brief 빈 방을 삭제한다.
     * @throw RoomNotFoundError, RoomNotEmptyError
     */
    void del_room(const std::string& room_name);

    /**
     * @brief 이름으로 방을 찾는다.
     * @throw RoomNotFoundError
     */
    std::shared_ptr<ChatRoom> get_room(const std::string& room_name) const;

    /// 홀 getter
    std::shared_ptr<ChatRoom> hall() const;

    /// 사용자 방 이름 목록 (사전 순)
    std::vector<std::string> room_names() const;

    // --- 이름 관리 ---

    /**
     * @brief 세션의 이름을 바꾼다.
     * @details 새 이름을 먼저 등록한 뒤 이전 이름을 해제한다.
     * @throw NameInUseError 다른 세션이 새 이름을 사용 중인 경우.
     */
    void rename_session(SessionInterface& session, const std::string& new_name);

    /// 이름 디렉터리 getter
    NameDirectory& name_directory() { return names_; }
    const NameDirectory& name_directory() const { return names_; }

    /// 이름 선택 로직 getter
    std::shared_ptr<NameSelectionLogic> name_selection() const { return name_selection_; }

    // --- 기타 ---

    /// 현재 세션 수
    std::size_t session_count() const;

    /// 서비스 이름 getter
    const std::string& service_name() const { return service_name_; }

    /// 설정된 포트 getter
    unsigned short port() const { return port_; }

    /// 실제로 리슨 중인 포트 (포트 0으로 시작한 경우 OS가 할당한 값, 리스너가 없으면 0)
    unsigned short listening_port() const;

    /// 채팅 로직 스트랜드 getter
    strand_type& get_strand() { return strand_; }

private:
    /**
     * @brief 내부적으로 리스너를 생성하고 시작하는 함수.
     * @details run() 메서드 내부에서 호출되어 실제 리스닝을 시작한다.
     *          shared_from_this()를 안전하게 호출하기 위해 분리됨.
     * @return 성공 시 true, 실패 시 false.
     */
    bool start_listening();
};
