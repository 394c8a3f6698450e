#ifndef SESSION_INTERFACE_HPP
#define SESSION_INTERFACE_HPP

#include <string>
#include <memory>

class ChatLogic;
class ChatServer;

/**
 * @class SessionInterface
 * @brief 세션의 공통 인터페이스와 로직 위임 핵심부.
 * @details 전송 계층(TCP 등)은 `deliver`/`stop_session`/`remote_id`만 구현하고,
 *          한 줄 단위 입력은 `submit_line`으로 넘긴다. 세션은 현재 바인딩된
 *          `ChatLogic`에 모든 입력을 위임하며, 바인딩 교체는 `change_logic`만 수행한다.
 *          세션 객체는 `ChatServer`가 단독으로 소유한다.
 */
class SessionInterface
{
public:
    virtual ~SessionInterface() = default;

    SessionInterface(const SessionInterface&) = delete;
    SessionInterface& operator=(const SessionInterface&) = delete;

    /// 클라이언트에게 한 줄 전달 (줄 끝 개행은 구현체가 붙인다)
    virtual void deliver(const std::string& msg) = 0;

    /// 세션 종료. 반환 전에 change_logic(nullptr) 처리가 끝나야 한다.
    virtual void stop_session() = 0;

    /// 원격 ID (IP:port) getter
    virtual const std::string& remote_id() const = 0;

    /// 닉네임 getter
    const std::string& nickname() const { return nickname_; }

    /// 닉네임 setter
    void set_nickname(const std::string& nick) { nickname_ = nick; }

    /**
     * @brief 전송 계층이 완성된 한 줄을 전달한다.
     * @param line 종결 문자가 제거된 줄. 그대로 현재 로직의 on_data로 전달된다.
     */
    void submit_line(const std::string& line);

    /**
     * @brief 현재 로직을 교체한다.
     * @details 기존 로직이 있으면 on_leave를 먼저 호출하고, 새 로직을 바인딩한 뒤 on_enter를 호출한다.
     *          nullptr로 교체하면 세션이 완전히 빠져나간 것으로 보고 서버에 알린다
     *          (이름 해제, 세션 집합에서 제거).
     * @param logic 새로 바인딩할 로직. nullptr이면 세션 종료 처리.
     */
    void change_logic(std::shared_ptr<ChatLogic> logic);

    /// 현재 로직 getter (종료 중이면 nullptr)
    const std::shared_ptr<ChatLogic>& current_logic() const { return logic_; }

protected:
    /**
     * @brief SessionInterface 생성자.
     * @param server 세션이 속한 서버. 로직이 해제될 때 통보 대상이 된다.
     */
    explicit SessionInterface(std::shared_ptr<ChatServer> server);

    std::shared_ptr<ChatServer> server_;

private:
    std::shared_ptr<ChatLogic> logic_;
    std::string nickname_ = "anonymous";
};

/// @brief SessionInterface에 대한 공유 포인터 타입 정의.
using SessionPtr = std::shared_ptr<SessionInterface>;

#endif // SESSION_INTERFACE_HPP
