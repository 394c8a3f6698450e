/**
 * @file ChatRoom.hpp
 * @brief 채팅방의 기능과 상태를 관리하는 `ChatRoom` 클래스를 정의합니다.
 */
#pragma once

#include "ChatLogic.hpp"

#include <string>
#include <unordered_map>
#include <vector>

class ChatServer;
class SessionInterface;

/**
 * @brief '/'로 시작하는 명령 줄을 토큰으로 나눕니다.
 * @details 앞의 '/'를 뗀 나머지를 연속된 공백 단위로 최대 6개(명령어 + 인자 5개)로 나눕니다.
 *          마지막 토큰은 남은 문자열 전체이므로 공백을 포함할 수 있습니다.
 * @param line '/'로 시작하는 입력 줄.
 * @return std::vector<std::string> 첫 원소가 명령어인 토큰 목록. 명령어는 빈 문자열일 수 있습니다.
 */
std::vector<std::string> split_command_line(const std::string& line);

/**
 * @class ChatRoom
 * @brief 단일 채팅방을 나타내는 로직.
 * @details 채팅방의 이름, 참여자 목록을 관리하고, 해당 방에만 메시지를 브로드캐스트합니다.
 *          '/'로 시작하는 줄은 이름 기반 명령어 테이블로 분배합니다.
 *          참여자 세션은 소유하지 않으며, 목록 순서는 입장 순서입니다.
 *          `ChatServer`의 `RoomRegistry`에 의해 생성되고 관리됩니다.
 */
class ChatRoom : public ChatLogic {
public:
    /// 명령어 핸들러. 인자는 명령어 토큰을 제외한 나머지 토큰들입니다.
    using ActionHandler = void (ChatRoom::*)(SessionInterface&, const std::vector<std::string>&);

private:
    std::string name_;                          ///< 채팅방의 고유한 이름
    std::vector<SessionInterface*> participants_; ///< 참여 중인 세션 (비소유, 입장 순서)
    ChatServer& server_;                        ///< 방 생성/삭제/조회를 요청할 서버

public:
    /**
     * @brief ChatRoom 생성자.
     * @param name 생성할 채팅방의 이름.
     * @param server 방 관리 명령을 처리할 서버.
     */
    ChatRoom(const std::string& name, ChatServer& server);
    ~ChatRoom() override;

    void on_data(SessionInterface& session, const std::string& line) override;
    void on_enter(SessionInterface& session) override;
    void on_leave(SessionInterface& session) override;

    /**
     * @brief 채팅방에 참여한 모든 세션에게 메시지를 브로드캐스트합니다.
     * @details 보낸 사람을 포함한 모든 참여자에게 입장 순서대로 한 번씩 전달합니다.
     * @param message 전송할 한 줄.
     */
    void broadcast(const std::string& message);

    /**
     * @brief 현재 채팅방에 참여 중인 모든 사용자의 닉네임 목록을 반환합니다.
     * @return std::vector<std::string> 입장 순서의 닉네임 목록.
     */
    std::vector<std::string> get_participant_nicknames() const;

    /**
     * @brief 세션이 이 방에 참여 중인지 확인합니다.
     * @param session 확인할 세션.
     * @return bool 참여 중이면 `true`.
     */
    bool contains(const SessionInterface& session) const;

    /**
     * @brief 채팅방이 비어있는지 확인합니다.
     * @return bool 비어있으면 `true`, 아니면 `false`.
     */
    bool empty() const { return participants_.empty(); }

    /**
     * @brief 채팅방의 이름을 반환합니다.
     * @return const std::string& 채팅방 이름.
     */
    const std::string& name() const { return name_; }

    /**
     * @brief 현재 참여자 수를 반환합니다.
     * @return size_t 참여자 수.
     */
    size_t participant_count() const { return participants_.size(); }

private:
    /// 명령어 이름 -> 핸들러 테이블.
    static const std::unordered_map<std::string, ActionHandler>& action_table();

    /**
     * @brief 명령어를 찾아 실행합니다.
     * @throw UnknownActionError 테이블에 없는 명령어.
     */
    void dispatch_action(SessionInterface& session,
                         const std::string& action,
                         const std::vector<std::string>& args);

    void broadcast_user_state(const SessionInterface& session, const std::string& state);

    /// 첫 인자가 없으면 사용법 오류를 보내고 `false`를 반환합니다.
    static bool require_argument(SessionInterface& session,
                                 const std::vector<std::string>& args,
                                 const std::string& usage);

    void do_quit(SessionInterface& session, const std::vector<std::string>& args);
    void do_who(SessionInterface& session, const std::vector<std::string>& args);
    void do_addroom(SessionInterface& session, const std::vector<std::string>& args);
    void do_gotoroom(SessionInterface& session, const std::vector<std::string>& args);
    void do_delroom(SessionInterface& session, const std::vector<std::string>& args);
    void do_roomlist(SessionInterface& session, const std::vector<std::string>& args);
    void do_hall(SessionInterface& session, const std::vector<std::string>& args);
    void do_nick(SessionInterface& session, const std::vector<std::string>& args);
    void do_help(SessionInterface& session, const std::vector<std::string>& args);
};
