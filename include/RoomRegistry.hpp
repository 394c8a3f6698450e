/**
 * @file RoomRegistry.hpp
 * @brief 이름으로 채팅방을 관리하는 `RoomRegistry` 클래스를 정의합니다.
 */
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class ChatRoom;
class ChatServer;

/**
 * @class RoomRegistry
 * @brief 방 이름 -> `ChatRoom` 맵과 항상 존재하는 홀(hall).
 * @details 홀은 시작 시 생성되며 삭제 가능한 맵과 따로 보관되므로 어떤 이름으로도 삭제되지 않습니다.
 *          모든 변경과 조회는 내부 뮤텍스로 직렬화됩니다.
 *          `ChatServer`가 소유하며, 로직은 서버를 통해서만 접근합니다.
 */
class RoomRegistry {
private:
    ChatServer& server_;                                   ///< 새 방에 넘겨줄 서버 참조
    std::shared_ptr<ChatRoom> hall_;                       ///< 기본 방 (삭제 불가)
    std::map<std::string, std::shared_ptr<ChatRoom>> rooms_; ///< 사용자가 만든 방들
    mutable std::mutex rooms_mutex_;                       ///< rooms_ 보호 뮤텍스

public:
    /**
     * @brief RoomRegistry 생성자. 홀을 생성합니다.
     * @param server 방들이 방 관리 명령을 요청할 서버.
     * @param hall_name 홀의 표시 이름.
     */
    RoomRegistry(ChatServer& server, const std::string& hall_name);

    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    /**
     * @brief 방이 없으면 새로 만듭니다.
     * @param name 만들 방 이름.
     * @return 새로 만들었으면 `true`, 이미 있었으면 `false`.
     */
    bool create(const std::string& name);

    /**
     * @brief 빈 방을 삭제합니다.
     * @param name 삭제할 방 이름.
     * @throw RoomNotFoundError 방이 없는 경우.
     * @throw RoomNotEmptyError 참여자가 남아있는 경우.
     */
    void remove(const std::string& name);

    /**
     * @brief 이름으로 방을 찾습니다.
     * @param name 찾을 방 이름.
     * @return std::shared_ptr<ChatRoom> 찾은 방.
     * @throw RoomNotFoundError 방이 없는 경우.
     */
    std::shared_ptr<ChatRoom> lookup(const std::string& name) const;

    /// 홀 getter
    const std::shared_ptr<ChatRoom>& hall() const { return hall_; }

    /// 사용자가 만든 방 이름 목록 (사전 순, 홀 제외).
    std::vector<std::string> names() const;

    /// 사용자가 만든 방 수 (홀 제외).
    std::size_t size() const;
};
