/**
 * @file ChatErrors.hpp
 * @brief 채팅 로직에서 발생하는 오류 타입들을 정의합니다.
 * @details 모든 오류는 발생한 지점(이름 선택 로직, 방 명령어 핸들러)에서 잡혀서
 *          요청한 세션에게 한 줄의 오류 메시지로 전달됩니다. 연결이나 프로세스를 종료시키지 않습니다.
 */
#pragma once

#include <stdexcept>
#include <string>

/// 채팅 로직 오류의 공통 기반 클래스.
class ChatLogicError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// '/'로 시작하지만 등록되지 않은 명령어.
class UnknownActionError : public ChatLogicError {
public:
    explicit UnknownActionError(const std::string& action)
        : ChatLogicError("unknown action: " + action), action_(action) {}

    const std::string& action() const { return action_; }

private:
    std::string action_;
};

/// 다른 세션이 이미 사용 중인 이름.
class NameInUseError : public ChatLogicError {
public:
    explicit NameInUseError(const std::string& name)
        : ChatLogicError("name in use: " + name) {}
};

/// 존재하지 않는 방 이름.
class RoomNotFoundError : public ChatLogicError {
public:
    explicit RoomNotFoundError(const std::string& room_name)
        : ChatLogicError("no such room: " + room_name) {}
};

/// 참여자가 남아있는 방을 삭제하려는 경우.
class RoomNotEmptyError : public ChatLogicError {
public:
    explicit RoomNotEmptyError(const std::string& room_name)
        : ChatLogicError("room not empty: " + room_name) {}
};
