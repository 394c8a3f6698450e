/**
 * @file NameSelectionLogic.hpp
 * @brief 접속 직후 사용자 이름을 고르게 하는 `NameSelectionLogic` 클래스를 정의합니다.
 */
#pragma once

#include "ChatLogic.hpp"

#include <memory>
#include <string>

class ChatRoom;
class NameDirectory;

/**
 * @class NameSelectionLogic
 * @brief 이름 선택 단계의 로직.
 * @details 모든 신규 세션이 처음 바인딩되는 로직으로, 서버 전체에 하나만 존재하며 공유됩니다.
 *          중복되지 않는 이름을 받으면 `NameDirectory`에 등록하고 세션을 다음 방(홀)으로 옮깁니다.
 */
class NameSelectionLogic : public ChatLogic {
private:
    std::string service_name_;           ///< 환영 메시지에 표시할 서비스 이름
    std::shared_ptr<ChatRoom> next_room_; ///< 이름 선택 성공 시 이동할 방
    NameDirectory& names_;               ///< 서버가 소유한 이름 목록 (공유, 비소유)

public:
    /**
     * @brief NameSelectionLogic 생성자.
     * @param service_name 환영 메시지에 표시할 서비스 이름.
     * @param next_room 이름 선택 성공 시 이동할 방.
     * @param names 이름 중복 검사에 사용할 디렉터리.
     */
    NameSelectionLogic(std::string service_name,
                       std::shared_ptr<ChatRoom> next_room,
                       NameDirectory& names);

    void on_data(SessionInterface& session, const std::string& line) override;
    void on_enter(SessionInterface& session) override;
    void on_leave(SessionInterface& session) override;

private:
    void prompt(SessionInterface& session) const;
};
