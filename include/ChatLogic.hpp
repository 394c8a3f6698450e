/**
 * @file ChatLogic.hpp
 * @brief 세션의 입력을 해석하는 로직의 추상 인터페이스를 정의합니다.
 */
#pragma once

#include <string>

class SessionInterface;

/**
 * @class ChatLogic
 * @brief 세션에 현재 바인딩된 동작(이름 선택, 채팅방 등).
 * @details 세션은 한 시점에 하나의 로직에만 바인딩되며, 들어오는 모든 줄을 그 로직에 전달합니다.
 *          `on_enter`/`on_leave`는 `SessionInterface::change_logic`에서만 쌍으로 호출됩니다.
 *          로직은 세션을 소유하지 않습니다.
 * @see SessionInterface, NameSelectionLogic, ChatRoom
 */
class ChatLogic {
public:
    virtual ~ChatLogic() = default;

    /**
     * @brief 세션으로부터 완성된 한 줄을 받았을 때 호출됩니다.
     * @param session 줄을 보낸 세션.
     * @param line 종결 문자가 제거된 줄 (빈 문자열일 수 있음).
     */
    virtual void on_data(SessionInterface& session, const std::string& line) = 0;

    /**
     * @brief 세션이 이 로직에 바인딩된 직후 호출됩니다.
     * @param session 들어온 세션.
     */
    virtual void on_enter(SessionInterface& session) = 0;

    /**
     * @brief 세션이 이 로직에서 벗어나기 직전에 호출됩니다.
     * @param session 나가는 세션.
     */
    virtual void on_leave(SessionInterface& session) = 0;
};
