/**
 * @file SessionInterface.cpp
 * @brief `SessionInterface`의 로직 위임 부분 구현입니다.
 */

#include "SessionInterface.hpp"

#include "ChatLogic.hpp"
#include "ChatServer.hpp"
#include "spdlog/spdlog.h"

#include <utility>

SessionInterface::SessionInterface(std::shared_ptr<ChatServer> server)
    : server_(std::move(server))
{
}

/**
 * @details 바인딩된 로직이 없으면(종료 처리 중) 줄을 버리고 경고 로그만 남깁니다.
 */
void SessionInterface::submit_line(const std::string& line)
{
    if (!logic_) {
        spdlog::warn("[Session {} - {}] Line received with no logic bound, dropping.",
                     static_cast<void*>(this), remote_id());
        return;
    }
    spdlog::debug("[Session {} - {}] Received: {}", static_cast<void*>(this), remote_id(), line);
    // on_data 안에서 change_logic이 일어날 수 있으므로 로컬 참조를 유지한다.
    auto logic = logic_;
    logic->on_data(*this, line);
}

/**
 * @details leave -> 교체 -> enter 순서를 여기서만 보장합니다.
 *          호출자는 on_enter/on_leave를 직접 부르지 않습니다.
 */
void SessionInterface::change_logic(std::shared_ptr<ChatLogic> logic)
{
    if (logic_) {
        auto old_logic = logic_;
        old_logic->on_leave(*this);
    }
    logic_ = std::move(logic);
    if (logic_) {
        auto new_logic = logic_;
        new_logic->on_enter(*this);
    } else if (server_) {
        server_->on_session_exit(*this);
    }
}
