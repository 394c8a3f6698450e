/**
 * @file NameSelectionLogic.cpp
 * @brief `NameSelectionLogic` 클래스의 구현부입니다.
 */

#include "NameSelectionLogic.hpp"

#include "ChatErrors.hpp"
#include "ChatRoom.hpp"
#include "NameDirectory.hpp"
#include "SessionInterface.hpp"
#include "spdlog/spdlog.h"

#include <utility>

NameSelectionLogic::NameSelectionLogic(std::string service_name,
                                       std::shared_ptr<ChatRoom> next_room,
                                       NameDirectory& names)
    : service_name_(std::move(service_name)),
      next_room_(std::move(next_room)),
      names_(names)
{
}

void NameSelectionLogic::prompt(SessionInterface& session) const
{
    session.deliver("Please input your user name >");
}

void NameSelectionLogic::on_enter(SessionInterface& session)
{
    session.deliver("Welcome to " + service_name_);
    prompt(session);
}

/**
 * @details 빈 줄이면 다시 묻고, 이미 사용 중인 이름이면 오류와 함께 다시 묻습니다.
 *          두 경우 모두 세션은 이 로직에 그대로 남습니다.
 *          성공하면 이름을 등록하고 세션의 닉네임을 바꾼 뒤 다음 방으로 이동시킵니다.
 */
void NameSelectionLogic::on_data(SessionInterface& session, const std::string& line)
{
    if (line.empty()) {
        prompt(session);
        return;
    }

    try {
        names_.acquire(line, session);
    } catch (const NameInUseError&) {
        session.deliver("Error: name exists.");
        prompt(session);
        return;
    }

    spdlog::info("[NameSelection] Session {} ({}) picked name '{}'.",
                 static_cast<void*>(&session), session.remote_id(), line);
    session.set_nickname(line);
    session.change_logic(next_room_);
}

/**
 * @details 이 로직에 있는 동안에는 등록된 이름이 없으므로 해제할 것이 없습니다.
 *          연결 종료 시의 이름 해제는 `ChatServer::on_session_exit`이 담당합니다.
 */
void NameSelectionLogic::on_leave(SessionInterface& session)
{
    spdlog::debug("[NameSelection] Session {} left name selection.", static_cast<void*>(&session));
}
