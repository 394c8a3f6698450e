/**
 * @file ChatRoom.cpp
 * @brief `ChatRoom` 클래스의 멤버 함수 구현부입니다.
 */

#include "ChatRoom.hpp"
#include "ChatErrors.hpp"
#include "ChatServer.hpp"
#include "SessionInterface.hpp"
#include "spdlog/spdlog.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace {

/// 명령 줄 최대 토큰 수 (명령어 + 인자 5개)
constexpr std::size_t kMaxCommandTokens = 6;

/// 현재 시각의 문자열 표현 (예: "Mon Oct 19 20:21:00 2026")
std::string now_str()
{
    std::time_t now = std::time(nullptr);
    struct tm timeinfo;
#ifdef _MSC_VER
    localtime_s(&timeinfo, &now);
#else
    localtime_r(&now, &timeinfo);
#endif
    return fmt::format("{:%a %b %d %H:%M:%S %Y}", timeinfo);
}

} // namespace

std::vector<std::string> split_command_line(const std::string& line)
{
    std::vector<std::string> tokens;
    std::size_t pos = (!line.empty() && line.front() == '/') ? 1 : 0;

    while (tokens.size() + 1 < kMaxCommandTokens) {
        std::size_t end = line.find(' ', pos);
        if (end == std::string::npos) {
            break;
        }
        tokens.push_back(line.substr(pos, end - pos));
        pos = line.find_first_not_of(' ', end);
        if (pos == std::string::npos) {
            return tokens; // trailing spaces only
        }
    }
    tokens.push_back(line.substr(pos));
    return tokens;
}

ChatRoom::ChatRoom(const std::string& name, ChatServer& server)
    : name_(name), server_(server)
{
    spdlog::info("ChatRoom '{}' created.", name_);
}

ChatRoom::~ChatRoom()
{
    spdlog::info("ChatRoom '{}' destroyed.", name_);
}

/**
 * @details 참여자 목록 끝에 세션을 추가하고, 들어온 세션에게 환영 메시지를 보낸 뒤
 *          입장 사실을 자신을 포함한 모든 참여자에게 브로드캐스트합니다.
 */
void ChatRoom::on_enter(SessionInterface& session)
{
    participants_.push_back(&session);
    session.deliver("Welcome to " + name_);
    broadcast_user_state(session, "enters room");
    spdlog::info("[ChatRoom '{}'] '{}' entered. Participants: {}", name_, session.nickname(), participants_.size());
}

/**
 * @details 목록에 없는 세션의 퇴장은 enter/leave 짝이 깨졌다는 뜻이므로 에러 로그만 남깁니다.
 */
void ChatRoom::on_leave(SessionInterface& session)
{
    auto it = std::find(participants_.begin(), participants_.end(), &session);
    if (it == participants_.end()) {
        spdlog::error("[ChatRoom '{}'] Leave for session {} that is not a participant.",
                      name_, static_cast<void*>(&session));
        return;
    }
    participants_.erase(it);
    broadcast_user_state(session, "leaves room");
    spdlog::info("[ChatRoom '{}'] '{}' left. Participants: {}", name_, session.nickname(), participants_.size());
}

/**
 * @details 빈 줄은 무시합니다. '/'로 시작하면 명령어로 분배하고,
 *          알 수 없는 명령어는 보낸 세션에게만 오류를 알립니다.
 *          그 외에는 시각과 보낸 사람을 붙여 방 전체에 브로드캐스트합니다.
 */
void ChatRoom::on_data(SessionInterface& session, const std::string& line)
{
    if (line.empty()) {
        return;
    }

    if (line.front() == '/') {
        auto tokens = split_command_line(line);
        std::vector<std::string> args(tokens.begin() + 1, tokens.end());
        try {
            dispatch_action(session, tokens.front(), args);
        } catch (const UnknownActionError& e) {
            spdlog::debug("[ChatRoom '{}'] {} from '{}'", name_, e.what(), session.nickname());
            session.deliver("Error: unknown action: " + e.action());
        }
        return;
    }

    broadcast(fmt::format("{}: \"{}\" says: {}", now_str(), session.nickname(), line));
}

void ChatRoom::broadcast(const std::string& message)
{
    spdlog::debug("[ChatRoom '{}'] Broadcasting to {} participants: {}", name_, participants_.size(), message);
    // deliver 도중 목록이 바뀌어도 안전하도록 복사본을 순회
    auto participants_copy = participants_;
    for (auto* participant : participants_copy) {
        participant->deliver(message);
    }
}

std::vector<std::string> ChatRoom::get_participant_nicknames() const
{
    std::vector<std::string> nicknames;
    nicknames.reserve(participants_.size());
    for (const auto* p : participants_) {
        nicknames.push_back(p->nickname());
    }
    return nicknames;
}

bool ChatRoom::contains(const SessionInterface& session) const
{
    return std::find(participants_.begin(), participants_.end(), &session) != participants_.end();
}

void ChatRoom::broadcast_user_state(const SessionInterface& session, const std::string& state)
{
    broadcast(fmt::format("{}: \"{}\" {}.", now_str(), session.nickname(), state));
}

const std::unordered_map<std::string, ChatRoom::ActionHandler>& ChatRoom::action_table()
{
    static const std::unordered_map<std::string, ActionHandler> table = {
        {"quit", &ChatRoom::do_quit},
        {"who", &ChatRoom::do_who},
        {"addroom", &ChatRoom::do_addroom},
        {"gotoroom", &ChatRoom::do_gotoroom},
        {"delroom", &ChatRoom::do_delroom},
        {"roomlist", &ChatRoom::do_roomlist},
        {"hall", &ChatRoom::do_hall},
        {"nick", &ChatRoom::do_nick},
        {"help", &ChatRoom::do_help},
    };
    return table;
}

void ChatRoom::dispatch_action(SessionInterface& session,
                               const std::string& action,
                               const std::vector<std::string>& args)
{
    const auto& table = action_table();
    auto it = table.find(action);
    if (it == table.end()) {
        throw UnknownActionError(action);
    }
    spdlog::debug("[ChatRoom '{}'] '{}' -> /{} ({} args)", name_, session.nickname(), action, args.size());
    (this->*(it->second))(session, args);
}

bool ChatRoom::require_argument(SessionInterface& session,
                                const std::vector<std::string>& args,
                                const std::string& usage)
{
    if (args.empty() || args.front().empty()) {
        session.deliver("Error: usage: " + usage);
        return false;
    }
    return true;
}

void ChatRoom::do_quit(SessionInterface& session, const std::vector<std::string>& /*args*/)
{
    session.deliver("Bye!");
    session.stop_session();
}

void ChatRoom::do_who(SessionInterface& session, const std::vector<std::string>& /*args*/)
{
    for (const auto& nickname : get_participant_nicknames()) {
        session.deliver(nickname);
    }
}

void ChatRoom::do_addroom(SessionInterface& session, const std::vector<std::string>& args)
{
    if (!require_argument(session, args, "/addroom room_name")) {
        return;
    }
    const std::string& room_name = args.front();
    server_.add_room(room_name);
    session.deliver(fmt::format("Info: add new room \"{}\"", room_name));
}

void ChatRoom::do_gotoroom(SessionInterface& session, const std::vector<std::string>& args)
{
    if (!require_argument(session, args, "/gotoroom room_name")) {
        return;
    }
    std::shared_ptr<ChatRoom> target;
    try {
        target = server_.get_room(args.front());
    } catch (const RoomNotFoundError&) {
        session.deliver("Error: no such room.");
        return;
    }
    session.change_logic(target);
}

void ChatRoom::do_delroom(SessionInterface& session, const std::vector<std::string>& args)
{
    if (!require_argument(session, args, "/delroom room_name")) {
        return;
    }
    const std::string& room_name = args.front();
    try {
        server_.del_room(room_name);
    } catch (const RoomNotFoundError&) {
        session.deliver(fmt::format("Error: no such room \"{}\"", room_name));
        return;
    } catch (const RoomNotEmptyError&) {
        session.deliver(fmt::format("Error: room \"{}\" is not empty, can not delete it", room_name));
        return;
    }
    session.deliver(fmt::format("Info: delete room \"{}\"", room_name));
}

void ChatRoom::do_roomlist(SessionInterface& session, const std::vector<std::string>& /*args*/)
{
    session.deliver("Info: room list");
    for (const auto& room_name : server_.room_names()) {
        session.deliver("\t " + room_name);
    }
    session.deliver("room list over");
}

void ChatRoom::do_hall(SessionInterface& session, const std::vector<std::string>& /*args*/)
{
    session.change_logic(server_.hall());
}

/**
 * @details 새 이름을 먼저 등록하고 성공했을 때만 이전 이름을 해제하므로,
 *          실패 시 세션의 이름과 등록 상태는 그대로 남습니다.
 */
void ChatRoom::do_nick(SessionInterface& session, const std::vector<std::string>& args)
{
    if (!require_argument(session, args, "/nick new_name")) {
        return;
    }
    const std::string& new_name = args.front();
    std::string old_name = session.nickname();
    if (new_name == old_name) {
        session.deliver(fmt::format("Info: your name is already \"{}\"", new_name));
        return;
    }
    try {
        server_.rename_session(session, new_name);
    } catch (const NameInUseError&) {
        session.deliver("Error: name exists.");
        return;
    }
    broadcast(fmt::format("{}: \"{}\" is now known as \"{}\".", now_str(), old_name, new_name));
}

void ChatRoom::do_help(SessionInterface& session, const std::vector<std::string>& /*args*/)
{
    const std::string& service = server_.service_name();
    session.deliver("Info: action list");
    session.deliver("/addroom room_name");
    session.deliver("\tAdd a new room");
    session.deliver("/delroom room_name");
    session.deliver("\tDelete the room");
    session.deliver("/gotoroom room_name");
    session.deliver("\tGoto another room");
    session.deliver("/hall");
    session.deliver("\tGoto " + service + " Hall");
    session.deliver("/help");
    session.deliver("\tShow this help");
    session.deliver("/nick new_name");
    session.deliver("\tChange your name");
    session.deliver("/quit");
    session.deliver("\tQuit " + service);
    session.deliver("/roomlist");
    session.deliver("\tShow all rooms");
    session.deliver("/who");
    session.deliver("\tShow all room members");
}
