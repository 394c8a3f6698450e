#include "../include/ChatServer.hpp"
#include "../include/ChatErrors.hpp"
#include "../include/ChatRoom.hpp"
#include "../include/NameSelectionLogic.hpp"
#include "RecordingSession.hpp"

#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <memory>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

namespace net = boost::asio;

namespace {

/// "Www Mmm dd hh:mm:ss yyyy: " 형식의 시각 접두어 (ctime 형식)
const std::regex& timestamp_prefix() {
    static const std::regex prefix(R"(^[A-Z][a-z]{2} [A-Z][a-z]{2} \d{2} \d{2}:\d{2}:\d{2} \d{4}: )");
    return prefix;
}

/**
 * @brief 줄이 "<시각>: <body>"와 정확히 일치하는지 확인한다.
 * @details 시각 부분은 형식뿐 아니라 실제 달력 시각으로 해석되는지도 검사한다.
 */
bool is_stamped(const std::string& line, const std::string& body) {
    std::smatch match;
    if (!std::regex_search(line, match, timestamp_prefix())) {
        return false;
    }
    std::tm parsed{};
    std::istringstream stamp(line.substr(0, match.length() - 2));
    stamp >> std::get_time(&parsed, "%a %b %d %H:%M:%S %Y");
    if (stamp.fail() || parsed.tm_year + 1900 < 2000) {
        return false;
    }
    return line.substr(match.length()) == body;
}

std::size_t count_stamped(const std::vector<std::string>& lines, const std::string& body) {
    return static_cast<std::size_t>(std::count_if(lines.begin(), lines.end(),
        [&](const std::string& line) { return is_stamped(line, body); }));
}

} // namespace

/**
 * @brief 소켓 없이 ChatServer의 채팅 로직을 검증하는 Fixture.
 * @details 세션은 `RecordingSession`으로 대체하며, io_context는 실행하지 않는다.
 *          채팅 로직은 스트랜드 밖에서 직접 호출해도 단일 스레드이므로 안전하다.
 */
class ChatLogicTest : public ::testing::Test {
protected:
    net::io_context ioc_;
    std::shared_ptr<ChatServer> server_;
    std::vector<std::shared_ptr<RecordingSession>> sessions_;

    void SetUp() override {
        server_ = std::make_shared<ChatServer>(ioc_, 0);
    }

    void TearDown() override {
        // 세션이 들고 있는 서버 참조를 끊는다.
        for (auto& session : sessions_) {
            session->stop_session();
        }
        sessions_.clear();
        server_.reset();
    }

    std::shared_ptr<RecordingSession> connect(const std::string& remote_id) {
        auto session = std::make_shared<RecordingSession>(server_, remote_id);
        sessions_.push_back(session);
        server_->on_connect(session);
        return session;
    }

    /// 연결 후 이름을 고르고 그동안 받은 줄은 버린다.
    std::shared_ptr<RecordingSession> login(const std::string& name) {
        auto session = connect("10.0.0.1:" + name);
        session->submit_line(name);
        session->clear();
        return session;
    }
};

// --- NameSelection ---

TEST_F(ChatLogicTest, NewSessionGetsWelcomeAndPrompt) {
    auto s = connect("10.0.0.1:1000");
    std::vector<std::string> expected = {"Welcome to TalkRoom", "Please input your user name >"};
    EXPECT_EQ(s->lines(), expected);
    EXPECT_EQ(s->current_logic(), server_->name_selection());
    EXPECT_EQ(server_->session_count(), 1u);
}

TEST_F(ChatLogicTest, PickingNameMovesSessionToHall) {
    auto s = connect("10.0.0.1:1000");
    s->clear();
    s->submit_line("bob");

    auto lines = s->take();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "Welcome to TalkRoom Hall");
    EXPECT_TRUE(is_stamped(lines[1], "\"bob\" enters room."));
    EXPECT_EQ(s->nickname(), "bob");
    EXPECT_TRUE(server_->name_directory().contains("bob"));
    EXPECT_TRUE(server_->hall()->contains(*s));
    EXPECT_EQ(s->current_logic(), server_->hall());
}

TEST_F(ChatLogicTest, DuplicateNameIsRejectedAndReprompted) {
    auto alice = login("alice");
    auto s = connect("10.0.0.1:2000");
    s->clear();

    s->submit_line("alice");
    std::vector<std::string> expected = {"Error: name exists.", "Please input your user name >"};
    EXPECT_EQ(s->take(), expected);
    EXPECT_EQ(s->current_logic(), server_->name_selection());
    EXPECT_EQ(s->nickname(), "anonymous");
    EXPECT_TRUE(alice->lines().empty());

    s->submit_line("carol");
    EXPECT_EQ(s->nickname(), "carol");
    EXPECT_EQ(server_->name_directory().size(), 2u);
}

TEST_F(ChatLogicTest, EmptyNameReprompts) {
    auto s = connect("10.0.0.1:1000");
    s->clear();
    s->submit_line("");
    std::vector<std::string> expected = {"Please input your user name >"};
    EXPECT_EQ(s->take(), expected);
    EXPECT_EQ(server_->name_directory().size(), 0u);
}

TEST_F(ChatLogicTest, NameIsReleasedWhenSessionDisconnects) {
    auto alice = login("alice");
    alice->stop_session();
    EXPECT_FALSE(server_->name_directory().contains("alice"));
    EXPECT_EQ(server_->session_count(), 0u);

    auto again = connect("10.0.0.1:3000");
    again->clear();
    again->submit_line("alice");
    EXPECT_EQ(again->nickname(), "alice");
    EXPECT_EQ(again->current_logic(), server_->hall());
}

TEST_F(ChatLogicTest, UnnamedDisconnectKeepsOtherSessionsName) {
    auto owner = login("anonymous");
    auto unnamed = connect("10.0.0.1:4000");
    unnamed->stop_session();

    EXPECT_TRUE(server_->name_directory().contains("anonymous"));
    EXPECT_EQ(server_->session_count(), 1u);
}

TEST_F(ChatLogicTest, DisconnectDuringNameSelectionBroadcastsNothing) {
    auto alice = login("alice");
    auto s = connect("10.0.0.1:5000");
    s->stop_session();
    EXPECT_TRUE(alice->lines().empty());
    EXPECT_EQ(s->current_logic(), nullptr);
}

// --- RoomChat ---

TEST_F(ChatLogicTest, EnterIsBroadcastToEveryoneIncludingNewcomer) {
    auto alice = login("alice");
    auto s = connect("10.0.0.1:1000");
    s->submit_line("bob");

    auto alice_lines = alice->take();
    ASSERT_EQ(alice_lines.size(), 1u);
    EXPECT_TRUE(is_stamped(alice_lines[0], "\"bob\" enters room."));
    EXPECT_EQ(count_stamped(s->lines(), "\"bob\" enters room."), 1u);
}

TEST_F(ChatLogicTest, ChatLineReachesEachMemberExactlyOnceInOrder) {
    auto alice = login("alice");
    auto bob = login("bob");
    alice->clear();

    bob->submit_line("hello there");
    bob->submit_line("second");

    for (const auto& s : {alice, bob}) {
        const auto& lines = s->lines();
        ASSERT_EQ(lines.size(), 2u);
        EXPECT_TRUE(is_stamped(lines[0], "\"bob\" says: hello there"));
        EXPECT_TRUE(is_stamped(lines[1], "\"bob\" says: second"));
    }
}

TEST_F(ChatLogicTest, ChatDoesNotLeakAcrossRooms) {
    auto alice = login("alice");
    auto bob = login("bob");
    bob->submit_line("/addroom lounge");
    bob->submit_line("/gotoroom lounge");
    alice->clear();

    bob->submit_line("psst");
    EXPECT_TRUE(alice->lines().empty());
}

TEST_F(ChatLogicTest, EmptyLineInRoomIsIgnored) {
    auto alice = login("alice");
    auto bob = login("bob");
    alice->clear();
    bob->clear();
    bob->submit_line("");
    EXPECT_TRUE(alice->lines().empty());
    EXPECT_TRUE(bob->lines().empty());
}

TEST_F(ChatLogicTest, WhoListsMembersInJoinOrder) {
    auto alice = login("alice");
    auto bob = login("bob");
    auto carol = login("carol");
    alice->clear();
    bob->clear();

    bob->submit_line("/who");
    std::vector<std::string> expected = {"alice", "bob", "carol"};
    EXPECT_EQ(bob->take(), expected);
    EXPECT_TRUE(alice->lines().empty());
}

TEST_F(ChatLogicTest, WhoReflectsCurrentMembersAfterLeavesAndReturns) {
    auto alice = login("alice");
    auto bob = login("bob");
    auto carol = login("carol");

    bob->submit_line("/addroom lounge");
    bob->submit_line("/gotoroom lounge");
    alice->clear();
    alice->submit_line("/who");
    std::vector<std::string> without_bob = {"alice", "carol"};
    EXPECT_EQ(alice->take(), without_bob);

    bob->clear();
    bob->submit_line("/who");
    std::vector<std::string> lounge = {"bob"};
    EXPECT_EQ(bob->take(), lounge);

    // 다시 들어온 멤버는 목록 끝에 온다.
    bob->submit_line("/hall");
    alice->clear();
    alice->submit_line("/who");
    std::vector<std::string> bob_last = {"alice", "carol", "bob"};
    EXPECT_EQ(alice->take(), bob_last);

    carol->submit_line("/quit");
    alice->clear();
    alice->submit_line("/who");
    std::vector<std::string> without_carol = {"alice", "bob"};
    EXPECT_EQ(alice->take(), without_carol);
}

TEST_F(ChatLogicTest, ChatLineTimestampIsCurrentLocalTime) {
    auto bob = login("bob");
    std::time_t before = std::time(nullptr);
    bob->submit_line("what time is it");
    std::time_t after = std::time(nullptr);

    ASSERT_EQ(bob->lines().size(), 1u);
    const std::string& line = bob->lines().front();
    ASSERT_TRUE(is_stamped(line, "\"bob\" says: what time is it")) << line;

    std::tm parsed{};
    std::istringstream stamp(line.substr(0, line.find(": \"")));
    stamp >> std::get_time(&parsed, "%a %b %d %H:%M:%S %Y");
    ASSERT_FALSE(stamp.fail());
    parsed.tm_isdst = -1;
    std::time_t stamped = std::mktime(&parsed);
    EXPECT_GE(stamped, before - 1);
    EXPECT_LE(stamped, after + 1);
}

TEST_F(ChatLogicTest, StopUnwindsSessionsBeforeLaterStrandWork) {
    auto alice = login("alice");
    auto bob = login("bob");
    alice->clear();

    std::size_t sessions_seen = 99;
    server_->stop();
    net::post(server_->get_strand(), [&]() {
        sessions_seen = server_->session_count();
        ioc_.stop();
    });
    ioc_.run();

    EXPECT_EQ(sessions_seen, 0u);
    EXPECT_TRUE(alice->stopped());
    EXPECT_TRUE(bob->stopped());
    EXPECT_EQ(server_->name_directory().size(), 0u);
}

TEST_F(ChatLogicTest, AddroomThenRoomlistIsSorted) {
    auto bob = login("bob");
    bob->submit_line("/addroom zeta");
    bob->submit_line("/addroom alpha");
    bob->submit_line("/addroom zeta");
    std::vector<std::string> added = {
        "Info: add new room \"zeta\"", "Info: add new room \"alpha\"", "Info: add new room \"zeta\""};
    EXPECT_EQ(bob->take(), added);

    bob->submit_line("/roomlist");
    std::vector<std::string> expected = {"Info: room list", "\t alpha", "\t zeta", "room list over"};
    EXPECT_EQ(bob->take(), expected);
    EXPECT_EQ(server_->room_names().size(), 2u);
}

TEST_F(ChatLogicTest, GotoroomUnknownRoomGivesOneErrorLine) {
    auto alice = login("alice");
    auto bob = login("bob");
    alice->clear();

    bob->submit_line("/gotoroom nosuchroom");
    std::vector<std::string> expected = {"Error: no such room."};
    EXPECT_EQ(bob->take(), expected);
    EXPECT_TRUE(alice->lines().empty());
    EXPECT_EQ(bob->current_logic(), server_->hall());
}

TEST_F(ChatLogicTest, GotoroomMovesBetweenRooms) {
    auto alice = login("alice");
    auto bob = login("bob");
    bob->submit_line("/addroom lounge");
    alice->clear();
    bob->clear();

    bob->submit_line("/gotoroom lounge");
    auto alice_lines = alice->take();
    ASSERT_EQ(alice_lines.size(), 1u);
    EXPECT_TRUE(is_stamped(alice_lines[0], "\"bob\" leaves room."));

    auto bob_lines = bob->take();
    ASSERT_EQ(bob_lines.size(), 2u);
    EXPECT_EQ(bob_lines[0], "Welcome to lounge");
    EXPECT_TRUE(is_stamped(bob_lines[1], "\"bob\" enters room."));

    EXPECT_FALSE(server_->hall()->contains(*bob));
    EXPECT_TRUE(server_->get_room("lounge")->contains(*bob));
}

TEST_F(ChatLogicTest, DelroomRefusesNonEmptyRoomThenSucceeds) {
    auto alice = login("alice");
    auto bob = login("bob");
    bob->submit_line("/addroom lounge");
    bob->submit_line("/gotoroom lounge");

    alice->clear();
    alice->submit_line("/delroom lounge");
    std::vector<std::string> refused = {"Error: room \"lounge\" is not empty, can not delete it"};
    EXPECT_EQ(alice->take(), refused);

    bob->submit_line("/hall");
    alice->clear();
    alice->submit_line("/delroom lounge");
    std::vector<std::string> deleted = {"Info: delete room \"lounge\""};
    EXPECT_EQ(alice->take(), deleted);
    EXPECT_TRUE(server_->room_names().empty());

    alice->submit_line("/gotoroom lounge");
    std::vector<std::string> gone = {"Error: no such room."};
    EXPECT_EQ(alice->take(), gone);
}

TEST_F(ChatLogicTest, DelroomUnknownRoom) {
    auto bob = login("bob");
    bob->submit_line("/delroom ghost");
    std::vector<std::string> expected = {"Error: no such room \"ghost\""};
    EXPECT_EQ(bob->take(), expected);
}

TEST_F(ChatLogicTest, HallCannotBeDeleted) {
    auto bob = login("bob");
    EXPECT_THROW(server_->del_room("TalkRoom Hall"), RoomNotFoundError);

    bob->submit_line("/delroom TalkRoom Hall");
    std::vector<std::string> expected = {"Error: no such room \"TalkRoom\""};
    EXPECT_EQ(bob->take(), expected);
    EXPECT_TRUE(server_->hall()->contains(*bob));
}

TEST_F(ChatLogicTest, HallCommandReturnsToHall) {
    auto bob = login("bob");
    bob->submit_line("/addroom lounge");
    bob->submit_line("/gotoroom lounge");
    bob->clear();

    bob->submit_line("/hall");
    auto lines = bob->take();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "Welcome to TalkRoom Hall");
    EXPECT_EQ(bob->current_logic(), server_->hall());
}

TEST_F(ChatLogicTest, UnknownActionIsReportedOnlyToSender) {
    auto alice = login("alice");
    auto bob = login("bob");
    alice->clear();

    bob->submit_line("/dance wildly");
    std::vector<std::string> expected = {"Error: unknown action: dance"};
    EXPECT_EQ(bob->take(), expected);
    EXPECT_TRUE(alice->lines().empty());
}

TEST_F(ChatLogicTest, MissingArgumentGivesUsageError) {
    auto bob = login("bob");
    bob->submit_line("/addroom");
    bob->submit_line("/gotoroom");
    bob->submit_line("/delroom");
    bob->submit_line("/nick");
    std::vector<std::string> expected = {
        "Error: usage: /addroom room_name",
        "Error: usage: /gotoroom room_name",
        "Error: usage: /delroom room_name",
        "Error: usage: /nick new_name",
    };
    EXPECT_EQ(bob->take(), expected);
    EXPECT_TRUE(server_->room_names().empty());
}

TEST_F(ChatLogicTest, QuitSaysByeAndLeaves) {
    auto alice = login("alice");
    auto bob = login("bob");
    alice->clear();

    bob->submit_line("/quit");
    std::vector<std::string> bye = {"Bye!"};
    EXPECT_EQ(bob->take(), bye);
    EXPECT_TRUE(bob->stopped());
    EXPECT_EQ(bob->current_logic(), nullptr);

    auto alice_lines = alice->take();
    ASSERT_EQ(alice_lines.size(), 1u);
    EXPECT_TRUE(is_stamped(alice_lines[0], "\"bob\" leaves room."));
    EXPECT_FALSE(server_->name_directory().contains("bob"));
    EXPECT_EQ(server_->session_count(), 1u);
}

TEST_F(ChatLogicTest, NickRenamesAndBroadcasts) {
    auto alice = login("alice");
    auto bob = login("bob");
    alice->clear();

    bob->submit_line("/nick robert");
    EXPECT_EQ(bob->nickname(), "robert");
    EXPECT_TRUE(server_->name_directory().contains("robert"));
    EXPECT_FALSE(server_->name_directory().contains("bob"));

    auto alice_lines = alice->take();
    ASSERT_EQ(alice_lines.size(), 1u);
    EXPECT_TRUE(is_stamped(alice_lines[0], "\"bob\" is now known as \"robert\"."));
}

TEST_F(ChatLogicTest, NickToTakenNameFails) {
    auto alice = login("alice");
    auto bob = login("bob");
    bob->clear();

    bob->submit_line("/nick alice");
    std::vector<std::string> expected = {"Error: name exists."};
    EXPECT_EQ(bob->take(), expected);
    EXPECT_EQ(bob->nickname(), "bob");
    EXPECT_TRUE(server_->name_directory().contains("bob"));

    bob->submit_line("/nick bob");
    std::vector<std::string> same = {"Info: your name is already \"bob\""};
    EXPECT_EQ(bob->take(), same);
}

TEST_F(ChatLogicTest, HelpListsEveryAction) {
    auto bob = login("bob");
    bob->submit_line("/help");
    const auto& lines = bob->lines();
    ASSERT_FALSE(lines.empty());
    EXPECT_EQ(lines.front(), "Info: action list");
    for (const char* action : {"/addroom room_name", "/delroom room_name", "/gotoroom room_name",
                               "/hall", "/help", "/nick new_name", "/quit", "/roomlist", "/who"}) {
        EXPECT_EQ(std::count(lines.begin(), lines.end(), std::string(action)), 1) << action;
    }
    EXPECT_EQ(std::count(lines.begin(), lines.end(), std::string("\tGoto TalkRoom Hall")), 1);
}

TEST_F(ChatLogicTest, ServiceNameLabelsHallAndBanner) {
    auto server = std::make_shared<ChatServer>(ioc_, 0, "Lobby");
    auto s = std::make_shared<RecordingSession>(server, "10.0.0.1:1");
    server->on_connect(s);
    s->submit_line("zed");
    ASSERT_GE(s->lines().size(), 3u);
    EXPECT_EQ(s->lines()[0], "Welcome to Lobby");
    EXPECT_EQ(s->lines()[2], "Welcome to Lobby Hall");
    s->stop_session();
}

TEST_F(ChatLogicTest, LineWithoutLogicIsDropped) {
    auto bob = login("bob");
    bob->stop_session();
    bob->clear();
    bob->submit_line("anyone?");
    EXPECT_TRUE(bob->lines().empty());
}

TEST_F(ChatLogicTest, EndToEndBobVisitsLoungeAndQuits) {
    auto alice = login("alice");
    auto bob = connect("10.0.0.1:7000");
    bob->clear();
    alice->clear();

    bob->submit_line("bob");
    EXPECT_EQ(count_stamped(alice->lines(), "\"bob\" enters room."), 1u);
    EXPECT_EQ(count_stamped(bob->lines(), "\"bob\" enters room."), 1u);

    bob->submit_line("/addroom lounge");
    bob->submit_line("/gotoroom lounge");
    EXPECT_EQ(count_stamped(alice->lines(), "\"bob\" leaves room."), 1u);
    EXPECT_EQ(count_stamped(bob->lines(), "\"bob\" enters room."), 2u);

    auto watcher = login("watcher");
    watcher->submit_line("/gotoroom lounge");
    watcher->clear();

    bob->submit_line("/quit");
    EXPECT_EQ(bob->lines().back(), "Bye!");
    auto watcher_lines = watcher->take();
    ASSERT_EQ(watcher_lines.size(), 1u);
    EXPECT_TRUE(is_stamped(watcher_lines[0], "\"bob\" leaves room."));
    EXPECT_FALSE(server_->name_directory().contains("bob"));
    EXPECT_FALSE(server_->get_room("lounge")->contains(*bob));
}
