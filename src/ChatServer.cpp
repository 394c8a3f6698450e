#include "ChatServer.hpp"
#include "ChatListener.hpp"
#include "ChatRoom.hpp"
#include "NameSelectionLogic.hpp"
#include "spdlog/spdlog.h"

#include <memory>
#include <mutex>
#include <system_error>
#include <vector>

#include <boost/asio/post.hpp>

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

//------------------------------------------------------------------------------
// ChatServer Implementation
//------------------------------------------------------------------------------
ChatServer::ChatServer(net::io_context &ioc,
                       unsigned short port,
                       const std::string &service_name,
                       const std::string &bind_address)
    : ioc_(ioc),
      bind_address_(bind_address),
      port_(port),
      service_name_(service_name),
      rooms_(*this, service_name + " Hall"),
      name_selection_(std::make_shared<NameSelectionLogic>(service_name, rooms_.hall(), names_)),
      strand_(net::make_strand(ioc)),
      stopped_(false)
{
    spdlog::info("[ChatServer {}] Initializing '{}' for port {}", fmt::ptr(this), service_name_, port_);
}

ChatServer::~ChatServer()
{
    spdlog::info("[ChatServer {}] Destructor called.", fmt::ptr(this));
}

void ChatServer::run()
{
    if (stopped_.load())
    {
        spdlog::error("[ChatServer {}] Cannot run, server is already stopped.", fmt::ptr(this));
        return;
    }

    spdlog::info("[ChatServer {}] Starting server execution...", fmt::ptr(this));

    if (!start_listening())
    {
        spdlog::error("[ChatServer {}] Failed to start listener. Aborting run().", fmt::ptr(this));
        stopped_ = true;
        return;
    }

    spdlog::info("[ChatServer {}] Server startup sequence complete. Listening on {}:{}",
                 fmt::ptr(this), bind_address_, port_);
}

bool ChatServer::start_listening()
{
    try
    {
        tcp::endpoint endpoint(net::ip::make_address(bind_address_), port_);
        listener_ = std::make_shared<ChatListener>(ioc_, endpoint, shared_from_this());
        listener_->run();
        return true;
    }
    catch (const std::system_error &e)
    {
        spdlog::error("[ChatServer {}] Listener setup failed: {}", fmt::ptr(this), e.what());
    }
    catch (const boost::system::system_error &e)
    {
        spdlog::error("[ChatServer {}] Invalid bind address '{}': {}", fmt::ptr(this), bind_address_, e.what());
    }
    listener_.reset();
    return false;
}

void ChatServer::stop()
{
    if (stopped_.exchange(true))
    {
        return;
    }
    spdlog::info("[ChatServer {}] Stopping server...", fmt::ptr(this));

    auto self = shared_from_this();
    net::post(strand_, [this, self]()
              {
        if (listener_) {
            listener_->stop();
            listener_.reset();
        }

        std::vector<SessionPtr> sessions_copy;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_copy.assign(sessions_.begin(), sessions_.end());
        }
        spdlog::info("[ChatServer {}] Closing {} sessions (strand context)...", fmt::ptr(this), sessions_copy.size());
        for (auto &session_ptr : sessions_copy) {
            session_ptr->stop_session();
        }

        spdlog::info("[ChatServer {}] Server stop sequence complete.", fmt::ptr(this)); });
}

void ChatServer::on_connect(SessionPtr session)
{
    if (!session)
        return;
    if (stopped_)
    {
        spdlog::warn("[ChatServer {}] Connection from {} refused, server is stopped.",
                     fmt::ptr(this), session->remote_id());
        session->stop_session();
        return;
    }

    std::size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.insert(session);
        total = sessions_.size();
    }
    spdlog::info("[ChatServer {}] Client ({}) joined. Total sessions: {}",
                 fmt::ptr(this), session->remote_id(), total);

    session->change_logic(name_selection_);
}

void ChatServer::on_session_exit(SessionInterface &session)
{
    names_.release(session.nickname(), session);

    // 마지막 소유권을 잠금 밖에서 놓도록 꺼내 둔다.
    SessionPtr removed;
    std::size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end(); ++it)
        {
            if (it->get() == &session)
            {
                removed = *it;
                sessions_.erase(it);
                break;
            }
        }
        total = sessions_.size();
    }

    if (removed)
    {
        spdlog::info("[ChatServer {}] Client '{}' ({}) left. Session erased. Total sessions: {}",
                     fmt::ptr(this), session.nickname(), session.remote_id(), total);
    }
    else
    {
        spdlog::debug("[ChatServer {}] Exit for session {} not in session set.",
                      fmt::ptr(this), static_cast<void *>(&session));
    }
}

bool ChatServer::add_room(const std::string &room_name)
{
    return rooms_.create(room_name);
}

void ChatServer::del_room(const std::string &room_name)
{
    rooms_.remove(room_name);
}

std::shared_ptr<ChatRoom> ChatServer::get_room(const std::string &room_name) const
{
    return rooms_.lookup(room_name);
}

std::shared_ptr<ChatRoom> ChatServer::hall() const
{
    return rooms_.hall();
}

std::vector<std::string> ChatServer::room_names() const
{
    return rooms_.names();
}

void ChatServer::rename_session(SessionInterface &session, const std::string &new_name)
{
    std::string old_name = session.nickname();
    names_.acquire(new_name, session);
    names_.release(old_name, session);
    session.set_nickname(new_name);
    spdlog::info("[ChatServer {}] Session {} renamed '{}' -> '{}'.",
                 fmt::ptr(this), static_cast<void *>(&session), old_name, new_name);
}

unsigned short ChatServer::listening_port() const
{
    return listener_ ? listener_->local_port() : 0;
}

std::size_t ChatServer::session_count() const
{
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}
