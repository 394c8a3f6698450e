/**
 * @file NameDirectory.hpp
 * @brief 현재 사용 중인 사용자 이름 목록을 관리하는 `NameDirectory` 클래스를 정의합니다.
 */
#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

class SessionInterface;

/**
 * @class NameDirectory
 * @brief 살아있는 세션에 묶인 이름들의 집합.
 * @details 이름은 선택 시점에 유일성이 보장되며, 소유 세션이 연결을 끊거나 이름을 바꾸는 즉시 해제됩니다.
 *          각 이름은 소유 세션을 기록하므로 다른 세션이 남의 이름을 해제할 수 없습니다.
 *          `ChatServer`가 소유하고, 로직에는 참조로 전달됩니다.
 */
class NameDirectory {
private:
    std::map<std::string, const SessionInterface*> names_; ///< 이름 -> 소유 세션 (비소유 포인터)
    mutable std::mutex mutex_;                              ///< names_ 보호 뮤텍스

public:
    NameDirectory() = default;
    NameDirectory(const NameDirectory&) = delete;
    NameDirectory& operator=(const NameDirectory&) = delete;

    /**
     * @brief 이름을 세션에 등록합니다.
     * @param name 등록할 이름.
     * @param owner 이름을 사용할 세션.
     * @throw NameInUseError 다른 세션이 이미 사용 중인 경우. 같은 세션의 재등록은 허용됩니다.
     */
    void acquire(const std::string& name, const SessionInterface& owner);

    /**
     * @brief 이름 등록을 해제합니다.
     * @details 이름이 없거나 다른 세션 소유라면 아무 일도 하지 않습니다.
     * @param name 해제할 이름.
     * @param owner 이름을 소유한 세션.
     * @return 실제로 해제했으면 `true`.
     */
    bool release(const std::string& name, const SessionInterface& owner);

    /**
     * @brief 이름이 사용 중인지 확인합니다.
     * @param name 확인할 이름.
     * @return bool 사용 중이면 `true`.
     */
    bool contains(const std::string& name) const;

    /// 등록된 이름 수.
    std::size_t size() const;

    /// 등록된 이름 목록 (사전 순).
    std::vector<std::string> names() const;
};
