// Orexa - Game Server Supervisor
// Registry-level and instance-level lock types
//
// The supervisor uses two lock scopes: one guarding the id -> configuration
// and id -> runtime maps, one per instance guarding that instance's mutable
// runtime fields. They are distinct types so a guard for one can never be
// passed where the other is expected.

#ifndef OREXA_SUPERVISOR_INSTANCE_LOCK_HPP
#define OREXA_SUPERVISOR_INSTANCE_LOCK_HPP

#include <mutex>
#include <shared_mutex>

namespace orexa {
namespace supervisor {

/**
 * @brief Guards the registry maps (structural changes and config edits).
 *
 * Readers snapshot the maps under a shared lock and release it before
 * touching any instance.
 */
class RegistryMutex {
public:
    RegistryMutex() = default;

    RegistryMutex(const RegistryMutex&) = delete;
    RegistryMutex& operator=(const RegistryMutex&) = delete;

    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }
    bool try_lock() { return mutex_.try_lock(); }

    void lock_shared() { mutex_.lock_shared(); }
    void unlock_shared() { mutex_.unlock_shared(); }
    bool try_lock_shared() { return mutex_.try_lock_shared(); }

private:
    std::shared_mutex mutex_;
};

/**
 * @brief Guards one instance's runtime state.
 *
 * Never held across process I/O or a blocking wait.
 */
class InstanceMutex {
public:
    InstanceMutex() = default;

    InstanceMutex(const InstanceMutex&) = delete;
    InstanceMutex& operator=(const InstanceMutex&) = delete;

    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }
    bool try_lock() { return mutex_.try_lock(); }

private:
    std::mutex mutex_;
};

using RegistryReadLock = std::shared_lock<RegistryMutex>;
using RegistryWriteLock = std::unique_lock<RegistryMutex>;
using InstanceLock = std::unique_lock<InstanceMutex>;

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_INSTANCE_LOCK_HPP
