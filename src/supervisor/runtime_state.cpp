// Orexa - Game Server Supervisor
// Per-instance runtime state implementation

#include "orexa/supervisor/runtime_state.hpp"

namespace orexa {
namespace supervisor {

using console::ConsoleEventType;
using console::EchoFamily;

// =============================================================================
// ExitSignal
// =============================================================================

bool ExitSignal::fire() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fired_) {
            return false;
        }
        fired_ = true;
    }
    cv_.notify_all();
    return true;
}

bool ExitSignal::fired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

bool ExitSignal::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return fired_; });
}

// =============================================================================
// InstanceRuntime
// =============================================================================

InstanceRuntime::InstanceRuntime(size_t consoleCapacity, size_t trimBatch,
                                 size_t channelCapacity)
    : console(consoleCapacity, trimBatch, channelCapacity)
{
}

namespace {

bool issuedWithin(SteadyTime issuedAt, SteadyTime now, std::chrono::seconds window) {
    return issuedAt != SteadyTime{} && now - issuedAt < window;
}

void applyPlayerList(InstanceRuntime& runtime, const std::vector<std::string>& names,
                     WallTime wallNow)
{
    if (names.empty()) {
        runtime.players.clear();
        return;
    }

    std::set<std::string> online(names.begin(), names.end());
    for (const auto& name : online) {
        if (runtime.players.find(name) == runtime.players.end()) {
            PlayerSession session;
            session.name = name;
            session.joinedAt = wallNow;
            runtime.players.emplace(name, std::move(session));
        }
    }

    for (auto it = runtime.players.begin(); it != runtime.players.end();) {
        if (online.count(it->first) == 0) {
            runtime.pingBlocked.erase(it->first);
            it = runtime.players.erase(it);
        } else {
            ++it;
        }
    }
}

} // anonymous namespace

void scheduleListRefresh(InstanceRuntime& runtime, const InstanceLock& /* lock */,
                         SteadyTime now, std::chrono::milliseconds delay)
{
    SteadyTime when = now + delay;
    if (!runtime.pendingListRefresh || runtime.nextListRefreshAt == SteadyTime{} ||
        when < runtime.nextListRefreshAt) {
        runtime.pendingListRefresh = true;
        runtime.nextListRefreshAt = when;
    }
}

ConsoleLineOutcome applyConsoleLine(InstanceRuntime& runtime, const InstanceLock& lock,
                                    const console::ConsoleParseResult& parsed,
                                    SteadyTime now, WallTime wallNow)
{
    ConsoleLineOutcome outcome;

    bool tpsRecent = issuedWithin(runtime.lastTpsCommand, now, TPS_ECHO_WINDOW);
    bool rosterRecent = issuedWithin(runtime.lastRosterCommand, now, ROSTER_ECHO_WINDOW);
    bool pingRecent = issuedWithin(runtime.lastPingCommand, now, LATENCY_ECHO_WINDOW);

    for (const auto& event : parsed.events) {
        switch (event.type) {
            case ConsoleEventType::Ready:
                if (runtime.status == core::InstanceStatus::Booting) {
                    runtime.status = core::InstanceStatus::Running;
                    outcome.becameReady = true;
                    scheduleListRefresh(runtime, lock, now, READY_LIST_REFRESH_DELAY);
                }
                break;

            case ConsoleEventType::PlayerJoined: {
                PlayerSession session;
                session.name = event.player;
                session.ip = event.ip;
                session.joinedAt = wallNow;
                runtime.players[event.player] = std::move(session);
                runtime.pingBlocked.erase(event.player);
                scheduleListRefresh(runtime, lock, now, JOIN_LEAVE_LIST_REFRESH_DELAY);
                break;
            }

            case ConsoleEventType::PlayerLeft:
                runtime.players.erase(event.player);
                runtime.pingBlocked.erase(event.player);
                scheduleListRefresh(runtime, lock, now, JOIN_LEAVE_LIST_REFRESH_DELAY);
                break;

            case ConsoleEventType::TpsReport:
                runtime.tps = event.tps;
                break;

            case ConsoleEventType::PlayerWorld: {
                auto it = runtime.players.find(event.player);
                if (it != runtime.players.end()) {
                    it->second.world = event.world;
                }
                break;
            }

            case ConsoleEventType::PlayerList:
                applyPlayerList(runtime, event.players, wallNow);
                break;

            case ConsoleEventType::PlayerLatency: {
                auto it = runtime.players.find(event.player);
                if (it != runtime.players.end()) {
                    it->second.ping = event.latencyMs;
                }
                break;
            }

            case ConsoleEventType::PlayerNotFound:
                if (pingRecent && !runtime.lastPingPlayer.empty()) {
                    runtime.pingBlocked.insert(runtime.lastPingPlayer);
                    auto it = runtime.players.find(runtime.lastPingPlayer);
                    if (it != runtime.players.end()) {
                        it->second.ping = -1;
                    }
                }
                break;
        }
    }

    outcome.suppress = (tpsRecent && parsed.isEchoOf(EchoFamily::Tps)) ||
                       (rosterRecent && parsed.isEchoOf(EchoFamily::Roster)) ||
                       (pingRecent && parsed.isEchoOf(EchoFamily::Latency));
    return outcome;
}

void clearProcessState(InstanceRuntime& runtime, const InstanceLock& /* lock */) {
    runtime.cpu = 0.0;
    runtime.ramBytes = 0;
    runtime.pid = core::INVALID_PROCESS_ID;
    runtime.lastUsage.reset();
    runtime.players.clear();
}

std::string formatOnlineTime(std::chrono::seconds online) {
    auto total = online.count() < 0 ? 0 : online.count();
    auto hours = total / 3600;
    auto minutes = (total / 60) % 60;
    if (hours > 0) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }
    return std::to_string(minutes) + "m";
}

std::vector<core::PlayerInfo> snapshotPlayers(const InstanceRuntime& runtime,
                                              const InstanceLock& /* lock */, WallTime wallNow)
{
    std::vector<core::PlayerInfo> players;
    players.reserve(runtime.players.size());
    for (const auto& entry : runtime.players) {
        const PlayerSession& session = entry.second;
        core::PlayerInfo info;
        info.name = session.name;
        info.ip = session.ip;
        info.ping = session.ping;
        info.world = session.world;
        info.onlineTime = formatOnlineTime(
            std::chrono::duration_cast<std::chrono::seconds>(wallNow - session.joinedAt));
        players.push_back(std::move(info));
    }
    // std::map iteration is already ordered by name
    return players;
}

} // namespace supervisor
} // namespace orexa
