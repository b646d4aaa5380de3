// Orexa - Game Server Supervisor
// Recurring backup cadence and scheduler
//
// A single process-wide periodic task scans every instance with a cadence
// and a recorded last run, computes the next due time by calendar
// arithmetic and triggers a backup for each one that is past due.

#ifndef OREXA_SUPERVISOR_BACKUP_SCHEDULER_HPP
#define OREXA_SUPERVISOR_BACKUP_SCHEDULER_HPP

#include "orexa/core/error_codes.hpp"
#include "orexa/core/result.hpp"
#include "orexa/core/structured_logger.hpp"
#include "orexa/core/types.hpp"
#include "orexa/pal/thread_pal.hpp"
#include "orexa/pal/timer_pal.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace orexa {
namespace supervisor {

// =============================================================================
// Cadence Arithmetic
// =============================================================================

/**
 * @brief "", daily, weekly, monthly, sixmonths, yearly.
 */
bool isValidBackupCadence(const std::string& cadence);

/**
 * @brief When the next backup is due after one taken at last.
 *
 * Month-based cadences add calendar months in UTC and clamp the day to
 * the length of the target month (Jan 31 + 1 month = Feb 28/29).
 *
 * @return std::nullopt for an empty or unknown cadence
 */
std::optional<std::time_t> nextScheduledBackupTime(std::time_t last, const std::string& cadence);

/**
 * @brief "2024-05-01T13:45:00Z".
 */
std::string formatRfc3339Utc(std::time_t time);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS" followed by "Z" or "+hh:mm"/"-hh:mm".
 *
 * Fractional seconds are accepted and ignored.
 */
std::optional<std::time_t> parseRfc3339(const std::string& text);

// =============================================================================
// Scheduler
// =============================================================================

/**
 * @brief An instance with a cadence, as seen by the scheduler.
 */
struct ScheduledBackupCandidate {
    core::InstanceId id;
    std::string name;
    std::string cadence;
    std::string lastScheduledBackup;
};

/**
 * @brief The side of the supervisor the scheduler drives.
 */
class IScheduledBackupTarget {
public:
    virtual ~IScheduledBackupTarget() = default;

    virtual std::vector<ScheduledBackupCandidate> scheduledBackupCandidates() = 0;

    /**
     * @brief Create a backup and record its time as the last scheduled run.
     */
    virtual core::Result<core::BackupInfo, core::Error> runScheduledBackup(
        const core::InstanceId& id) = 0;
};

/**
 * @brief Periodic due-check over all instances.
 *
 * The timer thread only dispatches; checks run on the worker pool and never
 * overlap. A failed backup stays due and is retried on the next tick.
 */
class BackupScheduler : public std::enable_shared_from_this<BackupScheduler> {
public:
    BackupScheduler(IScheduledBackupTarget& target,
                    std::shared_ptr<pal::ITimerPAL> timerPal,
                    std::shared_ptr<pal::IThreadPAL> threadPal,
                    pal::ThreadPoolHandle pool,
                    std::shared_ptr<core::StructuredLogger> logger);

    ~BackupScheduler();

    BackupScheduler(const BackupScheduler&) = delete;
    BackupScheduler& operator=(const BackupScheduler&) = delete;

    core::Result<void, core::Error> start(std::chrono::milliseconds interval);

    /**
     * @brief Stop ticking and wait for a pool check in progress. Idempotent.
     */
    void stop();

    bool isRunning() const;

    /**
     * @brief Run every backup due at now on the calling thread.
     * @return Number of backups created
     */
    size_t checkDue(std::time_t now);

private:
    void dispatch();

    /// Caller holds checkMutex_
    size_t runDueBackups(std::time_t now, bool haltWhenStopped);

    IScheduledBackupTarget& target_;
    std::shared_ptr<pal::ITimerPAL> timerPal_;
    std::shared_ptr<pal::IThreadPAL> threadPal_;
    pal::ThreadPoolHandle pool_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex mutex_;
    pal::TimerHandle timer_ = pal::INVALID_TIMER_HANDLE;
    bool running_ = false;
    std::atomic<bool> checkInFlight_{false};
    std::mutex checkMutex_;
};

} // namespace supervisor
} // namespace orexa

#endif // OREXA_SUPERVISOR_BACKUP_SCHEDULER_HPP
