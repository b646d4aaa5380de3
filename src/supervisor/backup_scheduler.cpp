// Orexa - Game Server Supervisor
// Recurring backup cadence and scheduler implementation

#include "orexa/supervisor/backup_scheduler.hpp"

#include <cstdio>
#include <cstdlib>

namespace orexa {
namespace supervisor {

namespace {

constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 1 && isLeapYear(year)) {
        return 29;
    }
    return DAYS[month];
}

std::time_t addMonths(std::time_t base, int months) {
    struct tm tmValue{};
    gmtime_r(&base, &tmValue);

    int monthIndex = tmValue.tm_mon + months;
    int year = tmValue.tm_year + 1900 + monthIndex / 12;
    int month = monthIndex % 12;

    int maxDay = daysInMonth(year, month);
    if (tmValue.tm_mday > maxDay) {
        tmValue.tm_mday = maxDay;
    }
    tmValue.tm_year = year - 1900;
    tmValue.tm_mon = month;
    return timegm(&tmValue);
}

bool readDigits(const std::string& text, size_t pos, size_t count, int& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + count; i++) {
        if (text[i] < '0' || text[i] > '9') {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // anonymous namespace

// =============================================================================
// Cadence Arithmetic
// =============================================================================

bool isValidBackupCadence(const std::string& cadence) {
    return cadence.empty() || cadence == "daily" || cadence == "weekly" ||
           cadence == "monthly" || cadence == "sixmonths" || cadence == "yearly";
}

std::optional<std::time_t> nextScheduledBackupTime(std::time_t last, const std::string& cadence) {
    if (cadence == "daily") {
        return last + SECONDS_PER_DAY;
    }
    if (cadence == "weekly") {
        return last + 7 * SECONDS_PER_DAY;
    }
    if (cadence == "monthly") {
        return addMonths(last, 1);
    }
    if (cadence == "sixmonths") {
        return addMonths(last, 6);
    }
    if (cadence == "yearly") {
        return addMonths(last, 12);
    }
    return std::nullopt;
}

std::string formatRfc3339Utc(std::time_t time) {
    struct tm tmValue{};
    gmtime_r(&time, &tmValue);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tmValue);
    return buffer;
}

std::optional<std::time_t> parseRfc3339(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS
    struct tm tmValue{};
    int year, month, day, hour, minute, second;
    if (text.size() < 20 ||
        !readDigits(text, 0, 4, year) || text[4] != '-' ||
        !readDigits(text, 5, 2, month) || text[7] != '-' ||
        !readDigits(text, 8, 2, day) || (text[10] != 'T' && text[10] != 't') ||
        !readDigits(text, 11, 2, hour) || text[13] != ':' ||
        !readDigits(text, 14, 2, minute) || text[16] != ':' ||
        !readDigits(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month - 1) ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        pos++;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            pos++;
        }
    }

    long offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        pos++;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int offsetHours, offsetMinutes;
        if (!readDigits(text, pos + 1, 2, offsetHours) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !readDigits(text, pos + 4, 2, offsetMinutes)) {
            return std::nullopt;
        }
        offsetSeconds = offsetHours * 3600L + offsetMinutes * 60L;
        if (text[pos] == '-') {
            offsetSeconds = -offsetSeconds;
        }
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    tmValue.tm_year = year - 1900;
    tmValue.tm_mon = month - 1;
    tmValue.tm_mday = day;
    tmValue.tm_hour = hour;
    tmValue.tm_min = minute;
    tmValue.tm_sec = second;
    return timegm(&tmValue) - offsetSeconds;
}

// =============================================================================
// BackupScheduler
// =============================================================================

BackupScheduler::BackupScheduler(IScheduledBackupTarget& target,
                                 std::shared_ptr<pal::ITimerPAL> timerPal,
                                 std::shared_ptr<pal::IThreadPAL> threadPal,
                                 pal::ThreadPoolHandle pool,
                                 std::shared_ptr<core::StructuredLogger> logger)
    : target_(target)
    , timerPal_(std::move(timerPal))
    , threadPal_(std::move(threadPal))
    , pool_(pool)
    , logger_(std::move(logger))
{
}

BackupScheduler::~BackupScheduler() {
    stop();
}

core::Result<void, core::Error> BackupScheduler::start(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::InvalidState, "backup scheduler already running"));
    }

    std::weak_ptr<BackupScheduler> weak = shared_from_this();
    auto scheduled = timerPal_->scheduleRepeating(interval, [weak]() {
        if (auto self = weak.lock()) {
            self->dispatch();
        }
    });
    if (scheduled.isError()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::Unknown,
                        "failed to schedule backup timer: " + scheduled.error().message));
    }

    timer_ = scheduled.value();
    running_ = true;
    return core::Result<void, core::Error>::success();
}

void BackupScheduler::stop() {
    pal::TimerHandle timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        timer = timer_;
        timer_ = pal::INVALID_TIMER_HANDLE;
    }
    (void)timerPal_->cancelTimer(timer);

    // Wait out a check already running on the pool; it still uses the target
    {
        std::lock_guard<std::mutex> checkLock(checkMutex_);
    }

    if (logger_) {
        logger_->info("Backup scheduler stopped", "Backup");
    }
}

bool BackupScheduler::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void BackupScheduler::dispatch() {
    if (!isRunning() || checkInFlight_.exchange(true)) {
        return;
    }

    auto self = shared_from_this();
    auto submitted = threadPal_->submitWork(pool_, [self]() {
        {
            std::lock_guard<std::mutex> checkLock(self->checkMutex_);
            if (self->isRunning()) {
                self->runDueBackups(std::time(nullptr), true);
            }
        }
        self->checkInFlight_.store(false);
    });
    if (submitted.isError()) {
        checkInFlight_.store(false);
        if (logger_) {
            logger_->warning("Failed to queue backup check: " + submitted.error().message, "Backup");
        }
    }
}

size_t BackupScheduler::checkDue(std::time_t now) {
    std::lock_guard<std::mutex> checkLock(checkMutex_);
    return runDueBackups(now, false);
}

size_t BackupScheduler::runDueBackups(std::time_t now, bool haltWhenStopped) {
    std::vector<ScheduledBackupCandidate> due;
    for (auto& candidate : target_.scheduledBackupCandidates()) {
        if (candidate.cadence.empty() || candidate.lastScheduledBackup.empty()) {
            continue;
        }
        auto last = parseRfc3339(candidate.lastScheduledBackup);
        if (!last) {
            continue;
        }
        auto next = nextScheduledBackupTime(*last, candidate.cadence);
        if (next && now > *next) {
            due.push_back(std::move(candidate));
        }
    }

    size_t created = 0;
    for (const auto& candidate : due) {
        if (haltWhenStopped && !isRunning()) {
            break;
        }
        if (logger_) {
            logger_->info("Running scheduled backup for server: " + candidate.name, "Backup");
        }
        auto backup = target_.runScheduledBackup(candidate.id);
        if (backup.isError()) {
            if (logger_) {
                logger_->warning("Scheduled backup failed for " + candidate.name + ": " +
                                 backup.error().message, "Backup");
            }
            continue;
        }
        created++;
        if (logger_) {
            logger_->info("Scheduled backup completed for " + candidate.name + ": " +
                          backup.value().name, "Backup");
        }
    }
    return created;
}

} // namespace supervisor
} // namespace orexa
