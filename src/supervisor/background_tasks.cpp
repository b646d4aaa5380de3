// Orexa - Game Server Supervisor
// Owned background threads implementation

#include "orexa/supervisor/background_tasks.hpp"

namespace orexa {
namespace supervisor {

BackgroundTasks::BackgroundTasks(std::shared_ptr<pal::IThreadPAL> threadPal)
    : threadPal_(std::move(threadPal))
{
}

BackgroundTasks::~BackgroundTasks() {
    joinAll();
}

core::Result<void, core::Error> BackgroundTasks::spawn(const std::string& name,
                                                       std::function<void()> task)
{
    reap();

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::Cancelled, "supervisor is shutting down", name));
    }

    auto finished = std::make_shared<std::atomic<bool>>(false);
    pal::ThreadOptions options;
    options.name = name;

    auto created = threadPal_->createThread(
        [task = std::move(task), finished](void*) {
            task();
            finished->store(true);
        },
        nullptr,
        options);

    if (created.isError()) {
        return core::Result<void, core::Error>::error(
            core::Error(core::ErrorCode::SpawnFailed,
                        "failed to start background task: " + created.error().message, name));
    }

    tasks_.push_back(Task{created.value(), finished});
    return core::Result<void, core::Error>::success();
}

bool BackgroundTasks::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !stopCv_.wait_for(lock, duration, [this] { return stopping_; });
}

void BackgroundTasks::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stopCv_.notify_all();
}

bool BackgroundTasks::stopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopping_;
}

void BackgroundTasks::reap() {
    std::vector<Task> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            if (it->finished->load()) {
                done.push_back(*it);
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& task : done) {
        // Already returned, so this does not block
        (void)threadPal_->joinThread(task.handle);
    }
}

void BackgroundTasks::joinAll() {
    requestStop();

    std::vector<Task> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(tasks_);
    }
    for (const auto& task : remaining) {
        (void)threadPal_->joinThread(task.handle);
    }
}

size_t BackgroundTasks::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t active = 0;
    for (const auto& task : tasks_) {
        if (!task.finished->load()) {
            active++;
        }
    }
    return active;
}

} // namespace supervisor
} // namespace orexa
