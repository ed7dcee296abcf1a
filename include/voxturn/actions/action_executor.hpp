#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <voxturn/actions/pending_action.hpp>

namespace voxturn {

/**
 * Fixed pool of worker threads running device-action handlers.
 * Handlers may block (subprocesses, sensor polling, TTS); the conversation
 * turn only joins their PendingAction handles at the end.
 */
class ActionExecutor {
public:
    explicit ActionExecutor(size_t workers = 4);
    ~ActionExecutor();

    ActionExecutor(const ActionExecutor&) = delete;
    ActionExecutor& operator=(const ActionExecutor&) = delete;

    PendingAction submit(const std::string& name, std::function<void()> fn);

    // Stop accepting work, finish queued tasks, join workers.
    void shutdown();

private:
    void workerLoop();

    std::mutex mtx_;
    std::condition_variable cv_;
    std::queue<std::packaged_task<void()>> tasks_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;
};

} // namespace voxturn
