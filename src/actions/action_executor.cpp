#include <voxturn/actions/action_executor.hpp>

#include <stdexcept>

namespace voxturn {

ActionExecutor::ActionExecutor(size_t workers) {
  if (workers == 0) workers = 1;
  workers_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    workers_.emplace_back(&ActionExecutor::workerLoop, this);
  }
}

ActionExecutor::~ActionExecutor() { shutdown(); }

PendingAction ActionExecutor::submit(const std::string& name, std::function<void()> fn) {
  std::packaged_task<void()> task(std::move(fn));
  std::shared_future<void> done = task.get_future().share();
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (stopping_) throw std::runtime_error("action executor is shut down");
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
  return PendingAction(name, std::move(done));
}

void ActionExecutor::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (stopping_) return;
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
}

void ActionExecutor::workerLoop() {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [this]{ return stopping_ || !tasks_.empty(); });
      if (tasks_.empty()) return; // stopping and drained
      task = std::move(tasks_.front());
      tasks_.pop();
    }
    task(); // exceptions land in the future
  }
}

} // namespace voxturn
