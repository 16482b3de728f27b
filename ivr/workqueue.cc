#include "workqueue.h"

#include <utility>

ivr::WorkQueue::WorkQueue(std::string name) :
    name_(std::move(name)),
    busy_(false),
    stopping_(false)
{
    worker_ = std::thread(&WorkQueue::run, this);
}

ivr::WorkQueue::~WorkQueue()
{
    shutdown();
}

bool ivr::WorkQueue::post(Task task)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void ivr::WorkQueue::waitIdle()
{
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && !busy_; });
}

void ivr::WorkQueue::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ivr::WorkQueue::run()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty()) {
            break;
        }

        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        busy_ = true;
        lock.unlock();

        task();

        lock.lock();
        busy_ = false;
        if (tasks_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}
