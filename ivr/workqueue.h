#ifndef _WORKQUEUE_H_
#define _WORKQUEUE_H_

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace ivr {

// A single worker thread running posted tasks one at a time, in the order
// they were posted.
class WorkQueue
{
public:
    typedef std::function<void()> Task;

    explicit WorkQueue(std::string name);
    ~WorkQueue();

    WorkQueue(const WorkQueue &) = delete;
    WorkQueue &operator=(const WorkQueue &) = delete;

    // Returns false once shutdown() has been called. Tasks must not throw.
    bool post(Task task);

    // Blocks until every task posted so far has finished.
    void waitIdle();

    // Runs what is already queued, then joins the worker. Must not be
    // called from a task.
    void shutdown();

    const std::string &name() const { return name_; }

private:
    void run();

    std::string name_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> tasks_;
    bool busy_;
    bool stopping_;
    std::thread worker_;
};

} // namespace ivr

#endif // _WORKQUEUE_H_
