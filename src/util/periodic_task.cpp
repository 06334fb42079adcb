#include <exception>
#include <utility>

#include "util/log.hpp"
#include "util/periodic_task.hpp"

namespace util
{

PeriodicTask::PeriodicTask(std::string               name,
                           std::chrono::milliseconds interval,
                           std::function<void()>     fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn))
{
}

bool PeriodicTask::start()
{
    if (running_.load())
        return true;
    if (!fn_ || interval_.count() <= 0)
    {
        LOG_ERROR("[%s] invalid task (interval=%lld ms)", name_.c_str(),
                  (long long)interval_.count());
        return false;
    }
    // stopped from inside fn last time
    if (thr_.joinable())
        thr_.join();
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_requested_ = false;
    }
    running_.store(true);
    thr_ = std::thread([this] { loop(); });
    return true;
}

void PeriodicTask::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thr_.joinable() && thr_.get_id() != std::this_thread::get_id())
        thr_.join();
    running_.store(false);
}

void PeriodicTask::loop()
{
    std::unique_lock<std::mutex> lk(mu_);
    while (!stop_requested_)
    {
        if (cv_.wait_for(lk, interval_, [this] { return stop_requested_; }))
            break;

        lk.unlock();
        try
        {
            fn_();
        }
        catch (const std::exception &e)
        {
            LOG_WARN("[%s] iteration failed: %s", name_.c_str(), e.what());
        }
        catch (...)
        {
            LOG_WARN("[%s] iteration failed: unknown exception", name_.c_str());
        }
        ticks_.fetch_add(1);
        lk.lock();
    }
}

}  // namespace util
