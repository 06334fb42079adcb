#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace util
{

// Runs fn every interval on its own thread until stop() or destruction.
// An exception escaping one iteration is logged and the loop keeps going.
class PeriodicTask
{
  public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask &)            = delete;
    PeriodicTask &operator=(const PeriodicTask &) = delete;

    bool start();
    void stop();
    bool running() const { return running_.load(); }

    std::size_t ticks() const { return ticks_.load(); }

  private:
    void loop();

    std::string               name_;
    std::chrono::milliseconds interval_;
    std::function<void()>     fn_;

    std::thread             thr_;
    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    stop_requested_{false};
    std::atomic<bool>       running_{false};
    std::atomic<std::size_t> ticks_{0};
};

}  // namespace util
