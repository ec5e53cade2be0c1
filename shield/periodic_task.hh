#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include <boost/asio.hpp>

/**
 * Runs a callback at a fixed interval on a dedicated thread.
 *
 * The callback runs inside an error boundary: an exception is logged and the
 * schedule continues. Stop (or the dtor) cancels the timer and joins.
 */
class PeriodicTask
{
    std::string name;
    std::chrono::milliseconds interval;
    std::function<void()> callback;
    boost::asio::io_service ioService;
    boost::asio::steady_timer timer;
    std::thread thr;

    void Schedule();

public:
    PeriodicTask(
        const std::string &name,
        std::chrono::milliseconds interval,
        std::function<void()> callback);
    PeriodicTask(const PeriodicTask &task) = delete;
    PeriodicTask& operator=(const PeriodicTask &task) = delete;
    ~PeriodicTask();

    void Start();
    void Stop();
};
