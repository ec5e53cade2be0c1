#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "periodic_task.hh"

/**
 * Initializes a task. Nothing runs until Start is called.
 *
 * @param name A name used in log lines.
 * @param interval The time between two runs.
 * @param callback The work to do on every run.
 */
PeriodicTask::PeriodicTask(
    const std::string &name,
    std::chrono::milliseconds interval,
    std::function<void()> callback)
    : name(name),
      interval(interval),
      callback(std::move(callback)),
      ioService(),
      timer(ioService),
      thr()
{}

PeriodicTask::~PeriodicTask()
{
    Stop();
}

/**
 * Arms the timer and launches the thread that waits on it.
 */
void
PeriodicTask::Start()
{
    if (thr.joinable())
        return;
    Schedule();
    thr = std::thread([this] { ioService.run(); });
}

/**
 * Cancels the schedule and joins the thread.
 */
void
PeriodicTask::Stop()
{
    if (not thr.joinable())
        return;
    ioService.post([this] {
        boost::system::error_code ec;
        timer.cancel(ec);
    });
    thr.join();
    ioService.reset();
}

void
PeriodicTask::Schedule()
{
    timer.expires_from_now(interval);
    timer.async_wait([this](const boost::system::error_code &ec) {
        if (ec)
            return;
        try {
            callback();
        }
        catch (std::exception &err) {
            std::cerr << "[" << name << "] ERROR: " << err.what() << std::endl;
        }
        Schedule();
    });
}
