#include "async_bridge.hh"

#include <exception>
#include <system_error>
#include <thread>

#include "log.hh"

async_bridge_t::~async_bridge_t() {
    wait_idle();
}

void async_bridge_t::set_waker(std::function<void()> waker) {
    std::lock_guard<std::mutex> l(lock);
    wake = std::move(waker);
}

void async_bridge_t::post(refresh_t refresh) {
    std::function<void()> w;
    {
        std::lock_guard<std::mutex> l(lock);
        queue.push_back(std::move(refresh));
        w = wake;
    }
    if (w) {
        w();
    }
}

std::vector<refresh_t> async_bridge_t::drain() {
    std::lock_guard<std::mutex> l(lock);
    std::vector<refresh_t> out(std::make_move_iterator(queue.begin()), std::make_move_iterator(queue.end()));
    queue.clear();
    return out;
}

bool async_bridge_t::pending() const {
    std::lock_guard<std::mutex> l(lock);
    return !queue.empty();
}

void async_bridge_t::spawn(const std::string& name, std::function<void()> job) {
    {
        std::lock_guard<std::mutex> l(lock);
        workers++;
    }
    std::thread worker;
    try {
        worker = std::thread([this, name, job = std::move(job)]() {
            try {
                job();
            } catch (const std::exception& e) {
                spdlog::warn("[worker] {} failed: {}", name, e.what());
            }
            std::lock_guard<std::mutex> l(lock);
            workers--;
            if (workers == 0) {
                idle.notify_all();
            }
        });
    } catch (const std::system_error&) {
        std::lock_guard<std::mutex> l(lock);
        workers--;
        if (workers == 0) {
            idle.notify_all();
        }
        throw;
    }
    worker.detach();
}

size_t async_bridge_t::in_flight() const {
    std::lock_guard<std::mutex> l(lock);
    return workers;
}

void async_bridge_t::wait_idle() {
    std::unique_lock<std::mutex> l(lock);
    idle.wait(l, [this]() { return workers == 0; });
}
