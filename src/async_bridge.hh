#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

// Latest result of a module's background work. Writers replace the whole value
// under the lock, so readers see either the old or the new result, never a mix,
// and the last publish wins.
template <typename T>
struct published_t {
    void publish(T value) {
        std::lock_guard<std::mutex> l(lock);
        current = std::move(value);
        generation++;
    }
    T get() const {
        std::lock_guard<std::mutex> l(lock);
        return current;
    }
    // copies the value only when it changed since seen_generation
    bool fetch_if_newer(uint64_t& seen_generation, T& out) const {
        std::lock_guard<std::mutex> l(lock);
        if (generation == seen_generation) {
            return false;
        }
        seen_generation = generation;
        out = current;
        return true;
    }
    uint64_t version() const {
        std::lock_guard<std::mutex> l(lock);
        return generation;
    }

private:
    mutable std::mutex lock;
    T current {};
    uint64_t generation = 0;
};

struct refresh_t {
    std::string module_id;
};

// One-way path from background workers to the serial UI loop. Workers post
// refresh notifications; the loop drains them and only marks the frame dirty.
struct async_bridge_t {
    async_bridge_t() = default;
    ~async_bridge_t();

    async_bridge_t(const async_bridge_t&) = delete;
    async_bridge_t& operator=(const async_bridge_t&) = delete;

    // called from any thread after the host's queue gained an element
    void set_waker(std::function<void()> waker);

    void post(refresh_t refresh);
    std::vector<refresh_t> drain();
    bool pending() const;

    // runs job on a detached short-lived thread; exceptions are logged
    void spawn(const std::string& name, std::function<void()> job);
    size_t in_flight() const;
    // blocks until every spawned job returned
    void wait_idle();

private:
    mutable std::mutex lock;
    std::condition_variable idle;
    std::deque<refresh_t> queue;
    std::function<void()> wake;
    size_t workers = 0;
};
