#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include "../async_bridge.hh"
#include "../module.hh"

// Base for modules whose data comes from a blocking probe. update() picks up
// the newest published result and starts the probe on a worker once the
// interval elapsed; at most one scheduled probe runs at a time. The worker only
// sees the shared published slot, never the module.
template <typename T>
struct polling_module_t: module_t {
    using clock = std::chrono::steady_clock;

    polling_module_t(std::string _id, std::string _name, async_bridge_t& _bridge):
        module_t(std::move(_id), std::move(_name)),
        bridge(_bridge),
        published(std::make_shared<published_t<T>>()),
        busy(std::make_shared<std::atomic<bool>>(false))
    {}

    // next update() probes regardless of the interval
    void refresh() {
        started = false;
    }
    bool has_result() const {
        return seen > 0;
    }

protected:
    // copies a newer result into state; true when there was one
    bool collect() {
        return published->fetch_if_newer(seen, state);
    }

    void poll(std::chrono::milliseconds interval, std::function<T()> probe) {
        const auto now = clock::now();
        if (started && now - last_start < interval) {
            return;
        }
        if (busy->exchange(true)) {
            return;
        }
        started = true;
        last_start = now;
        try {
            run(std::move(probe), busy);
        } catch (const std::system_error&) {
            *busy = false;
            throw;
        }
    }

    // one-off job outside the schedule, e.g. after a click changed the device
    void kick(std::function<T()> job) {
        run(std::move(job), nullptr);
    }

    async_bridge_t& bridge;
    std::shared_ptr<published_t<T>> published;
    T state {};

private:
    struct release_t {
        std::shared_ptr<std::atomic<bool>> flag;
        ~release_t() {
            if (flag) {
                *flag = false;
            }
        }
    };

    void run(std::function<T()> job, std::shared_ptr<std::atomic<bool>> flag) {
        auto out = published;
        auto& b = bridge;
        std::string module_id = id;
        bridge.spawn(id, [out, flag, &b, module_id, job = std::move(job)]() {
            release_t release {flag};
            out->publish(job());
            b.post(refresh_t{module_id});
        });
    }

    std::shared_ptr<std::atomic<bool>> busy;
    uint64_t seen = 0;
    bool started = false;
    clock::time_point last_start;
};
