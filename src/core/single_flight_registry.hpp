/**
 * @file single_flight_registry.hpp
 * @brief Coalesces concurrent work by task identity
 *
 * The first request for a task id creates the task and starts its work; later
 * requests for the same id attach to the running task. When the work finishes,
 * the result goes to the task's completion handler and then to every request
 * still attached, in the order the requests were made. A task whose last
 * request is cancelled is cancelled itself and forgotten.
 *
 * Threading:
 * - all registry state is guarded by one mutex per registry
 * - no callback ever runs while that mutex is held
 * - start() runs on the worker pool after a hop through the callback queue, so
 *   it can never finish before add_request() has returned on that queue
 * - completion handlers and request callbacks always run on the callback queue
 * - a start() that throws finishes its task with a default-constructed Result,
 *   and a callback that throws is logged without affecting the others
 */

#ifndef FLIGHTCACHE_SINGLE_FLIGHT_REGISTRY_HPP
#define FLIGHTCACHE_SINGLE_FLIGHT_REGISTRY_HPP

#include "util/dispatch_queue.hpp"
#include "util/logger.hpp"
#include "util/worker_pool.hpp"
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flightcache {

using RequestId = uint64_t;

/**
 * @brief Process-unique, monotonically increasing request identifier
 */
inline RequestId next_request_id() {
    static std::atomic<RequestId> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

template <typename TaskId, typename Result, typename Hash = std::hash<TaskId>>
class SingleFlightRegistry {
public:
    using Finish = std::function<void(Result)>;
    using Start = std::function<void(Finish)>;
    using Cancel = std::function<void()>;
    using Completion = std::function<void(const Result&)>;

    SingleFlightRegistry(DispatchQueue& callback_queue, WorkerPool& worker_pool)
        : callback_queue_(callback_queue)
        , worker_pool_(worker_pool) {}

    SingleFlightRegistry(const SingleFlightRegistry&) = delete;
    SingleFlightRegistry& operator=(const SingleFlightRegistry&) = delete;

    /**
     * @brief Attach a request to the task for @p task_id, creating the task if needed
     *
     * @param task_id Identity of the work
     * @param start Work to run if this request creates the task; it must call
     *        the supplied finish exactly once unless it was cancelled
     * @param cancel Invoked once if every request detaches before completion
     * @param on_task_done Invoked with the result before any request callback
     * @param on_result This request's callback
     * @return Identifier for cancel_request()
     */
    RequestId add_request(const TaskId& task_id,
                          Start start,
                          Cancel cancel,
                          Completion on_task_done,
                          Completion on_result)
    {
        const RequestId request_id = next_request_id();
        uint64_t generation = 0;
        bool created = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tasks_.find(task_id);
            if (it == tasks_.end()) {
                Task task;
                task.generation = ++generation_counter_;
                task.cancel = std::move(cancel);
                task.on_task_done = std::move(on_task_done);
                it = tasks_.emplace(task_id, std::move(task)).first;
                generation = it->second.generation;
                created = true;
            }
            it->second.requests.emplace(request_id, std::move(on_result));
            request_index_.emplace(request_id, task_id);
        }

        if (created) {
            schedule_start(task_id, generation, std::move(start));
        }
        return request_id;
    }

    /**
     * @brief Detach a request; cancels its task when no request remains
     *
     * Unknown or already-completed ids are ignored.
     */
    void cancel_request(RequestId request_id) {
        Cancel cancel;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto index = request_index_.find(request_id);
            if (index == request_index_.end()) {
                return;
            }
            auto task = tasks_.find(index->second);
            request_index_.erase(index);
            if (task == tasks_.end()) {
                return;
            }
            task->second.requests.erase(request_id);
            if (task->second.requests.empty()) {
                cancel = std::move(task->second.cancel);
                tasks_.erase(task);
            }
        }
        if (cancel) {
            cancel();
        }
    }

    size_t task_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    bool has_task(const TaskId& task_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.find(task_id) != tasks_.end();
    }

    size_t request_count(const TaskId& task_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        return it == tasks_.end() ? 0 : it->second.requests.size();
    }

private:
    struct Task {
        uint64_t generation = 0;
        std::map<RequestId, Completion> requests;   // ordered: RequestIds increase
        Cancel cancel;
        Completion on_task_done;
    };

    void schedule_start(const TaskId& task_id, uint64_t generation, Start start) {
        Finish finish = [this, task_id, generation](Result result) {
            callback_queue_.post([this, task_id, generation, result = std::move(result)]() {
                finish_task(task_id, generation, result);
            });
        };
        callback_queue_.post([this, task_id, generation, start = std::move(start),
                              finish = std::move(finish)]() mutable {
            worker_pool_.submit([this, task_id, generation, start = std::move(start),
                                 finish = std::move(finish)]() {
                // Skip work for a task whose requests were all cancelled before it started
                if (!is_live(task_id, generation)) {
                    return;
                }
                try {
                    start(finish);
                } catch (const std::exception& e) {
                    Logger::get_instance().log_error(CacheEventContext("", "", "single_flight"),
                                                     std::string("Task start threw: ") + e.what());
                    finish(Result{});
                }
            });
        });
    }

    bool is_live(const TaskId& task_id, uint64_t generation) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tasks_.find(task_id);
        return it != tasks_.end() && it->second.generation == generation;
    }

    void finish_task(const TaskId& task_id, uint64_t generation, const Result& result) {
        Completion on_task_done;
        std::vector<Completion> completions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = tasks_.find(task_id);
            // A cancelled task may have been replaced by a newer one for the same id
            if (it == tasks_.end() || it->second.generation != generation) {
                return;
            }
            on_task_done = std::move(it->second.on_task_done);
            completions.reserve(it->second.requests.size());
            for (auto& request : it->second.requests) {
                request_index_.erase(request.first);
                completions.push_back(std::move(request.second));
            }
            tasks_.erase(it);
        }

        if (on_task_done) {
            invoke_guarded(on_task_done, result, "Task completion threw: ");
        }
        for (const auto& completion : completions) {
            if (completion) {
                invoke_guarded(completion, result, "Request callback threw: ");
            }
        }
    }

    static void invoke_guarded(const Completion& completion, const Result& result, const char* what) {
        try {
            completion(result);
        } catch (const std::exception& e) {
            Logger::get_instance().log_error(CacheEventContext("", "", "single_flight"),
                                             std::string(what) + e.what());
        }
    }

    DispatchQueue& callback_queue_;
    WorkerPool& worker_pool_;

    mutable std::mutex mutex_;
    std::unordered_map<TaskId, Task, Hash> tasks_;
    std::unordered_map<RequestId, TaskId> request_index_;
    uint64_t generation_counter_ = 0;
};

} // namespace flightcache

#endif // FLIGHTCACHE_SINGLE_FLIGHT_REGISTRY_HPP
