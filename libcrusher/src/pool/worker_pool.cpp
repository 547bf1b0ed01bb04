#include "../../include/worker_pool.hpp"
#include "../../include/logger.hpp"
#include "../../include/wire_codec.hpp"
#include <algorithm>
#include <deque>
#include <functional>
#include <mutex>
#include <stdexcept>

namespace crusher {

    namespace {

    void invoke_callback(const ReplyCallback& callback, const std::optional<TaskError>& error, Task task) {
        if (!callback) return;
        try {
            callback(error, std::move(task));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("reply callback threw: ") + e.what(), "pool");
        }
    }

    } // namespace

    struct WorkerPool::Impl {
        PoolOptions options;
        EventBus bus;

        mutable std::mutex mtx;
        std::deque<std::unique_ptr<WorkerHandle>> rotation; // front is the head, back the tail
        std::vector<std::unique_ptr<WorkerHandle>> retired; // removed by their own reader, reaped later
        bool ready = false;
        WorkerId next_id = 0;

        explicit Impl(PoolOptions opts) : options(std::move(opts)) {}

        ~Impl() {
            kill_where([](const WorkerHandle&) { return true; });
            reap();
        }

        std::deque<std::unique_ptr<WorkerHandle>>::iterator find_locked(const WorkerId id) {
            return std::find_if(rotation.begin(), rotation.end(),
                                [id](const auto& h) { return h->id() == id; });
        }

        // removes a worker from rotation; caller holds mtx
        std::unique_ptr<WorkerHandle> extract_locked(const WorkerId id) {
            const auto it = find_locked(id);
            if (it == rotation.end()) return nullptr;
            auto handle = std::move(*it);
            rotation.erase(it);
            if (rotation.empty()) ready = false;
            return handle;
        }

        void initialize(const std::optional<unsigned> count) {
            std::vector<WorkerSpawnedEvent> spawned;
            {
                std::lock_guard lock(mtx);
                if (ready) return;

                const unsigned n = count.value_or(options.workers != 0 ? options.workers : default_worker_count());
                if (n == 0) {
                    throw std::invalid_argument("worker count must be at least 1");
                }

                // spawning under the lock keeps an early exit from racing the insertion
                try {
                    for (unsigned i = 0; i < n; ++i) {
                        const WorkerId id = next_id++;
                        auto handle = WorkerHandle::spawn(
                            id, options,
                            [this, id](std::string payload) { on_frame(id, std::move(payload)); },
                            [this, id](const std::string& reason) { on_close(id, reason); });
                        spawned.push_back({id, handle->pid()});
                        rotation.push_front(std::move(handle));
                    }
                } catch (const std::exception& e) {
                    ready = !rotation.empty();
                    Logger::log(LogLevel::Error, std::string("failed to spawn worker: ") + e.what(), "pool");
                    throw;
                }
                ready = true;
            }

            Logger::log(LogLevel::Info, "started " + std::to_string(spawned.size()) + " worker(s)", "pool");
            for (const auto& e : spawned) bus.publish(e);
        }

        TaskId send(Task task, ReplyCallback callback) {
            if (!is_ready()) {
                initialize(std::nullopt);
            }
            reap();

            WorkerId worker = 0;
            {
                std::lock_guard lock(mtx);
                if (rotation.empty()) {
                    throw std::runtime_error("worker pool has no workers");
                }
                if (task.id.empty()) {
                    task.id = generate_task_id();
                }

                auto& tail = rotation.back();
                if (tail->queue.contains(task.id)) {
                    throw std::invalid_argument("task id " + task.id + " is already pending on worker " +
                                                std::to_string(tail->id()));
                }

                auto handle = std::move(tail);
                rotation.pop_back();
                worker = handle->id();
                handle->post(encode_task(task));
                handle->queue.emplace(task.id, PendingTask{std::move(callback), task});
                rotation.push_front(std::move(handle));
            }

            bus.publish(TaskDispatchedEvent{task.id, worker});
            return task.id;
        }

        bool is_ready() const {
            std::lock_guard lock(mtx);
            return ready;
        }

        void kill_where(const std::function<bool(const WorkerHandle&)>& match) {
            std::vector<std::unique_ptr<WorkerHandle>> victims;
            {
                std::lock_guard lock(mtx);
                for (auto it = rotation.begin(); it != rotation.end();) {
                    if (match(**it)) {
                        victims.push_back(std::move(*it));
                        it = rotation.erase(it);
                    } else {
                        ++it;
                    }
                }
                if (rotation.empty()) ready = false;
            }

            for (auto& handle : victims) {
                const std::size_t dropped = handle->queue.size();
                handle->queue.clear();
                if (dropped > 0) {
                    Logger::log(LogLevel::Warning,
                                "killing worker " + std::to_string(handle->id()) + " drops " +
                                std::to_string(dropped) + " pending callback(s)", "pool");
                }

                const WorkerExitedEvent exited{handle->id(), handle->pid(), true, dropped};
                if (handle->on_reader_thread()) {
                    // killed from one of its own callbacks; reaped by a later call
                    handle->hang_up();
                    std::lock_guard lock(mtx);
                    retired.push_back(std::move(handle));
                } else {
                    handle->terminate();
                }
                Logger::log(LogLevel::Debug, "worker " + std::to_string(exited.worker) + " killed", "pool");
                bus.publish(exited);
            }
        }

        // terminates workers that left the rotation by themselves
        void reap() {
            std::vector<std::unique_ptr<WorkerHandle>> batch;
            {
                std::lock_guard lock(mtx);
                for (auto it = retired.begin(); it != retired.end();) {
                    if ((*it)->on_reader_thread()) {
                        ++it;
                    } else {
                        batch.push_back(std::move(*it));
                        it = retired.erase(it);
                    }
                }
            }
            for (auto& handle : batch) {
                handle->terminate(std::chrono::milliseconds(500));
            }
        }

        void on_frame(const WorkerId id, std::string payload) {
            Reply reply;
            try {
                reply = decode_reply(payload);
            } catch (const ProtocolError& e) {
                retire(id, {}, std::string("malformed reply: ") + e.what(), true);
                return;
            }
            const TaskId task_id = reply.task.id;
            if (correlate(id, std::move(reply)) == Correlation::Unrecoverable) {
                retire(id, task_id, "reply for task " + task_id + " which is not pending", true);
            }
        }

        Correlation correlate(const WorkerId id, Reply reply) {
            ReplyCallback callback;
            {
                std::lock_guard lock(mtx);
                const auto it = find_locked(id);
                if (it == rotation.end()) {
                    Logger::log(LogLevel::Debug,
                                "reply " + reply.task.id + " from killed worker " + std::to_string(id) + " discarded",
                                "pool");
                    return Correlation::Discarded;
                }

                auto& queue = (*it)->queue;
                const auto pending = queue.find(reply.task.id);
                if (pending == queue.end()) {
                    return Correlation::Unrecoverable;
                }
                callback = std::move(pending->second.callback);
                queue.erase(pending);
            }

            const TaskId task_id = reply.task.id;
            const auto error = reply.error;
            invoke_callback(callback, reply.error, std::move(reply.task));
            bus.publish(TaskCompletedEvent{task_id, id, error});
            return Correlation::Delivered;
        }

        void on_close(const WorkerId id, const std::string& reason) {
            retire(id, {}, reason.empty() ? "worker exited" : reason, false);
        }

        // removes a worker that failed, answers its pending tasks with WorkerLost
        void retire(const WorkerId id, const TaskId& task_id, const std::string& reason, const bool fault) {
            std::map<TaskId, PendingTask> orphans;
            pid_t pid = 0;
            {
                std::lock_guard lock(mtx);
                auto handle = extract_locked(id);
                if (!handle) return;
                handle->hang_up();
                pid = handle->pid();
                orphans = std::move(handle->queue);
                handle->queue.clear();
                retired.push_back(std::move(handle));
            }

            if (fault) {
                Logger::log(LogLevel::Error, "worker " + std::to_string(id) + ": " + reason, "pool");
                bus.publish(WorkerFaultEvent{id, task_id, reason});
            } else {
                Logger::log(LogLevel::Warning,
                            "worker " + std::to_string(id) + " (pid " + std::to_string(pid) +
                            ") left unexpectedly: " + reason, "pool");
            }
            bus.publish(WorkerExitedEvent{id, pid, false, 0});

            const TaskError lost{ErrorKind::WorkerLost,
                                 "Worker " + std::to_string(id) + " exited before replying"};
            for (auto& [pending_id, pending] : orphans) {
                invoke_callback(pending.callback, lost, std::move(pending.request));
                bus.publish(TaskCompletedEvent{pending_id, id, lost});
            }
        }
    };

    WorkerPool::WorkerPool(PoolOptions options)
        : impl_(std::make_unique<Impl>(std::move(options))) {}

    WorkerPool::~WorkerPool() = default;

    void WorkerPool::initialize(const std::optional<unsigned> count) {
        impl_->initialize(count);
    }

    bool WorkerPool::ready() const {
        return impl_->is_ready();
    }

    TaskId WorkerPool::send(Task task, ReplyCallback callback) {
        return impl_->send(std::move(task), std::move(callback));
    }

    void WorkerPool::kill() {
        impl_->kill_where([](const WorkerHandle&) { return true; });
        impl_->reap();
    }

    void WorkerPool::kill(const WorkerId worker) {
        impl_->kill_where([worker](const WorkerHandle& h) { return h.id() == worker; });
    }

    void WorkerPool::kill(const std::span<const WorkerId> workers) {
        impl_->kill_where([workers](const WorkerHandle& h) {
            return std::find(workers.begin(), workers.end(), h.id()) != workers.end();
        });
    }

    std::vector<WorkerId> WorkerPool::worker_ids() const {
        std::lock_guard lock(impl_->mtx);
        std::vector<WorkerId> ids;
        ids.reserve(impl_->rotation.size());
        for (const auto& h : impl_->rotation) ids.push_back(h->id());
        return ids;
    }

    std::size_t WorkerPool::pending() const {
        std::lock_guard lock(impl_->mtx);
        std::size_t n = 0;
        for (const auto& h : impl_->rotation) n += h->queue.size();
        return n;
    }

    EventBus& WorkerPool::events() noexcept {
        return impl_->bus;
    }

} // namespace crusher
