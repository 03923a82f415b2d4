#pragma once

#include <takpipe/worker.hpp>

#include <deque>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace takpipe {

    // TX/RX queues and counters of one named endpoint
    struct QueuePair {
        std::shared_ptr<Queue> tx;
        std::shared_ptr<Queue> rx;
        std::shared_ptr<PipelineMetrics> metrics;
    };

    /// Owns the endpoint queues and runs every registered worker on its own thread
    ///
    /// run() returns as soon as the first worker terminates, with that worker's result.
    /// The remaining workers keep running until stop() or destruction; restarting a failed
    /// endpoint is left to the caller.
    class Orchestrator {
      private:
        Config config_;
        Context ctx_;
        const WireCodec *codec_;
        const CertificateEnrollment *enrollment_;
        dp::usize max_in_queue_;
        dp::usize max_out_queue_;

        std::shared_ptr<Queue> tx_queue_;
        std::shared_ptr<Queue> rx_queue_;
        std::map<std::string, QueuePair> queues_;
        Message hello_;

        std::vector<std::shared_ptr<Worker>> tasks_;
        std::vector<std::thread> threads_;
        dp::usize started_;

        std::mutex done_mutex_;
        std::condition_variable done_cv_;
        std::deque<dp::Res<void>> finished_;

        static dp::usize capacity(const Config &config, const char *key, dp::usize fallback) {
            dp::i64 value = config.get_int(key, static_cast<dp::i64>(fallback));
            return value > 0 ? static_cast<dp::usize>(value) : fallback;
        }

      public:
        Orchestrator(Config config, const Context &ctx, const WireCodec *codec = nullptr,
                     const CertificateEnrollment *enrollment = nullptr)
            : config_(std::move(config)), ctx_(ctx), codec_(codec), enrollment_(enrollment),
              max_in_queue_(capacity(config_, keys::MAX_IN_QUEUE, DEFAULT_MAX_IN_QUEUE)),
              max_out_queue_(capacity(config_, keys::MAX_OUT_QUEUE, DEFAULT_MAX_OUT_QUEUE)),
              tx_queue_(std::make_shared<Queue>(max_out_queue_)), rx_queue_(std::make_shared<Queue>(max_in_queue_)),
              started_(0) {
            echo::debug(ctx_.tag.c_str(), ": orchestrator max_out_queue=", max_out_queue_,
                        " max_in_queue=", max_in_queue_);
        }

        ~Orchestrator() { stop(); }

        Orchestrator(const Orchestrator &) = delete;
        Orchestrator &operator=(const Orchestrator &) = delete;

        /// Open one endpoint and register its TX and RX workers
        /// The first endpoint created provides the default tx_queue()/rx_queue().
        dp::Res<void> create_workers(const Config &config) {
            auto checked = check_codec(config, codec_);
            if (checked.is_err()) {
                return checked;
            }
            if (queues_.find(config.name().c_str()) != queues_.end()) {
                echo::error(ctx_.tag.c_str(), ": endpoint '", config.name().c_str(), "' already exists");
                return dp::result::err(
                    dp::Error::invalid_argument(dp::String("duplicate endpoint name: ") + config.name()));
            }

            QueuePair pair;
            pair.tx = std::make_shared<Queue>(capacity(config, keys::MAX_OUT_QUEUE, max_out_queue_));
            pair.rx = std::make_shared<Queue>(capacity(config, keys::MAX_IN_QUEUE, max_in_queue_));
            pair.metrics = std::make_shared<PipelineMetrics>();

            auto endpoint = protocol_factory(config, enrollment_);
            if (endpoint.is_err()) {
                echo::error(ctx_.tag.c_str(), ": cannot open endpoint '", config.name().c_str(),
                            "': ", endpoint.error().message.c_str());
                return dp::result::err(endpoint.error());
            }

            if (queues_.empty()) {
                tx_queue_ = pair.tx;
                rx_queue_ = pair.rx;
            }
            queues_[config.name().c_str()] = pair;

            add_task(std::make_shared<TXWorker>(pair.tx, config, endpoint.value().writer, ctx_, codec_, pair.metrics));
            add_task(std::make_shared<RXWorker>(pair.rx, config, endpoint.value().reader, ctx_, codec_, pair.metrics));
            echo::info(ctx_.tag.c_str(), ": endpoint '", config.name().c_str(), "' ready");
            return dp::result::ok();
        }

        /// Open several named endpoints; each one succeeds or fails on its own
        /// Fails only if no endpoint could be opened, with the last error.
        dp::Res<void> create_workers(const std::vector<Config> &configs) {
            if (configs.empty()) {
                return dp::result::err(dp::Error::invalid_argument("no endpoint configured"));
            }
            dp::Res<void> last = dp::result::ok();
            dp::usize opened = 0;
            for (const auto &config : configs) {
                auto res = create_workers(config);
                if (res.is_ok()) {
                    ++opened;
                } else {
                    echo::warn(ctx_.tag.c_str(), ": skipping endpoint '", config.name().c_str(), "'");
                    last = res;
                }
            }
            echo::info(ctx_.tag.c_str(), ": opened ", opened, "/", configs.size(), " endpoints");
            return opened > 0 ? dp::result::ok() : last;
        }

        /// Schedule an extra worker, e.g. an application QueueWorker producing onto tx_queue()
        void add_task(std::shared_ptr<Worker> task) {
            echo::debug(ctx_.tag.c_str(), ": adding task ", task->name());
            tasks_.push_back(std::move(task));
        }

        /// Event pushed onto the default TX queue when run() starts (unless TAKPIPE_NO_HELLO)
        void set_hello(Message hello) { hello_ = std::move(hello); }

        /// Start every registered worker and wait for the first one to terminate
        dp::Res<void> run() {
            if (tasks_.empty()) {
                return dp::result::err(dp::Error::invalid_argument("no tasks to run"));
            }

            if (!hello_.empty() && !config_.get_bool(keys::NO_HELLO)) {
                echo::debug(ctx_.tag.c_str(), ": sending hello event");
                if (tx_queue_->push_evicting(hello_)) {
                    echo::warn(ctx_.tag.c_str(), ": TX queue full, hello event displaced the oldest entry");
                }
            }

            for (; started_ < tasks_.size(); ++started_) {
                std::shared_ptr<Worker> task = tasks_[started_];
                threads_.emplace_back([this, task] {
                    auto res = task->run();
                    {
                        std::lock_guard<std::mutex> lock(done_mutex_);
                        finished_.push_back(res);
                    }
                    done_cv_.notify_all();
                });
            }

            std::unique_lock<std::mutex> lock(done_mutex_);
            done_cv_.wait(lock, [this] { return !finished_.empty(); });
            dp::Res<void> first = finished_.front();
            finished_.pop_front();
            if (first.is_err()) {
                echo::error(ctx_.tag.c_str(), ": task failed: ", first.error().message.c_str());
            } else {
                echo::info(ctx_.tag.c_str(), ": task complete");
            }
            return first;
        }

        /// Stop and join every worker thread
        void stop() {
            for (auto &task : tasks_) {
                task->stop();
            }
            for (auto &thread : threads_) {
                if (thread.joinable()) {
                    thread.join();
                }
            }
            threads_.clear();
        }

        std::shared_ptr<Queue> tx_queue() const { return tx_queue_; }

        std::shared_ptr<Queue> rx_queue() const { return rx_queue_; }

        /// Queues of a named endpoint
        dp::Res<QueuePair> queues(const dp::String &name) const {
            auto it = queues_.find(name.c_str());
            if (it == queues_.end()) {
                return dp::result::err(dp::Error::not_found(dp::String("no endpoint named ") + name));
            }
            return dp::result::ok(it->second);
        }

        dp::usize endpoint_count() const { return queues_.size(); }

        dp::usize task_count() const { return tasks_.size(); }

        dp::usize max_in_queue() const { return max_in_queue_; }

        dp::usize max_out_queue() const { return max_out_queue_; }
    };

} // namespace takpipe
