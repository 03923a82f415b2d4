#pragma once

#include <takpipe/channel.hpp>
#include <takpipe/codec.hpp>
#include <takpipe/config.hpp>
#include <takpipe/metrics.hpp>
#include <takpipe/transport.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <random>
#include <thread>

namespace takpipe {

    /// Base for every task the orchestrator schedules
    ///
    /// A worker owns one queue and loops until its transport fails or stop() is called:
    ///   run() -> run_once() -> handle_data() -> (compatibility delay) -> yield -> ...
    /// A failing run_once() ends the loop and its error is returned from run().
    class Worker {
      protected:
        std::shared_ptr<Queue> queue_;
        Config config_;
        Context ctx_;
        const WireCodec *codec_;
        std::shared_ptr<PipelineMetrics> metrics_;
        bool use_binary_;
        Framing framing_;

        std::atomic<bool> stopping_;
        std::mutex stop_mutex_;
        std::condition_variable stop_cv_;

        /// Sleep after a handled message when TAKPIPE_SLEEP or FTS_COMPAT is configured
        /// TAKPIPE_SLEEP gives a fixed number of seconds; FTS_COMPAT alone a random fraction of 5 s.
        /// stop() cuts the delay short.
        void compat_delay() {
            dp::i64 sleep_s = config_.get_int(keys::SLEEP, 0);
            if (sleep_s <= 0 && !config_.get_bool(keys::FTS_COMPAT)) {
                return;
            }

            dp::u64 period_ms = 0;
            if (sleep_s > 0) {
                period_ms = static_cast<dp::u64>(sleep_s) * 1000;
            } else {
                static thread_local std::mt19937 rng{std::random_device{}()};
                std::uniform_int_distribution<dp::u64> dist(0, DEFAULT_SLEEP * 1000);
                period_ms = dist(rng);
            }

            echo::debug(ctx_.tag.c_str(), ": COMPAT: sleeping for ", period_ms, "ms");
            std::unique_lock<std::mutex> lock(stop_mutex_);
            stop_cv_.wait_for(lock, std::chrono::milliseconds(period_ms), [this] { return stopping_.load(); });
        }

        /// Drop-oldest admission: a full queue loses its oldest entry, never the new one
        void put_queue(Queue &queue, Message data) {
            echo::trace(ctx_.tag.c_str(), ": queue size=", queue.size());
            if (queue.push_evicting(std::move(data))) {
                metrics_->evicted.fetch_add(1);
                echo::warn(ctx_.tag.c_str(),
                           ": Queue full, dropping oldest data. Consider raising MAX_IN_QUEUE or MAX_OUT_QUEUE");
            }
        }

        /// Release whatever the worker blocks on; called once from stop()
        virtual void on_stop() { queue_->close(); }

        /// One iteration: wait for a queued message, handle it, then apply the compatibility delay
        virtual dp::Res<void> run_once() {
            auto item = queue_->pop();
            if (item.is_err()) {
                return dp::result::err(item.error());
            }
            auto res = handle_data(item.value());
            if (res.is_err()) {
                return res;
            }
            compat_delay();
            return dp::result::ok();
        }

      public:
        Worker(std::shared_ptr<Queue> queue, Config config, const Context &ctx, const WireCodec *codec = nullptr,
               std::shared_ptr<PipelineMetrics> metrics = nullptr)
            : queue_(std::move(queue)), config_(std::move(config)), ctx_(ctx.for_endpoint(config_)), codec_(codec),
              metrics_(metrics ? std::move(metrics) : std::make_shared<PipelineMetrics>()),
              use_binary_(wants_binary(config_) && codec != nullptr), framing_(Framing::Stream), stopping_(false) {
            // Framing is fixed for the worker's lifetime by the destination host
            auto url = parse_url(config_.get(keys::COT_URL, DEFAULT_COT_URL));
            if (url.is_ok()) {
                framing_ = select_framing(url.value().host);
            }
            if (wants_binary(config_) && codec == nullptr) {
                echo::warn(ctx_.tag.c_str(), ": TAK_PROTO=", config_.get(keys::TAK_PROTO).c_str(),
                           " but no wire codec given, sending XML");
            }
        }

        virtual ~Worker() = default;

        Worker(const Worker &) = delete;
        Worker &operator=(const Worker &) = delete;

        virtual const char *name() const = 0;

        virtual dp::Res<void> handle_data(const Message &data) = 0;

        /// Loop until a transport failure (returned) or stop() (ok)
        virtual dp::Res<void> run() {
            echo::info(ctx_.tag.c_str(), ": Running ", name());
            while (!stopping_) {
                auto res = run_once();
                if (res.is_err()) {
                    if (stopping_) {
                        break;
                    }
                    echo::error(ctx_.tag.c_str(), ": ", name(), " terminated: ", res.error().message.c_str());
                    return res;
                }
                // Let sibling workers in even if this iteration never blocked
                std::this_thread::yield();
            }
            echo::info(ctx_.tag.c_str(), ": ", name(), " stopped");
            return dp::result::ok();
        }

        /// Ask run() to return; safe to call from any thread, more than once
        void stop() {
            if (stopping_.exchange(true)) {
                return;
            }
            {
                std::lock_guard<std::mutex> lock(stop_mutex_);
            }
            stop_cv_.notify_all();
            on_stop();
        }

        bool stopping() const { return stopping_; }

        Queue &queue() const { return *queue_; }

        const Config &config() const { return config_; }

        const Context &context() const { return ctx_; }

        PipelineMetrics &metrics() const { return *metrics_; }

        bool use_binary() const { return use_binary_; }

        Framing framing() const { return framing_; }
    };

    /// Moves queued payloads to a writer
    class TXWorker : public Worker {
      private:
        Writer writer_;

      protected:
        void on_stop() override {
            Worker::on_stop();
            writer_.close();
        }

      public:
        TXWorker(std::shared_ptr<Queue> queue, Config config, Writer writer, const Context &ctx,
                 const WireCodec *codec = nullptr, std::shared_ptr<PipelineMetrics> metrics = nullptr)
            : Worker(std::move(queue), std::move(config), ctx, codec, std::move(metrics)), writer_(std::move(writer)) {
        }

        const char *name() const override { return "TXWorker"; }

        dp::Res<void> handle_data(const Message &data) override { return send_data(data); }

        /// Transcode (binary framing only) and hand one payload to the writer
        /// Empty payloads are dropped. A payload the codec rejects is sent unmodified.
        /// Writer failures are returned and end the worker.
        dp::Res<void> send_data(const Message &data) {
            if (data.empty()) {
                metrics_->tx_empty_dropped.fetch_add(1);
                echo::warn(ctx_.tag.c_str(), ": send_data called with empty data, skipping send");
                return dp::result::ok();
            }

            const Message *payload = &data;
            Message wire;
            if (use_binary_) {
                auto encoded = xml_to_wire(*codec_, data, framing_);
                if (encoded.is_ok()) {
                    wire = std::move(encoded.value());
                    payload = &wire;
                } else {
                    metrics_->encode_fallbacks.fetch_add(1);
                    echo::warn(ctx_.tag.c_str(), ": Could not convert XML to ", framing_name(framing_),
                               " protocol: ", encoded.error().message.c_str());
                }
            }

            if (ctx_.debug) {
                echo::debug(ctx_.tag.c_str(), ": TX: ", to_string(*payload).c_str());
            }

            SendTracker tracker(*metrics_, payload->size());
            switch (writer_.kind()) {
            case Writer::Kind::Datagram: {
                auto res = writer_.as_datagram().send(*payload);
                if (res.is_err()) {
                    return res;
                }
                break;
            }
            case Writer::Kind::Stream: {
                StreamSink &sink = writer_.as_stream();
                auto res = sink.write(*payload);
                if (res.is_err()) {
                    return res;
                }
                res = sink.drain();
                if (res.is_err()) {
                    return res;
                }
                res = sink.flush();
                if (res.is_err()) {
                    return res;
                }
                break;
            }
            case Writer::Kind::None:
                echo::trace(ctx_.tag.c_str(), ": no writer, discarding ", payload->size(), " bytes");
                return dp::result::ok();
            }
            tracker.success();
            return dp::result::ok();
        }
    };

    /// Moves framed events from a reader onto its queue
    class RXWorker : public Worker {
      private:
        Reader reader_;
        Message delimiter_;

      protected:
        void on_stop() override {
            reader_.close();
            Worker::on_stop();
        }

        dp::Res<void> run_once() override {
            if (!reader_.present()) {
                // Write-only destination: nothing to read until stopped
                std::unique_lock<std::mutex> lock(stop_mutex_);
                stop_cv_.wait(lock, [this] { return stopping_.load(); });
                return dp::result::ok();
            }

            auto event = read_event();
            if (event.is_err()) {
                return dp::result::err(event.error());
            }
            if (event.value().empty()) {
                return dp::result::ok();
            }
            return handle_data(event.value());
        }

      public:
        RXWorker(std::shared_ptr<Queue> queue, Config config, Reader reader, const Context &ctx,
                 const WireCodec *codec = nullptr, std::shared_ptr<PipelineMetrics> metrics = nullptr)
            : Worker(std::move(queue), std::move(config), ctx, codec, std::move(metrics)), reader_(std::move(reader)),
              delimiter_(to_message(COT_EVENT_END)) {}

        const char *name() const override { return "RXWorker"; }

        /// Admit one received event onto the RX queue (drop-oldest)
        dp::Res<void> handle_data(const Message &data) override {
            metrics_->rx_messages.fetch_add(1);
            metrics_->rx_bytes.fetch_add(data.size());
            if (ctx_.debug) {
                echo::debug(ctx_.tag.c_str(), ": RX data: ", to_string(data).c_str());
            }
            put_queue(*queue_, data);
            return dp::result::ok();
        }

        /// Read exactly one event
        /// Stream readers frame on </event>; datagram readers yield one event per datagram.
        /// An empty message means no event was produced (connection closed mid-event).
        dp::Res<Message> read_event() {
            Message frame;
            if (reader_.kind() == Reader::Kind::Stream) {
                auto res = reader_.as_stream().read_until(delimiter_);
                if (res.is_err()) {
                    return res;
                }
                frame = std::move(res.value());
                if (frame.empty()) {
                    metrics_->rx_incomplete.fetch_add(1);
                    echo::debug(ctx_.tag.c_str(), ": incomplete event at end of stream");
                    return dp::result::ok(Message());
                }
            } else if (reader_.kind() == Reader::Kind::Datagram) {
                auto res = reader_.as_datagram().recv();
                if (res.is_err()) {
                    return dp::result::err(res.error());
                }
                auto [data, addr] = std::move(res.value());
                echo::trace(ctx_.tag.c_str(), ": datagram from ", addr.to_string());
                frame = std::move(data);
            } else {
                return dp::result::ok(Message());
            }

            if (use_binary_) {
                // Plain XML frames fail to unframe and pass through unchanged
                auto xml = wire_to_xml(*codec_, frame);
                if (xml.is_ok()) {
                    return dp::result::ok(std::move(xml.value()));
                }
                echo::trace(ctx_.tag.c_str(), ": frame is not TAK protocol: ", xml.error().message.c_str());
            }
            return dp::result::ok(std::move(frame));
        }
    };

    /// Base for application workers that produce events
    /// Subclasses implement handle_data (or override run) and publish with put_queue.
    class QueueWorker : public Worker {
      public:
        QueueWorker(std::shared_ptr<Queue> queue, Config config, const Context &ctx,
                    std::shared_ptr<PipelineMetrics> metrics = nullptr)
            : Worker(std::move(queue), std::move(config), ctx, nullptr, std::move(metrics)) {
            echo::info(ctx_.tag.c_str(), ": Using COT_URL='", config_.get(keys::COT_URL).c_str(), "'");
        }

        const char *name() const override { return "QueueWorker"; }

        /// Put data onto this worker's queue, evicting the oldest entry when full
        void put_queue(Message data) { Worker::put_queue(*queue_, std::move(data)); }

        /// Put data onto another queue with the same policy
        void put_queue(Message data, Queue &queue) { Worker::put_queue(queue, std::move(data)); }
    };

    /// TX worker for the config's destination, opening the transport
    inline dp::Res<std::shared_ptr<TXWorker>> txworker_factory(std::shared_ptr<Queue> queue, const Config &config,
                                                               const Context &ctx, const WireCodec *codec = nullptr,
                                                               const CertificateEnrollment *enrollment = nullptr) {
        auto checked = check_codec(config, codec);
        if (checked.is_err()) {
            return dp::result::err(checked.error());
        }
        auto endpoint = protocol_factory(config, enrollment);
        if (endpoint.is_err()) {
            return dp::result::err(endpoint.error());
        }
        return dp::result::ok(
            std::make_shared<TXWorker>(std::move(queue), config, endpoint.value().writer, ctx, codec));
    }

    /// RX worker for the config's destination, opening the transport
    inline dp::Res<std::shared_ptr<RXWorker>> rxworker_factory(std::shared_ptr<Queue> queue, const Config &config,
                                                               const Context &ctx, const WireCodec *codec = nullptr,
                                                               const CertificateEnrollment *enrollment = nullptr) {
        auto checked = check_codec(config, codec);
        if (checked.is_err()) {
            return dp::result::err(checked.error());
        }
        auto endpoint = protocol_factory(config, enrollment);
        if (endpoint.is_err()) {
            return dp::result::err(endpoint.error());
        }
        return dp::result::ok(
            std::make_shared<RXWorker>(std::move(queue), config, endpoint.value().reader, ctx, codec));
    }

} // namespace takpipe
