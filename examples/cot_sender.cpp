#include <chrono>
#include <ctime>
#include <takpipe/takpipe.hpp>
#include <thread>

// Publishes a position report every few seconds to COT_URL (default: ATAK multicast group)
//   COT_URL=tcp://takserver:8087 ./cot_sender
//   COT_URL=udp+wo://239.2.3.1:6969 DEBUG=1 ./cot_sender

namespace {

    dp::String timestamp(std::chrono::system_clock::time_point tp) {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&t));
        return dp::String(buf);
    }

    takpipe::Message position_event(const dp::String &uid, double lat, double lon) {
        auto now = std::chrono::system_clock::now();
        dp::String xml = dp::String("<?xml version=\"1.0\" encoding=\"UTF-8\"?>") + "<event version=\"2.0\" uid=\"" +
                         uid + "\" type=\"a-f-G-U-C\" how=\"m-g\" time=\"" + timestamp(now) + "\" start=\"" +
                         timestamp(now) + "\" stale=\"" + timestamp(now + std::chrono::minutes(1)) + "\">" +
                         "<point lat=\"" + dp::String(std::to_string(lat).c_str()) + "\" lon=\"" +
                         dp::String(std::to_string(lon).c_str()) +
                         "\" hae=\"9999999.0\" ce=\"9999999.0\" le=\"9999999.0\"/></event>";
        return takpipe::to_message(xml);
    }

    // Application side of the pipeline: generates events onto the TX queue
    class PositionReporter : public takpipe::QueueWorker {
      private:
        dp::String uid_;
        dp::u32 count_;
        dp::u32 interval_s_;

      public:
        PositionReporter(std::shared_ptr<takpipe::Queue> queue, const takpipe::Config &config,
                         const takpipe::Context &ctx)
            : takpipe::QueueWorker(std::move(queue), config, ctx),
              uid_(config.get(takpipe::keys::COT_HOST_ID, "takpipe-sender")), count_(0), interval_s_(5) {}

        dp::Res<void> handle_data(const takpipe::Message &) override { return dp::result::ok(); }

        dp::Res<void> run() override {
            echo::info("Reporting as ", uid_.c_str());
            while (!stopping() && count_ < 10) {
                double lat = 37.76 + 0.001 * count_;
                put_queue(position_event(uid_, lat, -122.4));
                echo::info("Queued position #", count_, " lat=", lat);
                ++count_;
                std::this_thread::sleep_for(std::chrono::seconds(interval_s_));
            }
            echo::info("Sender done after ", count_, " events");
            return dp::result::ok();
        }
    };

} // namespace

int main() {
    auto config = takpipe::Config::from_environment(
        "sender", {takpipe::keys::COT_URL, takpipe::keys::COT_HOST_ID, takpipe::keys::MAX_OUT_QUEUE,
                   takpipe::keys::MAX_IN_QUEUE, takpipe::keys::TAK_PROTO, takpipe::keys::DEBUG,
                   takpipe::keys::FTS_COMPAT, takpipe::keys::SLEEP, takpipe::keys::NO_HELLO,
                   takpipe::keys::MULTICAST_LOCAL_ADDR, takpipe::keys::MULTICAST_TTL,
                   takpipe::keys::TLS_CLIENT_CERT, takpipe::keys::TLS_CLIENT_KEY, takpipe::keys::TLS_CLIENT_CAFILE,
                   takpipe::keys::TLS_CLIENT_PASSWORD, takpipe::keys::TLS_DONT_VERIFY,
                   takpipe::keys::TLS_DONT_CHECK_HOSTNAME, takpipe::keys::TLS_SERVER_EXPECTED_HOSTNAME});
    auto ctx = takpipe::Context::from_environment("cot_sender");

    echo::info("COT_URL=", config.get(takpipe::keys::COT_URL, takpipe::DEFAULT_COT_URL).c_str());

    takpipe::Orchestrator orchestrator(config, ctx);
    auto res = orchestrator.create_workers(config);
    if (res.is_err()) {
        echo::error("Cannot open destination: ", res.error().message.c_str());
        return 1;
    }

    orchestrator.add_task(std::make_shared<PositionReporter>(orchestrator.tx_queue(), config, ctx));

    auto run_res = orchestrator.run();
    // Give the TX worker a moment to flush the last event
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    orchestrator.stop();

    if (run_res.is_err()) {
        echo::error("Pipeline ended: ", run_res.error().message.c_str());
        return 1;
    }
    return 0;
}
