#include <takpipe/takpipe.hpp>

// Prints every event received from COT_URL
//   COT_URL=udp://239.2.3.1:6969 ./cot_listener
//   COT_URL=tls://takserver:8089 TAKPIPE_TLS_CLIENT_CERT=client.p12 TAKPIPE_TLS_CLIENT_PASSWORD=atakatak ./cot_listener

namespace {

    // Consumes the RX queue
    class EventPrinter : public takpipe::QueueWorker {
      private:
        dp::u64 received_;

      public:
        EventPrinter(std::shared_ptr<takpipe::Queue> queue, const takpipe::Config &config,
                     const takpipe::Context &ctx)
            : takpipe::QueueWorker(std::move(queue), config, ctx), received_(0) {}

        dp::Res<void> handle_data(const takpipe::Message &data) override {
            ++received_;
            echo::info("Event #", received_, " (", data.size(), " bytes): ", takpipe::to_string(data).c_str());
            return dp::result::ok();
        }
    };

} // namespace

int main(int argc, char **argv) {
    auto config = takpipe::Config::from_environment(
        "listener", {takpipe::keys::COT_URL, takpipe::keys::MAX_IN_QUEUE, takpipe::keys::TAK_PROTO,
                     takpipe::keys::DEBUG, takpipe::keys::MULTICAST_LOCAL_ADDR, takpipe::keys::TLS_CLIENT_CERT,
                     takpipe::keys::TLS_CLIENT_KEY, takpipe::keys::TLS_CLIENT_CAFILE,
                     takpipe::keys::TLS_CLIENT_PASSWORD, takpipe::keys::TLS_DONT_VERIFY,
                     takpipe::keys::TLS_DONT_CHECK_HOSTNAME, takpipe::keys::TLS_SERVER_EXPECTED_HOSTNAME});
    if (argc > 1) {
        config = config.with(takpipe::keys::COT_URL, dp::String(argv[1]));
    }
    if (!config.has(takpipe::keys::COT_URL)) {
        echo::info("Usage: ", argv[0], " <cot_url>   (or set COT_URL)");
        return 1;
    }
    // Listening only
    config = config.with(takpipe::keys::NO_HELLO, "1");

    auto ctx = takpipe::Context::from_environment("cot_listener");
    takpipe::Orchestrator orchestrator(config, ctx);
    auto res = orchestrator.create_workers(config);
    if (res.is_err()) {
        echo::error("Cannot open ", config.get(takpipe::keys::COT_URL).c_str(), ": ", res.error().message.c_str());
        return 1;
    }

    orchestrator.add_task(std::make_shared<EventPrinter>(orchestrator.rx_queue(), config, ctx));
    echo::info("Listening on ", config.get(takpipe::keys::COT_URL).c_str());

    auto run_res = orchestrator.run();
    orchestrator.stop();
    if (run_res.is_err()) {
        echo::error("Listener ended: ", run_res.error().message.c_str());
        return 1;
    }
    return 0;
}
