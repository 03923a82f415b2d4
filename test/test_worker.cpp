#include <doctest/doctest.h>
#include <takpipe/worker.hpp>

#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

    // Application producer; handle_data is never reached because tests only publish
    class Producer : public takpipe::QueueWorker {
      public:
        using takpipe::QueueWorker::QueueWorker;

        dp::Res<void> handle_data(const takpipe::Message &) override { return dp::result::ok(); }
    };

    class CapturingDatagramSink : public takpipe::DatagramSink {
      public:
        std::mutex mutex;
        std::vector<takpipe::Message> sent;
        bool fail = false;
        bool closed = false;

        dp::Res<void> send(const takpipe::Message &data) override {
            std::lock_guard<std::mutex> lock(mutex);
            if (fail) {
                return dp::result::err(dp::Error::io_error("network unreachable"));
            }
            sent.push_back(data);
            return dp::result::ok();
        }

        void close() override { closed = true; }
    };

    class CapturingStreamSink : public takpipe::StreamSink {
      public:
        std::string written;
        std::string pending;
        int flushes = 0;

        dp::Res<void> write(const takpipe::Message &msg) override {
            pending += takpipe::to_string(msg).c_str();
            return dp::result::ok();
        }

        dp::Res<void> drain() override {
            written += pending;
            pending.clear();
            return dp::result::ok();
        }

        dp::Res<void> flush() override {
            ++flushes;
            return dp::result::ok();
        }

        void close() override {}
    };

    class ScriptedSource : public takpipe::ByteSource {
      private:
        std::vector<std::string> chunks_;
        dp::usize next_ = 0;

      public:
        explicit ScriptedSource(std::vector<std::string> chunks) : chunks_(std::move(chunks)) {}

        dp::Res<dp::usize> read_some(dp::u8 *buffer, dp::usize count) override {
            if (next_ >= chunks_.size()) {
                return dp::result::ok(static_cast<dp::usize>(0));
            }
            const std::string &chunk = chunks_[next_++];
            dp::usize n = std::min(count, chunk.size());
            std::memcpy(buffer, chunk.data(), n);
            return dp::result::ok(n);
        }

        void close() override {}
    };

    class ScriptedDatagrams : public takpipe::DatagramSource {
      private:
        std::vector<takpipe::Message> datagrams_;
        dp::usize next_ = 0;

      public:
        explicit ScriptedDatagrams(std::vector<takpipe::Message> datagrams) : datagrams_(std::move(datagrams)) {}

        dp::Res<dp::Pair<takpipe::Message, takpipe::SocketAddress>> recv() override {
            if (next_ >= datagrams_.size()) {
                return dp::result::err(dp::Error::not_found(takpipe::TRANSPORT_CLOSED));
            }
            takpipe::SocketAddress from = takpipe::UdpEndpoint{"192.0.2.9", 6969};
            return dp::result::ok(dp::Pair<takpipe::Message, takpipe::SocketAddress>(datagrams_[next_++], from));
        }

        void close() override {}
    };

    // Body is the XML reversed; XML containing "bad" cannot be encoded
    class ReverseCodec : public takpipe::WireCodec {
      public:
        dp::Res<takpipe::Message> encode(const takpipe::Message &xml) const override {
            if (std::string(takpipe::to_string(xml).c_str()).find("bad") != std::string::npos) {
                return dp::result::err(dp::Error::invalid_argument("unknown event type"));
            }
            return dp::result::ok(takpipe::Message(xml.rbegin(), xml.rend()));
        }

        dp::Res<takpipe::Message> decode(const takpipe::Message &body) const override {
            return dp::result::ok(takpipe::Message(body.rbegin(), body.rend()));
        }
    };

    std::string text(const takpipe::Message &msg) { return takpipe::to_string(msg).c_str(); }

} // namespace

TEST_CASE("QueueWorker admission") {
    auto queue = std::make_shared<takpipe::Queue>(3);
    Producer producer(queue, takpipe::Config("app", {}), takpipe::Context());

    for (int i = 1; i <= 4; ++i) {
        producer.put_queue(takpipe::to_message(("<event n=\"" + std::to_string(i) + "\"/>").c_str()));
    }

    CHECK(queue->size() == 3);
    CHECK(producer.metrics().evicted == 1);
    CHECK(text(queue->pop().value()) == "<event n=\"2\"/>");
    CHECK(text(queue->pop().value()) == "<event n=\"3\"/>");
    CHECK(text(queue->pop().value()) == "<event n=\"4\"/>");

    SUBCASE("Publishing onto another queue") {
        takpipe::Queue other(1);
        producer.put_queue(takpipe::to_message("<a/>"), other);
        producer.put_queue(takpipe::to_message("<b/>"), other);
        CHECK(other.size() == 1);
        CHECK(text(other.pop().value()) == "<b/>");
    }
}

TEST_CASE("TXWorker send_data") {
    auto queue = std::make_shared<takpipe::Queue>(10);
    auto sink = std::make_shared<CapturingDatagramSink>();

    SUBCASE("Empty payload is dropped") {
        takpipe::TXWorker worker(queue, takpipe::Config("tx", {}), takpipe::Writer::datagram(sink), takpipe::Context());
        CHECK(worker.send_data(takpipe::Message()).is_ok());
        CHECK(sink->sent.empty());
        CHECK(worker.metrics().tx_empty_dropped == 1);
        CHECK(worker.metrics().tx_messages == 0);
    }

    SUBCASE("XML passes through") {
        takpipe::TXWorker worker(queue, takpipe::Config("tx", {}), takpipe::Writer::datagram(sink), takpipe::Context());
        CHECK_FALSE(worker.use_binary());
        REQUIRE(worker.send_data(takpipe::to_message("<event/>")).is_ok());
        REQUIRE(sink->sent.size() == 1);
        CHECK(text(sink->sent[0]) == "<event/>");
        CHECK(worker.metrics().tx_messages == 1);
        CHECK(worker.metrics().tx_bytes == 8);
    }

    SUBCASE("Binary framing follows the destination") {
        ReverseCodec codec;
        takpipe::Config mesh("tx", {{"COT_URL", "udp://239.2.3.1:6969"}, {"TAK_PROTO", "1"}});
        takpipe::TXWorker worker(queue, mesh, takpipe::Writer::datagram(sink), takpipe::Context(), &codec);
        CHECK(worker.use_binary());
        CHECK(worker.framing() == takpipe::Framing::Mesh);

        REQUIRE(worker.send_data(takpipe::to_message("<ok/>")).is_ok());
        REQUIRE(sink->sent.size() == 1);
        const auto &wire = sink->sent[0];
        REQUIRE(wire.size() == 8);
        CHECK(wire[0] == 0xBF);
        CHECK(wire[1] == 0x01);
        CHECK(wire[2] == 0xBF);
        CHECK(wire[3] == '>');
    }

    SUBCASE("Unencodable payload is sent unmodified") {
        ReverseCodec codec;
        takpipe::Config stream("tx", {{"COT_URL", "udp://192.0.2.1:6969"}, {"TAK_PROTO", "1"}});
        takpipe::TXWorker worker(queue, stream, takpipe::Writer::datagram(sink), takpipe::Context(), &codec);
        CHECK(worker.framing() == takpipe::Framing::Stream);

        REQUIRE(worker.send_data(takpipe::to_message("<bad/>")).is_ok());
        REQUIRE(sink->sent.size() == 1);
        CHECK(text(sink->sent[0]) == "<bad/>");
        CHECK(worker.metrics().encode_fallbacks == 1);
    }

    SUBCASE("Stream writer is drained and flushed per payload") {
        auto stream_sink = std::make_shared<CapturingStreamSink>();
        takpipe::TXWorker worker(queue, takpipe::Config("tx", {}), takpipe::Writer::stream(stream_sink),
                                 takpipe::Context());
        REQUIRE(worker.send_data(takpipe::to_message("<a/>")).is_ok());
        REQUIRE(worker.send_data(takpipe::to_message("<b/>")).is_ok());
        CHECK(stream_sink->written == "<a/><b/>");
        CHECK(stream_sink->pending.empty());
        CHECK(stream_sink->flushes == 2);
    }

    SUBCASE("Writer failure is returned") {
        sink->fail = true;
        takpipe::TXWorker worker(queue, takpipe::Config("tx", {}), takpipe::Writer::datagram(sink), takpipe::Context());
        CHECK(worker.send_data(takpipe::to_message("<event/>")).is_err());
        CHECK(worker.metrics().tx_messages == 0);
    }
}

TEST_CASE("TXWorker run loop") {
    auto queue = std::make_shared<takpipe::Queue>(10);
    auto sink = std::make_shared<CapturingDatagramSink>();
    auto worker = std::make_shared<takpipe::TXWorker>(queue, takpipe::Config("tx", {}),
                                                      takpipe::Writer::datagram(sink), takpipe::Context());

    SUBCASE("Sends in order until stopped") {
        queue->push_evicting(takpipe::to_message("<one/>"));
        queue->push_evicting(takpipe::to_message("<two/>"));

        dp::Res<void> result = dp::result::err(dp::Error::io_error("not run"));
        std::thread runner([&]() { result = worker->run(); });

        for (int i = 0; i < 100 && queue->size() > 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        worker->stop();
        runner.join();

        CHECK(result.is_ok());
        REQUIRE(sink->sent.size() == 2);
        CHECK(text(sink->sent[0]) == "<one/>");
        CHECK(text(sink->sent[1]) == "<two/>");
        CHECK(sink->closed);
    }

    SUBCASE("Transport failure ends the worker") {
        sink->fail = true;
        queue->push_evicting(takpipe::to_message("<event/>"));
        auto result = worker->run();
        CHECK(result.is_err());
    }

    SUBCASE("Stop is idempotent") {
        worker->stop();
        worker->stop();
        CHECK(worker->stopping());
        CHECK(worker->run().is_ok());
    }
}

TEST_CASE("Compatibility delay") {
    auto queue = std::make_shared<takpipe::Queue>(10);
    auto sink = std::make_shared<CapturingDatagramSink>();
    auto worker = std::make_shared<takpipe::TXWorker>(queue, takpipe::Config("tx", {{"TAKPIPE_SLEEP", "30"}}),
                                                      takpipe::Writer::datagram(sink), takpipe::Context());
    queue->push_evicting(takpipe::to_message("<event/>"));

    auto start = std::chrono::steady_clock::now();
    std::thread runner([&]() { CHECK(worker->run().is_ok()); });
    for (int i = 0; i < 100 && sink->sent.empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    // Stop interrupts the 30 s sleep
    worker->stop();
    runner.join();

    CHECK(sink->sent.size() == 1);
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("RXWorker") {
    auto queue = std::make_shared<takpipe::Queue>(10);

    SUBCASE("Stream reader frames events until the stream ends") {
        auto source = std::make_shared<ScriptedSource>(
            std::vector<std::string>{"<event>A</event><ev", "ent>B</event>", "<event>C"});
        takpipe::RXWorker worker(queue, takpipe::Config("rx", {}),
                                 takpipe::Reader::stream(std::make_shared<takpipe::StreamReader>(source)),
                                 takpipe::Context());

        auto result = worker.run();
        CHECK(result.is_err());

        REQUIRE(queue->size() == 2);
        CHECK(text(queue->pop().value()) == "<event>A</event>");
        CHECK(text(queue->pop().value()) == "<event>B</event>");
        CHECK(worker.metrics().rx_messages == 2);
        CHECK(worker.metrics().rx_incomplete == 1);
    }

    SUBCASE("Datagram reader yields one event per datagram") {
        ReverseCodec codec;
        takpipe::Message binary = takpipe::frame(takpipe::to_message(">/tnevetib<"), takpipe::Framing::Mesh);
        auto source = std::make_shared<ScriptedDatagrams>(
            std::vector<takpipe::Message>{takpipe::to_message("<event>xml</event>"), binary});

        takpipe::Config config("rx", {{"COT_URL", "udp://239.2.3.1:6969"}, {"TAK_PROTO", "1"}});
        takpipe::RXWorker worker(queue, config, takpipe::Reader::datagram(source), takpipe::Context(), &codec);

        auto result = worker.run();
        REQUIRE(result.is_err());
        CHECK(result.error().message == takpipe::TRANSPORT_CLOSED);

        REQUIRE(queue->size() == 2);
        // XML on a binary endpoint is passed through, binary frames are decoded
        CHECK(text(queue->pop().value()) == "<event>xml</event>");
        CHECK(text(queue->pop().value()) == "<bitevent/>");
    }

    SUBCASE("Full RX queue drops the oldest event") {
        auto small = std::make_shared<takpipe::Queue>(1);
        auto source = std::make_shared<ScriptedDatagrams>(
            std::vector<takpipe::Message>{takpipe::to_message("<old/>"), takpipe::to_message("<new/>")});
        takpipe::RXWorker worker(small, takpipe::Config("rx", {}), takpipe::Reader::datagram(source),
                                 takpipe::Context());
        CHECK(worker.run().is_err());
        CHECK(worker.metrics().evicted == 1);
        CHECK(text(small->pop().value()) == "<new/>");
    }

    SUBCASE("No reader idles until stopped") {
        auto worker = std::make_shared<takpipe::RXWorker>(queue, takpipe::Config("rx", {}), takpipe::Reader(),
                                                          takpipe::Context());
        dp::Res<void> result = dp::result::err(dp::Error::io_error("not run"));
        std::thread runner([&]() { result = worker->run(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        worker->stop();
        runner.join();
        CHECK(result.is_ok());
        CHECK(queue->empty());
    }
}

TEST_CASE("Worker factories") {
    auto queue = std::make_shared<takpipe::Queue>(10);
    takpipe::Context ctx("factory", false);

    SUBCASE("Binary framing without a codec") {
        takpipe::Config config("binary", {{"COT_URL", "udp+wo://127.0.0.1:16973"}, {"TAK_PROTO", "1"}});
        auto tx = takpipe::txworker_factory(queue, config, ctx);
        REQUIRE(tx.is_err());
        CHECK(tx.error().code == dp::Error::invalid_argument("").code);
        CHECK(takpipe::rxworker_factory(queue, config, ctx).is_err());
    }

    SUBCASE("Write-only destination") {
        takpipe::Config config("wo", {{"COT_URL", "udp+wo://127.0.0.1:16974"}});
        auto tx = takpipe::txworker_factory(queue, config, ctx);
        REQUIRE(tx.is_ok());
        CHECK(std::string(tx.value()->name()) == "TXWorker");
        CHECK(tx.value()->context().tag == "factory/wo");
        tx.value()->stop();

        auto rx = takpipe::rxworker_factory(queue, config, ctx);
        REQUIRE(rx.is_ok());
        rx.value()->stop();
        CHECK(rx.value()->run().is_ok());
    }

    SUBCASE("Unknown scheme") {
        takpipe::Config config("bad", {{"COT_URL", "gopher://127.0.0.1"}});
        CHECK(takpipe::txworker_factory(queue, config, ctx).is_err());
    }
}
