#pragma once

// Takpipe - Cursor-on-Target client transport
// Moves CoT events between bounded application queues and a TAK server over
// TCP, TLS, UDP (unicast, broadcast, multicast, write-only), log or file destinations.

// Core types and utilities
#include <takpipe/channel.hpp>
#include <takpipe/common.hpp>
#include <takpipe/config.hpp>
#include <takpipe/endpoint.hpp>
#include <takpipe/metrics.hpp>

// Wire format
#include <takpipe/codec.hpp>

// Base classes
#include <takpipe/datagram.hpp>
#include <takpipe/stream.hpp>

// Stream implementations
#include <takpipe/stream/file.hpp>
#include <takpipe/stream/tcp.hpp>
#include <takpipe/stream/tls.hpp>

// Datagram implementations
#include <takpipe/datagram/udp.hpp>

// TLS material
#include <takpipe/crypto.hpp>
#include <takpipe/enrollment.hpp>

// Pipeline
#include <takpipe/orchestrator.hpp>
#include <takpipe/transport.hpp>
#include <takpipe/worker.hpp>

// All types are in the takpipe:: namespace
// Available types:
//   - takpipe::Message (dp::Vector<dp::u8>), takpipe::Queue (bounded Channel<Message>)
//   - takpipe::Config, takpipe::Context
//   - takpipe::DatagramStream, DatagramClient, DatagramServer (datagram::bind/connect/from_socket)
//   - takpipe::TcpConnection, TlsConnection, FdSink, StreamReader
//   - takpipe::TransportEndpoint (protocol_factory)
//   - takpipe::TXWorker, RXWorker, QueueWorker
//   - takpipe::Orchestrator
