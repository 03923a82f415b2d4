#pragma once

#include <takpipe/config.hpp>
#include <takpipe/endpoint.hpp>

namespace takpipe {

    // TAK protocol binary framing
    // Mesh   (multicast):      0xBF <version varint = 1> 0xBF <TakMessage>
    // Stream (point-to-point): 0xBF <length varint> <TakMessage>
    enum class Framing { Mesh, Stream };

    inline constexpr dp::u8 TAK_MAGIC = 0xBF;
    inline constexpr dp::u8 TAK_PROTO_VERSION = 0x01;

    inline const char *framing_name(Framing framing) { return framing == Framing::Mesh ? "mesh" : "stream"; }

    /// Mesh for multicast destinations, Stream for everything else (DNS names included)
    inline Framing select_framing(const dp::String &host) {
        return is_multicast_host(host) ? Framing::Mesh : Framing::Stream;
    }

    /// Converts between CoT XML and the TakMessage body of the binary protocol
    /// The XML schema and protobuf mapping live outside this library
    class WireCodec {
      public:
        virtual ~WireCodec() = default;

        // XML event -> TakMessage bytes (no TAK header)
        virtual dp::Res<Message> encode(const Message &xml) const = 0;

        // TakMessage bytes -> XML event
        virtual dp::Res<Message> decode(const Message &body) const = 0;
    };

    inline void append_varint(Message &buffer, dp::u64 value) {
        while (value >= 0x80) {
            buffer.push_back(static_cast<dp::u8>((value & 0x7F) | 0x80));
            value >>= 7;
        }
        buffer.push_back(static_cast<dp::u8>(value));
    }

    // Returns the decoded value and advances pos; fails on truncated or oversized input
    inline dp::Res<dp::u64> read_varint(const Message &buffer, dp::usize &pos) {
        dp::u64 value = 0;
        for (dp::u32 shift = 0; shift < 64; shift += 7) {
            if (pos >= buffer.size()) {
                return dp::result::err(dp::Error::invalid_argument("truncated varint"));
            }
            dp::u8 byte = buffer[pos++];
            value |= static_cast<dp::u64>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) {
                return dp::result::ok(value);
            }
        }
        return dp::result::err(dp::Error::invalid_argument("varint too long"));
    }

    /// Prefix a TakMessage body with the header for the given framing
    inline Message frame(const Message &body, Framing framing) {
        Message out;
        out.reserve(body.size() + 10);
        out.push_back(TAK_MAGIC);
        if (framing == Framing::Mesh) {
            append_varint(out, TAK_PROTO_VERSION);
            out.push_back(TAK_MAGIC);
        } else {
            append_varint(out, body.size());
        }
        out.insert(out.end(), body.begin(), body.end());
        return out;
    }

    /// Strip a Mesh or Stream header, returning the TakMessage body
    inline dp::Res<Message> unframe(const Message &wire) {
        if (wire.size() < 2 || wire[0] != TAK_MAGIC) {
            return dp::result::err(dp::Error::invalid_argument("not a TAK protocol frame"));
        }

        // Mesh: version byte followed by a second magic byte
        if (wire.size() >= 3 && wire[1] == TAK_PROTO_VERSION && wire[2] == TAK_MAGIC) {
            return dp::result::ok(Message(wire.begin() + 3, wire.end()));
        }

        dp::usize pos = 1;
        auto len_res = read_varint(wire, pos);
        if (len_res.is_err()) {
            return dp::result::err(len_res.error());
        }
        if (len_res.value() != wire.size() - pos) {
            echo::trace("stream frame length mismatch: header=", len_res.value(), " actual=", wire.size() - pos);
            return dp::result::err(dp::Error::invalid_argument("stream frame length mismatch"));
        }
        return dp::result::ok(Message(wire.begin() + static_cast<std::ptrdiff_t>(pos), wire.end()));
    }

    /// XML -> framed binary
    inline dp::Res<Message> xml_to_wire(const WireCodec &codec, const Message &xml, Framing framing) {
        auto body = codec.encode(xml);
        if (body.is_err()) {
            return dp::result::err(body.error());
        }
        return dp::result::ok(frame(body.value(), framing));
    }

    /// Framed binary -> XML
    inline dp::Res<Message> wire_to_xml(const WireCodec &codec, const Message &wire) {
        auto body = unframe(wire);
        if (body.is_err()) {
            return dp::result::err(body.error());
        }
        return codec.decode(body.value());
    }

    /// True if the config asks for binary framing (TAK_PROTO > 0)
    inline bool wants_binary(const Config &config) { return config.get_int(keys::TAK_PROTO, 0) > 0; }

    /// Fail fast when binary framing is requested but no codec was supplied
    inline dp::Res<void> check_codec(const Config &config, const WireCodec *codec) {
        if (wants_binary(config) && codec == nullptr) {
            echo::error("TAK_PROTO=", config.get(keys::TAK_PROTO).c_str(), " but no wire codec is available");
            return dp::result::err(dp::Error::invalid_argument(
                "TAK_PROTO requests binary framing but no wire codec is available; set TAK_PROTO=0 for XML"));
        }
        return dp::result::ok();
    }

} // namespace takpipe
