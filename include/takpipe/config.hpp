#pragma once

#include <takpipe/common.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <string>
#include <utility>

namespace takpipe {

    /// Configuration keys understood by the transport layer
    namespace keys {
        inline constexpr const char *COT_URL = "COT_URL";
        inline constexpr const char *COT_HOST_ID = "COT_HOST_ID";
        inline constexpr const char *MAX_IN_QUEUE = "MAX_IN_QUEUE";
        inline constexpr const char *MAX_OUT_QUEUE = "MAX_OUT_QUEUE";
        inline constexpr const char *TAK_PROTO = "TAK_PROTO";
        inline constexpr const char *DEBUG = "DEBUG";
        inline constexpr const char *FTS_COMPAT = "FTS_COMPAT";
        inline constexpr const char *SLEEP = "TAKPIPE_SLEEP";
        inline constexpr const char *NO_HELLO = "TAKPIPE_NO_HELLO";
        inline constexpr const char *MULTICAST_LOCAL_ADDR = "TAKPIPE_MULTICAST_LOCAL_ADDR";
        inline constexpr const char *MULTICAST_TTL = "TAKPIPE_MULTICAST_TTL";

        inline constexpr const char *TLS_CLIENT_CERT = "TAKPIPE_TLS_CLIENT_CERT";
        inline constexpr const char *TLS_CLIENT_KEY = "TAKPIPE_TLS_CLIENT_KEY";
        inline constexpr const char *TLS_CLIENT_CAFILE = "TAKPIPE_TLS_CLIENT_CAFILE";
        inline constexpr const char *TLS_CLIENT_CIPHERS = "TAKPIPE_TLS_CLIENT_CIPHERS";
        inline constexpr const char *TLS_CLIENT_PASSWORD = "TAKPIPE_TLS_CLIENT_PASSWORD";
        inline constexpr const char *TLS_DONT_CHECK_HOSTNAME = "TAKPIPE_TLS_DONT_CHECK_HOSTNAME";
        inline constexpr const char *TLS_DONT_VERIFY = "TAKPIPE_TLS_DONT_VERIFY";
        inline constexpr const char *TLS_SERVER_EXPECTED_HOSTNAME = "TAKPIPE_TLS_SERVER_EXPECTED_HOSTNAME";
        inline constexpr const char *TLS_ENROLLMENT_USERNAME = "TAKPIPE_TLS_CERT_ENROLLMENT_USERNAME";
        inline constexpr const char *TLS_ENROLLMENT_PASSWORD = "TAKPIPE_TLS_CERT_ENROLLMENT_PASSWORD";
        inline constexpr const char *TLS_ENROLLMENT_PASSPHRASE = "TAKPIPE_TLS_CERT_ENROLLMENT_PASSPHRASE";
        inline constexpr const char *TLS_ENROLLMENT_URL = "TAKPIPE_TLS_CERT_ENROLLMENT_URL";
    } // namespace keys

    /// Immutable string-keyed configuration for one transport endpoint
    /// Built once, shared read-only by the factory and both workers
    class Config {
      private:
        dp::String name_;
        std::map<std::string, std::string> values_;

        static bool truthy(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value == "true" || value == "yes" || value == "y" || value == "on" || value == "1";
        }

      public:
        Config() : name_("takpipe") {}

        Config(dp::String name, std::map<std::string, std::string> values)
            : name_(std::move(name)), values_(std::move(values)) {}

        Config(dp::String name, std::initializer_list<std::pair<const std::string, std::string>> values)
            : name_(std::move(name)), values_(values) {}

        /// Read the given keys from the process environment
        /// Unset variables are left out so that defaults apply
        static Config from_environment(const dp::String &name, std::initializer_list<const char *> env_keys) {
            std::map<std::string, std::string> values;
            for (const char *key : env_keys) {
                const char *value = std::getenv(key);
                if (value != nullptr) {
                    values[key] = value;
                }
            }
            echo::trace("config '", name.c_str(), "' loaded ", values.size(), " values from environment");
            return Config(name, std::move(values));
        }

        const dp::String &name() const { return name_; }

        bool has(const char *key) const {
            auto it = values_.find(key);
            return it != values_.end() && !it->second.empty();
        }

        dp::String get(const char *key, const char *fallback = "") const {
            auto it = values_.find(key);
            if (it == values_.end() || it->second.empty()) {
                return dp::String(fallback);
            }
            return dp::String(it->second.c_str());
        }

        dp::i64 get_int(const char *key, dp::i64 fallback) const {
            auto it = values_.find(key);
            if (it == values_.end() || it->second.empty()) {
                return fallback;
            }
            char *end = nullptr;
            long long value = std::strtoll(it->second.c_str(), &end, 10);
            if (end == it->second.c_str() || *end != '\0') {
                echo::warn("config ", key, "='", it->second.c_str(), "' is not an integer, using ", fallback);
                return fallback;
            }
            return static_cast<dp::i64>(value);
        }

        bool get_bool(const char *key) const {
            auto it = values_.find(key);
            return it != values_.end() && truthy(it->second);
        }

        /// Copy with one value replaced - the original stays untouched
        Config with(const char *key, const dp::String &value) const {
            auto values = values_;
            values[key] = value.c_str();
            return Config(name_, std::move(values));
        }

        dp::usize size() const { return values_.size(); }
    };

    /// Logging context passed by reference into the orchestrator and workers
    /// Replaces a process-wide logger: the tag names the endpoint, debug enables payload logging
    struct Context {
        dp::String tag;
        bool debug = false;

        Context() : tag("takpipe") {}
        Context(dp::String tag_, bool debug_) : tag(std::move(tag_)), debug(debug_) {}

        /// Seed from the DEBUG environment variable, once per process
        static Context from_environment(const dp::String &tag) {
            const char *debug = std::getenv(keys::DEBUG);
            return Context(tag, debug != nullptr && debug[0] != '\0' && debug[0] != '0');
        }

        /// Derive the context for one named endpoint
        Context for_endpoint(const Config &config) const {
            return Context(tag + "/" + config.name(), debug || config.get_bool(keys::DEBUG));
        }
    };

} // namespace takpipe
