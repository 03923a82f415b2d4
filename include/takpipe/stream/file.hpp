#pragma once

#include <takpipe/stream.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <mutex>
#include <system_error>

namespace takpipe {

    // Write-only sink over a file descriptor: a local file or the process stdout/stderr
    class FdSink : public StreamSink {
      private:
        dp::i32 fd_;
        bool owned_;
        bool sync_on_flush_;
        dp::String name_;
        std::mutex mutex_;
        Message pending_;

        FdSink(dp::i32 fd, bool owned, bool sync_on_flush, dp::String name)
            : fd_(fd), owned_(owned), sync_on_flush_(sync_on_flush), name_(std::move(name)) {}

      public:
        ~FdSink() override { close(); }

        FdSink(const FdSink &) = delete;
        FdSink &operator=(const FdSink &) = delete;

        /// Sink onto the process stdout, or stderr when use_stderr is set
        static std::shared_ptr<FdSink> standard(bool use_stderr) {
            echo::debug("log sink on ", use_stderr ? "stderr" : "stdout");
            return std::shared_ptr<FdSink>(
                new FdSink(use_stderr ? STDERR_FILENO : STDOUT_FILENO, false, false, use_stderr ? "stderr" : "stdout"));
        }

        /// Sink onto a local file, truncated on open; missing parent directories are created
        static dp::Res<std::shared_ptr<FdSink>> open_file(const dp::String &path) {
            if (path.empty()) {
                return dp::result::err(dp::Error::invalid_argument("file sink needs a path"));
            }

            std::filesystem::path file_path(path.c_str());
            if (file_path.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(file_path.parent_path(), ec);
                if (ec) {
                    echo::error("cannot create ", file_path.parent_path().c_str(), ": ", ec.message().c_str());
                    return dp::result::err(dp::Error::io_error(dp::String("cannot create directory: ") +
                                                               file_path.parent_path().c_str()));
                }
            }

            dp::i32 fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                echo::error("open ", path.c_str(), " failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error(dp::String("cannot open file: ") + path.c_str()));
            }

            echo::info("file sink writing to ", path.c_str());
            return dp::result::ok(std::shared_ptr<FdSink>(new FdSink(fd, true, true, path)));
        }

        dp::Res<void> write(const Message &msg) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fd_ < 0) {
                return dp::result::err(dp::Error::not_found("sink closed"));
            }
            pending_.insert(pending_.end(), msg.begin(), msg.end());
            return dp::result::ok();
        }

        dp::Res<void> drain() override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                return dp::result::ok();
            }
            if (fd_ < 0) {
                return dp::result::err(dp::Error::not_found("sink closed"));
            }
            auto res = write_exact(fd_, pending_.data(), pending_.size());
            if (res.is_err()) {
                echo::error("write to ", name_.c_str(), " failed: ", res.error().message.c_str());
                return res;
            }
            pending_.clear();
            return dp::result::ok();
        }

        dp::Res<void> flush() override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fd_ >= 0 && sync_on_flush_ && ::fdatasync(fd_) < 0) {
                echo::warn("fdatasync ", name_.c_str(), " failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("flush failed"));
            }
            return dp::result::ok();
        }

        void close() override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (fd_ >= 0) {
                if (owned_) {
                    ::close(fd_);
                    echo::debug("closed ", name_.c_str());
                }
                fd_ = -1;
            }
        }

        const dp::String &name() const { return name_; }
    };

} // namespace takpipe
