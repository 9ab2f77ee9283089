// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors

#include "logset/file_set.hpp"
#include "logset/config.hpp"
#include "logset/formatter.hpp"
#include "logset/platform.hpp"
#include "mailbox.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <format>
#include <future>
#include <mutex>
#include <thread>
#include <utility>

namespace logset {

namespace {

constexpr std::string_view kLogExtension = ".log";

struct WriteRequest {
    std::string data;
    std::promise<std::size_t> reply;
};

struct SetConfigRequest {
    int max_files = 0;
    std::int64_t max_file_bytes = 0;
    std::promise<void> reply;
};

struct CloseRequest {
    std::promise<void> reply;
};

[[noreturn]] void io_failure(std::string_view op, const std::filesystem::path& path, int err) {
    fatal(FatalError(FatalKind::Filesystem,
        std::format("{} {}: {}", op, path.string(), std::strerror(err))));
}

[[noreturn]] void io_failure(std::string_view op, const std::filesystem::path& path,
                             const std::error_code& ec) {
    fatal(FatalError(FatalKind::Filesystem,
        std::format("{} {}: {}", op, path.string(), ec.message())));
}

} // anonymous namespace

// ============================================================================
// FileSet::Impl - Everything below run() executes on the actor thread
// ============================================================================

struct FileSet::Impl {
    const std::filesystem::path log_dir;
    const std::string name_prefix;

    // Actor state
    std::int64_t max_file_bytes;
    int max_files;
    std::FILE* file = nullptr;
    std::int64_t current_bytes = 0;
    bool closed = false;
    std::size_t next_channel = 0;

    // Published for current_path()
    mutable std::mutex path_mutex;
    std::filesystem::path current_path;

    // Mailbox
    detail::Wakeup wakeup;
    detail::Channel<WriteRequest> writes{wakeup, kLogQueueCapacity};
    detail::Channel<SetConfigRequest> configs{wakeup};
    detail::Channel<CloseRequest> closes{wakeup};

    // Caller side
    std::atomic<bool> accepting{true};
    std::atomic<int> senders{0};   // Callers between the accepting check and send()
    std::mutex close_mutex;
    std::thread thread;

    Impl(std::filesystem::path dir, std::string prefix, std::int64_t max_bytes, int max_count)
        : log_dir(std::move(dir)), name_prefix(std::move(prefix)),
          max_file_bytes(max_bytes), max_files(max_count) {}

    // ========== Caller side ==========

    // Sends unless closed; the sender count lets the actor tell when no
    // more requests can arrive after close.
    template<typename Request>
    bool post(detail::Channel<Request>& channel, Request&& request) {
        senders.fetch_add(1);
        detail::SenderGuard guard{senders};
        if (!accepting.load()) {
            return false;
        }
        channel.send(std::move(request));
        return true;
    }

    // ========== Actor loop ==========

    void run() {
        try {
            rotate();
            while (!closed) {
                wakeup.wait();
                while (!closed && serve_round()) {}
            }
        } catch (const FatalError& e) {
            fatal(e);
        } catch (const std::exception& e) {
            fatal(FatalError(FatalKind::Filesystem, e.what()));
        }
    }

    // One message from each ready channel, starting with a different channel
    // every round; returns whether anything was served.
    bool serve_round() {
        constexpr std::size_t kChannels = 3;
        bool served = false;
        for (std::size_t i = 0; i < kChannels && !closed; ++i) {
            switch ((next_channel + i) % kChannels) {
                case 0: served |= serve_write(); break;
                case 1: served |= serve_set_config(); break;
                case 2: served |= serve_close(); break;
            }
        }
        next_channel = (next_channel + 1) % kChannels;
        return served;
    }

    bool serve_write() {
        WriteRequest request;
        if (!writes.try_receive(request)) return false;
        request.reply.set_value(append(request.data));
        return true;
    }

    bool serve_set_config() {
        SetConfigRequest request;
        if (!configs.try_receive(request)) return false;
        max_files = request.max_files;
        max_file_bytes = request.max_file_bytes;
        if (current_bytes > max_file_bytes) {
            rotate();
        }
        request.reply.set_value();
        return true;
    }

    bool serve_close() {
        CloseRequest request;
        if (!closes.try_receive(request)) return false;

        // Writes already posted are written, not discarded
        for (;;) {
            bool quiet = senders.load() == 0;
            WriteRequest pending;
            while (writes.try_receive(pending)) {
                pending.reply.set_value(append(pending.data));
            }
            if (quiet) break;
            std::this_thread::yield();
        }

        SetConfigRequest late;
        while (configs.try_receive(late)) {
            late.reply.set_value();
        }

        auto path = published_path();
        close_file();
        if (current_bytes < 1 && !path.empty()) {
            remove_file(path);
        }
        closed = true;
        request.reply.set_value();
        return true;
    }

    // ========== File operations ==========

    std::size_t append(std::string_view data) {
        if (data.empty()) return 0;

        if (std::fwrite(data.data(), 1, data.size(), file) != data.size()) {
            io_failure("write", published_path(), errno);
        }
        if (std::fflush(file) != 0) {
            io_failure("flush", published_path(), errno);
        }
        current_bytes += static_cast<std::int64_t>(data.size());
        if (current_bytes >= max_file_bytes) {
            rotate();
        }
        return data.size();
    }

    void rotate() {
        close_file();

        auto files = FileSet::list_log_files(log_dir, name_prefix);
        auto excess = static_cast<std::ptrdiff_t>(files.size()) - max_files + 1;
        for (std::ptrdiff_t i = 0; i < excess; ++i) {
            remove_file(files[static_cast<std::size_t>(i)]);
        }

        open_new_file();
        current_bytes = 0;
    }

    void open_new_file() {
        auto ts = get_timestamp();
        auto path = log_dir / std::format("{}_{}{}", name_prefix, format_timestamp(ts), kLogExtension);

        file = std::fopen(path.string().c_str(), "wb");
        if (!file) {
            io_failure("open", path, errno);
        }
        {
            std::lock_guard lock(path_mutex);
            current_path = path;
        }

        auto header = format_file_header(max_file_bytes, max_files, ts);
        if (std::fwrite(header.data(), 1, header.size(), file) != header.size() ||
            std::fflush(file) != 0) {
            io_failure("write header to", path, errno);
        }
    }

    void close_file() {
        if (!file) return;
        auto* f = std::exchange(file, nullptr);
        if (std::fclose(f) != 0) {
            io_failure("close", published_path(), errno);
        }
    }

    void remove_file(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            io_failure("remove", path, ec);
        }
    }

    std::filesystem::path published_path() const {
        std::lock_guard lock(path_mutex);
        return current_path;
    }
};

// ============================================================================
// FileSet Public API
// ============================================================================

FileSet::FileSet(std::filesystem::path log_dir,
                 std::string name_prefix,
                 std::int64_t max_file_bytes,
                 int max_files)
    : impl_(std::make_unique<Impl>(std::move(log_dir), std::move(name_prefix),
                                   max_file_bytes, max_files)) {
    std::error_code ec;
    std::filesystem::create_directories(impl_->log_dir, ec);
    if (ec) {
        io_failure("create directory", impl_->log_dir, ec);
    }

    impl_->thread = std::thread([impl = impl_.get()]() {
        impl->run();
    });
}

FileSet::~FileSet() {
    close();
}

std::size_t FileSet::write(std::string_view data) {
    WriteRequest request{std::string(data), {}};
    auto reply = request.reply.get_future();
    if (!impl_->post(impl_->writes, std::move(request))) {
        return 0;
    }
    return detail::await_reply(reply, kFileSetReplyTimeout, "file set write");
}

void FileSet::set_config(int max_files, std::int64_t max_file_bytes) {
    SetConfigRequest request{max_files, max_file_bytes, {}};
    auto reply = request.reply.get_future();
    if (!impl_->post(impl_->configs, std::move(request))) {
        return;
    }
    detail::await_reply(reply, kFileSetReplyTimeout, "file set configuration");
}

void FileSet::close() {
    std::lock_guard lock(impl_->close_mutex);
    if (!impl_->accepting.exchange(false)) {
        return;
    }

    CloseRequest request;
    auto reply = request.reply.get_future();
    impl_->closes.send(std::move(request));
    detail::await_reply(reply, kFileSetReplyTimeout, "file set close");

    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
}

bool FileSet::is_open() const noexcept {
    return impl_->accepting.load();
}

std::filesystem::path FileSet::current_path() const {
    return impl_->published_path();
}

std::vector<std::filesystem::path>
FileSet::list_log_files(const std::filesystem::path& log_dir, std::string_view name_prefix) {
    std::vector<std::filesystem::path> result;
    const auto prefix = std::string(name_prefix) + "_";

    // A directory that cannot be read, in whole or from some point on, lists
    // what was read before the error
    std::error_code ec;
    for (std::filesystem::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;

        auto filename = it->path().filename().string();
        if (filename.starts_with(prefix) && filename.ends_with(kLogExtension)) {
            result.push_back(it->path());
        }
    }

    // Names embed a fixed-width timestamp, so name order is age order
    std::ranges::sort(result, [](const auto& a, const auto& b) {
        return a.filename().string() < b.filename().string();
    });
    return result;
}

} // namespace logset
