// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logset Contributors
//
// Logger - Actor serializing all logging of one process
//
// Architecture:
//   Logger (this file)     - Caller API, queueing, filtering, configuration
//       |
//       v writes formatted lines through
//   FileSet                - Rotating files on disk, own actor thread

#include "logset/logger.hpp"
#include "logset/file_set.hpp"
#include "logset/formatter.hpp"
#include "logset/platform.hpp"
#include "console.hpp"
#include "mailbox.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <future>
#include <functional>
#include <mutex>
#include <stacktrace>
#include <thread>
#include <vector>

namespace logset {

namespace {

struct LogEntry {
    Priority priority = Priority::Info;
    const char* file = "";   // source_location storage, static
    std::uint_least32_t line = 0;
    std::string message;
    std::uint64_t sequence = 0;   // Logger-wide send order
};

struct ExitRequest {
    int code = 0;
    const char* file = "";
    std::uint_least32_t line = 0;
    std::string message;
    std::promise<void> done;
};

struct PanicRequest {
    const char* file = "";
    std::uint_least32_t line = 0;
    std::string message;
    std::string stack_trace;
    std::promise<void> done;
};

struct SetConfigRequest {
    int max_files = 0;
    std::int64_t max_file_bytes = 0;
    Priority threshold = Priority::Info;
    std::promise<void> done;
};

struct SuppressRequest {
    std::set<std::string> stems;
    std::promise<void> done;
};

struct GetConfigRequest {
    std::promise<Config> reply;
};

struct CloseRequest {
    std::promise<void> done;
};

// Only the first terminating caller of the process runs std::exit
std::atomic<bool> g_exiting{false};

[[noreturn]] void block_forever() {
    std::mutex mutex;
    std::condition_variable cv;
    std::unique_lock lock(mutex);
    for (;;) {
        cv.wait(lock);
    }
}

[[noreturn]] void terminate_process(int code) {
    if (!g_exiting.exchange(true)) {
        std::exit(code);
    }
    block_forever();
}

} // anonymous namespace

// ============================================================================
// Logger::Impl - Everything below run() executes on the actor thread
// ============================================================================

struct Logger::Impl {
    std::shared_ptr<ConfigSource> source;
    const std::chrono::milliseconds reload_interval;

    // Actor state
    Config config;
    std::unique_ptr<FileSet> file_set;
    std::chrono::steady_clock::time_point next_reload;
    std::size_t next_channel = 0;

    // Entries received ahead of a lower sequence number still in flight,
    // kept as a min-heap on sequence
    std::vector<LogEntry> reorder;
    std::uint64_t next_expected = 0;

    // Termination requests met while draining; answered once the files are closed
    std::vector<std::promise<void>> pending_acks;

    // Mailbox
    detail::Wakeup wakeup;
    detail::BoundedChannel<LogEntry, static_cast<std::ptrdiff_t>(kLogQueueCapacity)> entries{wakeup};
    detail::Channel<ExitRequest> exits{wakeup};
    detail::Channel<PanicRequest> panics{wakeup};
    detail::Channel<SetConfigRequest> configs{wakeup};
    detail::Channel<SuppressRequest> suppressions{wakeup};
    detail::Channel<GetConfigRequest> config_gets{wakeup};
    detail::Channel<CloseRequest> closes{wakeup};

    // Caller side
    std::atomic<LoggerState> state{LoggerState::Starting};
    std::atomic<int> senders{0};   // Callers between the state check and send()
    std::atomic<std::uint64_t> next_sequence{0};
    std::promise<void> started;
    std::promise<void> closed;
    std::shared_future<void> closed_signal{closed.get_future().share()};
    Config final_config;           // Written before closed is signalled
    std::mutex close_mutex;
    std::thread thread;

    explicit Impl(LoggerOptions options)
        : source(options.source ? std::move(options.source)
                                : std::make_shared<JsonFileConfigSource>()),
          reload_interval(options.reload_interval) {}

    // ========== Caller side ==========

    template<typename Channel, typename Request, typename... Stamp>
    bool post(Channel& channel, Request&& request, Stamp&&... stamp) {
        senders.fetch_add(1);
        detail::SenderGuard guard{senders};
        auto s = state.load();
        if (s != LoggerState::Starting && s != LoggerState::Running) {
            return false;
        }
        channel.send(std::move(request), std::forward<Stamp>(stamp)...);
        return true;
    }

    // Entries are numbered once they hold a queue slot, so every number
    // handed out is enqueued by a sender the actor still counts
    bool post_entry(LogEntry&& entry) {
        return post(entries, std::move(entry), [this](LogEntry& queued) {
            queued.sequence = next_sequence.fetch_add(1);
        });
    }

    // ========== Actor loop ==========

    void run() {
        try {
            start();
            while (state.load() == LoggerState::Running) {
                wakeup.wait_until(next_reload);
                while (state.load() == LoggerState::Running && serve_round()) {}
            }
        } catch (const FatalError& e) {
            fatal(e);
        } catch (const std::exception& e) {
            fatal(FatalError(FatalKind::Filesystem, e.what()));
        }
    }

    void start() {
        config = source->read(true);
        if (auto valid = config.validate(); !valid) {
            for (auto err : valid.error()) {
                detail::reportf("invalid configuration: {}. Using defaults", config_error_message(err));
            }
            config = default_config();
        }
        open_file_set();
        log_config();
        next_reload = std::chrono::steady_clock::now() + reload_interval;
        state.store(LoggerState::Running);
        started.set_value();
    }

    // One message from each ready channel, starting with a different channel
    // every round; returns whether anything was served.
    bool serve_round() {
        constexpr std::size_t kChannels = 8;
        bool served = false;
        for (std::size_t i = 0; i < kChannels && state.load() == LoggerState::Running; ++i) {
            switch ((next_channel + i) % kChannels) {
                case 0: served |= serve_entry(); break;
                case 1: served |= serve_exit(); break;
                case 2: served |= serve_panic(); break;
                case 3: served |= serve_set_config(); break;
                case 4: served |= serve_suppress(); break;
                case 5: served |= serve_get_config(); break;
                case 6: served |= serve_reload(); break;
                case 7: served |= serve_close(); break;
            }
        }
        next_channel = (next_channel + 1) % kChannels;
        return served;
    }

    bool serve_entry() {
        if (!receive_entry()) return false;
        process_in_order();
        return true;
    }

    bool serve_exit() {
        ExitRequest request;
        if (!exits.try_receive(request)) return false;
        shutdown([&] { write_exit(request); });
        request.done.set_value();
        return true;
    }

    bool serve_panic() {
        PanicRequest request;
        if (!panics.try_receive(request)) return false;
        shutdown([&] { write_panic(request); });
        request.done.set_value();
        return true;
    }

    bool serve_set_config() {
        SetConfigRequest request;
        if (!configs.try_receive(request)) return false;

        flush_entries();
        auto next = config.clone();
        next.max_files = request.max_files;
        next.max_file_bytes = request.max_file_bytes;
        next.threshold = request.threshold;
        config = std::move(next);
        file_set->set_config(config.max_files, config.max_file_bytes);
        log_config();

        request.done.set_value();
        return true;
    }

    bool serve_suppress() {
        SuppressRequest request;
        if (!suppressions.try_receive(request)) return false;

        flush_entries();
        config.suppressed_file_stems = std::move(request.stems);
        log_config();

        request.done.set_value();
        return true;
    }

    bool serve_get_config() {
        GetConfigRequest request;
        if (!config_gets.try_receive(request)) return false;
        request.reply.set_value(config.clone());
        return true;
    }

    bool serve_reload() {
        auto now = std::chrono::steady_clock::now();
        if (now < next_reload) return false;
        next_reload = now + reload_interval;
        reload();
        return true;
    }

    bool serve_close() {
        CloseRequest request;
        if (!closes.try_receive(request)) return false;
        shutdown([] {});
        request.done.set_value();
        return true;
    }

    // ========== Entries ==========

    // Moves one queued entry into the reorder buffer
    bool receive_entry() {
        LogEntry entry;
        if (!entries.try_receive(entry)) return false;
        reorder.push_back(std::move(entry));
        std::ranges::push_heap(reorder, std::ranges::greater{}, &LogEntry::sequence);
        return true;
    }

    // Writes buffered entries up to the first missing sequence number.
    // Entries numbered below next_expected arrived after their gap was
    // given up and are written at once.
    void process_in_order() {
        while (!reorder.empty() && reorder.front().sequence <= next_expected) {
            std::ranges::pop_heap(reorder, std::ranges::greater{}, &LogEntry::sequence);
            LogEntry entry = std::move(reorder.back());
            reorder.pop_back();
            if (entry.sequence == next_expected) {
                ++next_expected;
            }
            process(entry);
        }
    }

    // Waits for the entry next_expected names. Its sender holds a queue slot
    // and is about to enqueue; with no sender in flight the number belongs
    // to a failed send and is skipped.
    void await_next_entry() {
        while (!reorder.empty() && reorder.front().sequence > next_expected) {
            if (receive_entry()) continue;
            if (senders.load() == 0) {
                for (auto n = entries.size_approx() + 1; n > 0 && receive_entry(); --n) {}
                if (reorder.front().sequence > next_expected) {
                    next_expected = reorder.front().sequence;
                }
                return;
            }
            std::this_thread::yield();
        }
    }

    void process(const LogEntry& entry) {
        if (!admits(config.threshold, entry.priority)) return;
        if (entry.priority == Priority::Debug && config.is_suppressed(extract_stem(entry.file))) return;

        Record record;
        record.priority = entry.priority;
        record.file = entry.file;
        record.line = entry.line;
        record.message = entry.message;
        record.timestamp = get_timestamp();
        file_set->write(format_line(record));
    }

    // Entries already queued are written under the current rules. The count
    // is taken up front so a busy producer cannot keep the actor here; the
    // gaps below the newest entry received are waited out.
    void flush_entries() {
        for (auto n = entries.size_approx(); n > 0 && receive_entry(); --n) {}
        if (reorder.empty()) return;

        auto end = std::ranges::max_element(reorder, std::ranges::less{}, &LogEntry::sequence)->sequence + 1;
        while (next_expected < end) {
            await_next_entry();
            process_in_order();
        }
    }

    void write_exit(const ExitRequest& request) {
        Record record;
        record.priority = Priority::Exit;
        record.file = request.file;
        record.line = request.line;
        record.message = request.message;
        record.timestamp = get_timestamp();
        record.exit_code = request.code;
        file_set->write(format_line(record));
    }

    void write_panic(const PanicRequest& request) {
        if (!admits(config.threshold, Priority::Panic)) return;

        Record record;
        record.priority = Priority::Panic;
        record.file = request.file;
        record.line = request.line;
        record.message = request.message;
        record.timestamp = get_timestamp();
        record.stack_trace = request.stack_trace;
        file_set->write(format_line(record));
    }

    // ========== Configuration ==========

    void log_config() {
        file_set->write(format_config_record(config, get_timestamp()));
    }

    void open_file_set() {
        file_set = std::make_unique<FileSet>(config.root_dir, config.file_name_prefix,
                                             config.max_file_bytes, config.max_files);
    }

    void reload() {
        auto fresh = source->read(false);
        if (fresh == config) return;

        if (auto valid = fresh.validate(); !valid) {
            detail::reportf("ignoring reloaded configuration: {}",
                            config_error_message(valid.error().front()));
            return;
        }

        bool relocate = fresh.root_dir != config.root_dir ||
                        fresh.file_name_prefix != config.file_name_prefix;
        config = std::move(fresh);
        if (relocate) {
            file_set->close();
            open_file_set();
        } else {
            file_set->set_config(config.max_files, config.max_file_bytes);
        }
        log_config();
    }

    // ========== Shutdown ==========

    // Stop accepting, write out everything already sent, write the final
    // record, close the files.
    template<typename FinalRecord>
    void shutdown(FinalRecord&& final_record) {
        state.store(LoggerState::Draining);

        for (;;) {
            bool quiet = senders.load() == 0;
            while (drain_pending()) {}
            if (quiet) break;
            std::this_thread::yield();
        }

        // Only numbers of failed sends can still be missing
        while (!reorder.empty()) {
            next_expected = std::max(next_expected, reorder.front().sequence);
            process_in_order();
        }

        final_record();
        file_set->close();

        final_config = config.clone();
        state.store(LoggerState::Closed);
        closed.set_value();

        for (auto& ack : pending_acks) {
            ack.set_value();
        }
        pending_acks.clear();
    }

    // Serve whatever is queued without changing the configuration
    bool drain_pending() {
        bool served = false;

        while (receive_entry()) {
            served = true;
        }
        process_in_order();

        ExitRequest exit_request;
        while (exits.try_receive(exit_request)) {
            write_exit(exit_request);
            pending_acks.push_back(std::move(exit_request.done));
            served = true;
        }

        PanicRequest panic_request;
        while (panics.try_receive(panic_request)) {
            write_panic(panic_request);
            pending_acks.push_back(std::move(panic_request.done));
            served = true;
        }

        SetConfigRequest config_request;
        while (configs.try_receive(config_request)) {
            config_request.done.set_value();
            served = true;
        }

        SuppressRequest suppress_request;
        while (suppressions.try_receive(suppress_request)) {
            suppress_request.done.set_value();
            served = true;
        }

        GetConfigRequest get_request;
        while (config_gets.try_receive(get_request)) {
            get_request.reply.set_value(config.clone());
            served = true;
        }

        CloseRequest close_request;
        while (closes.try_receive(close_request)) {
            pending_acks.push_back(std::move(close_request.done));
            served = true;
        }

        return served;
    }
};

// ============================================================================
// Constructors / Destructor
// ============================================================================

Logger::Logger() : Logger(LoggerOptions{}) {}

Logger::Logger(LoggerOptions options) : impl_(std::make_unique<Impl>(std::move(options))) {
    auto started = impl_->started.get_future();
    impl_->thread = std::thread([impl = impl_.get()]() {
        impl->run();
    });
    detail::await_reply(started, kLoggerReplyTimeout, "logger start");
}

Logger::~Logger() {
    close();
}

// ============================================================================
// Logging
// ============================================================================

Delivery Logger::log(Priority priority, std::string_view message, const std::source_location& loc) {
    LogEntry entry{priority, loc.file_name(), loc.line(), std::string(message), 0};
    return impl_->post_entry(std::move(entry)) ? Delivery::Queued : Delivery::Dropped;
}

// ============================================================================
// Termination
// ============================================================================

void Logger::exit(int code, std::string_view message, const std::source_location& loc) {
    ExitRequest request{code, loc.file_name(), loc.line(), std::string(message), {}};
    auto done = request.done.get_future();
    if (impl_->post(impl_->exits, std::move(request))) {
        done.wait();
    } else {
        impl_->closed_signal.wait();
        detail::reportf("exit {} after close: {}", code, message);
    }
    terminate_process(code);
}

void Logger::panic(std::string_view message, const std::source_location& loc) {
    PanicRequest request{loc.file_name(), loc.line(), std::string(message),
                         std::to_string(std::stacktrace::current(1)), {}};
    auto done = request.done.get_future();
    if (impl_->post(impl_->panics, std::move(request))) {
        done.wait();
    } else {
        impl_->closed_signal.wait();
        detail::reportf("panic after close: {}", message);
    }
    terminate_process(kPanicExitCode);
}

// ============================================================================
// Configuration
// ============================================================================

std::expected<void, ConfigError> Logger::set_config(int max_files,
                                                    std::int64_t max_file_bytes,
                                                    Priority threshold) {
    if (max_files < 1) {
        return std::unexpected(ConfigError::InvalidMaxFiles);
    }
    if (max_file_bytes < 1) {
        return std::unexpected(ConfigError::InvalidMaxFileBytes);
    }

    SetConfigRequest request{max_files, max_file_bytes, threshold, {}};
    auto done = request.done.get_future();
    if (impl_->post(impl_->configs, std::move(request))) {
        detail::await_reply(done, kLoggerReplyTimeout, "set config");
    }
    return {};
}

void Logger::suppress(std::string_view file_names) {
    SuppressRequest request{parse_suppressed(file_names), {}};
    auto done = request.done.get_future();
    if (impl_->post(impl_->suppressions, std::move(request))) {
        detail::await_reply(done, kLoggerReplyTimeout, "suppress");
    }
}

Config Logger::get_config() const {
    GetConfigRequest request;
    auto reply = request.reply.get_future();
    if (impl_->post(impl_->config_gets, std::move(request))) {
        return detail::await_reply(reply, kLoggerReplyTimeout, "get config");
    }
    detail::await_reply(impl_->closed_signal, kLoggerReplyTimeout, "get config");
    return impl_->final_config.clone();
}

// ============================================================================
// Lifecycle
// ============================================================================

void Logger::close() {
    std::lock_guard lock(impl_->close_mutex);

    CloseRequest request;
    auto done = request.done.get_future();
    if (impl_->post(impl_->closes, std::move(request))) {
        detail::await_reply(done, kLoggerCloseTimeout, "close");
    }
    detail::await_reply(impl_->closed_signal, kLoggerCloseTimeout, "close");

    if (impl_->thread.joinable()) {
        impl_->thread.join();
    }
}

LoggerState Logger::state() const noexcept {
    return impl_->state.load();
}

} // namespace logset
