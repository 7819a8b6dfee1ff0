#pragma once

#include <atomic>
#include <cstdio>
#include <oirun/concat_tostr.hh>
#include <string>
#include <utility>

class Logger {
    FILE* f_;
    std::atomic<bool> opened_{false};
    std::atomic<bool> label_{true};

    void close() noexcept {
        if (opened_.exchange(false)) {
            (void)fclose(f_);
        }
    }

    bool lock() noexcept {
        if (f_ == nullptr) {
            return false;
        }

        flockfile(f_);
        return true;
    }

    void unlock() noexcept { funlockfile(f_); }

public:
    // Like open()
    explicit Logger(const std::string& filename);

    // Like use(), nullptr makes the logger discard everything
    explicit Logger(FILE* stream) noexcept : f_(stream) {}

    Logger(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Opens file @p filename in append mode as the log stream
     *
     * @errors Throws std::runtime_error if fopen() fails, the current stream
     *   is left unchanged in such case
     */
    void open(const std::string& filename);

    // Sets @p stream as the log stream, nullptr makes the logger a dummy
    void use(FILE* stream) noexcept {
        close();
        f_ = stream;
    }

    // Sets @p stream as the log stream and returns the previous one
    FILE* exchange_log_stream(FILE* stream) noexcept { return std::exchange(f_, stream); }

    [[nodiscard]] bool is_active() const noexcept { return f_ != nullptr; }

    [[nodiscard]] bool label() const noexcept { return label_.load(std::memory_order_relaxed); }

    bool label(bool add_label) noexcept { return label_.exchange(add_label); }

    class Appender {
        friend class Logger;

        Logger& logger_;
        bool flushed_ = true;
        bool label_;
        std::string buff_;

        explicit Appender(Logger& logger) : logger_(logger), label_(logger.label()) {}

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        explicit Appender(Logger& logger, Args&&... args) : Appender(logger) {
            operator()(std::forward<Args>(args)...);
        }

        void flush_impl(const char* newline_or_empty_str) noexcept;

    public:
        Appender(const Appender&) = delete;

        Appender(Appender&& app) noexcept
        : logger_(app.logger_)
        , flushed_(std::exchange(app.flushed_, true))
        , label_(app.label_)
        , buff_(std::move(app.buff_)) {}

        Appender& operator=(const Appender&) = delete;
        Appender& operator=(Appender&&) = delete;

        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        Appender& operator()(Args&&... args) {
            back_insert(buff_, std::forward<Args>(args)...);
            flushed_ = false;
            return *this;
        }

        void flush() noexcept { flush_impl("\n"); }

        // Like flush() but does not append the '\n'
        void flush_no_nl() noexcept {
            flush_impl("");
            label_ = false;
        }

        ~Appender() { flush(); }
    };

    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    Appender operator()(Args&&... args) {
        return Appender(*this, std::forward<Args>(args)...);
    }

    ~Logger() { close(); }
};

// By default all write to stderr, debuglog is disabled until enabled
inline Logger stdlog(stderr); // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
inline Logger errlog(stderr); // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
inline Logger debuglog(nullptr); // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
