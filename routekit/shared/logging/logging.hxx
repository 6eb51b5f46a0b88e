/**
 * @file logging.hxx
 * @brief Leveled logger with an optional background writer and bounded buffer.
 */

#ifndef ROUTEKIT_SHARED_LOGGING_HXX
#define ROUTEKIT_SHARED_LOGGING_HXX

#define ROUTEKIT_HAS_LOGGING_IMPL

namespace shared {
#ifdef ROUTEKIT_USE_LOGGING_IMPL
    /**
     * @brief Log severity levels.
     */
    enum struct e_log_level : std::int16_t {
        debug,    ///< Debug-level messages.
        info,     ///< Informational messages.
        warning,  ///< Warning conditions.
        error,    ///< Error conditions.
        critical, ///< Critical conditions.
        none = -1 ///< Logging disabled.
    };

    /**
     * @brief One formatted log line waiting to be written.
     */
    struct log_message_t {
        /** @brief Severity level of the message. */
        e_log_level m_level{};

        /** @brief Formatted message text. */
        std::string m_message{};

        /** @brief Time the message was produced. */
        std::chrono::system_clock::time_point m_timestamp{};
    };

    /**
     * @brief Bounded FIFO of pending log messages shared between producers and the writer thread.
     */
    class log_buffer_t {
      public:
        /**
         * @brief Construct a buffer holding at most @p capacity messages.
         * @param capacity Maximum number of pending messages.
         */
        ROUTEKIT_INLINE log_buffer_t(std::size_t capacity = 4096u) : m_capacity(capacity) {}

      public:
        /**
         * @brief Append a message.
         * @param msg Message to append.
         * @return False if the buffer is full and the message was not stored.
         */
        ROUTEKIT_INLINE bool push(log_message_t&& msg) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            if (m_queue.size() >= m_capacity)
                return false;

            m_queue.push_back(std::move(msg));

            return true;
        }

        /**
         * @brief Remove the oldest message.
         * @param msg Receives the removed message.
         * @return False if the buffer was empty.
         */
        ROUTEKIT_INLINE bool pop(log_message_t& msg) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            if (m_queue.empty())
                return false;

            msg = std::move(m_queue.front());

            m_queue.pop_front();

            return true;
        }

        ROUTEKIT_INLINE std::size_t size() const {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            return m_queue.size();
        }

        ROUTEKIT_INLINE bool empty() const {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            return m_queue.empty();
        }

        /**
         * @brief Take up to @p batch_size of the oldest messages, in order.
         * @param batch_size Maximum number of messages to take.
         * @return The removed messages.
         */
        ROUTEKIT_INLINE std::vector<log_message_t> take(std::size_t batch_size) {
            std::unique_lock<std::shared_mutex> lock(m_mutex);

            const auto count = std::min(batch_size, m_queue.size());

            std::vector<log_message_t> batch{};

            batch.reserve(count);

            for (std::size_t i{}; i < count; i++) {
                batch.push_back(std::move(m_queue.front()));

                m_queue.pop_front();
            }

            return batch;
        }

      private:
        /** @brief Pending messages, oldest first. */
        std::deque<log_message_t> m_queue{};

        /** @brief Guards m_queue. */
        mutable std::shared_mutex m_mutex{};

        /** @brief Maximum number of pending messages. */
        std::size_t m_capacity{};
    };

    /**
     * @brief Leveled logger writing fmt-formatted lines, synchronously or from a worker thread.
     */
    class c_logging {
      public:
        /**
         * @brief What to do with a message produced while the buffer is full.
         */
        enum struct e_overflow_strategy {
            block,          ///< Wait until the writer frees a slot.
            discard_oldest, ///< Drop the oldest pending message.
            discard_newest  ///< Drop the incoming message.
        };

      public:
        /**
         * @brief Construct a logger; nothing is printed until a level other than none is set.
         * @param log_level Minimum level to print.
         * @param force_flush Flush the output after every synchronous write.
         */
        ROUTEKIT_INLINE c_logging(const e_log_level& log_level = e_log_level::none, bool force_flush = false)
            : m_log_level(log_level), m_force_flush(force_flush) {
        }

        ROUTEKIT_INLINE ~c_logging() { stop_async(); }

        ROUTEKIT_INLINE c_logging(const c_logging&) = delete;

        ROUTEKIT_INLINE c_logging& operator=(const c_logging&) = delete;

      public:
        /**
         * @brief Apply a configuration and optionally start the background writer.
         * @param log_level Minimum level to print.
         * @param force_flush Flush the output after every synchronous write.
         * @param async Start the background writer.
         * @param buffer_size Capacity of the pending-message buffer.
         * @param strategy Overflow strategy for a full buffer.
         */
        ROUTEKIT_INLINE void init(
            const e_log_level& log_level,

            bool force_flush = false,
            bool async = true,

            std::size_t buffer_size = 16384u,

            e_overflow_strategy strategy = e_overflow_strategy::discard_oldest
        ) {
            m_log_level = log_level;
            m_force_flush = force_flush;
            m_buffer_size = buffer_size;
            m_overflow_strategy = strategy;

            if (async)
                start_async();
        }

        /**
         * @brief Redirect output (stdout by default).
         * @param output Stream to write to; must outlive the logger.
         */
        ROUTEKIT_INLINE void set_output(std::FILE* output) { m_output = output ? output : stdout; }

        ROUTEKIT_INLINE const char* lvl_to_str(const e_log_level& level) const {
            switch (level) {
                case e_log_level::debug:
                    return "DEBUG";
                case e_log_level::info:
                    return "INFO";
                case e_log_level::warning:
                    return "WARNING";
                case e_log_level::error:
                    return "ERROR";
                case e_log_level::critical:
                    return "CRITICAL";
                default:
                    return "UNKNOWN";
            }
        }

        /**
         * @brief Whether a message of @p log_level would be printed.
         */
        [[nodiscard]] ROUTEKIT_INLINE bool enabled(const e_log_level& log_level) const {
            return m_log_level != e_log_level::none && log_level >= m_log_level;
        }

        /**
         * @brief Print immediately, ignoring the level filter and the buffer.
         */
        template <typename... _args_t>
        ROUTEKIT_INLINE void force_log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            write({log_level, fmt::format(message, std::forward<_args_t>(args)...), std::chrono::system_clock::now()});

            std::fflush(m_output);
        }

        /**
         * @brief Format and print a message, through the background writer when it runs.
         */
        template <typename... _args_t>
        ROUTEKIT_INLINE void log(const e_log_level& log_level, fmt::format_string<_args_t...> message, _args_t&&... args) {
            if (!enabled(log_level))
                return;

            log_message_t msg{log_level, fmt::format(message, std::forward<_args_t>(args)...), std::chrono::system_clock::now()};

            if (!m_running || !m_log_buffer) {
                write(msg);

                if (m_force_flush)
                    std::fflush(m_output);

                return;
            }

            if (m_log_buffer->push(std::move(msg)))
                m_condition.notify_one();
            else
                handle_overflow(std::move(msg));
        }

        /**
         * @brief Start the background writer; a no-op when it already runs.
         */
        ROUTEKIT_INLINE void start_async() {
            if (m_running)
                return;

            m_log_buffer = std::make_unique<log_buffer_t>(m_buffer_size);

            m_running = true;

            m_worker_thread = std::thread(&c_logging::process_logs, this);
        }

        /**
         * @brief Stop the background writer and print whatever is still pending.
         */
        ROUTEKIT_INLINE void stop_async() {
            if (!m_running)
                return;

            {
                std::lock_guard<std::mutex> lock(m_mutex);

                m_running = false;
            }

            m_condition.notify_all();

            if (m_worker_thread.joinable())
                m_worker_thread.join();

            if (m_log_buffer) {
                for (const auto& msg : m_log_buffer->take(m_buffer_size))
                    write(msg);

                std::fflush(m_output);

                m_log_buffer.reset();
            }
        }

      private:
        ROUTEKIT_INLINE void write(const log_message_t& msg) {
            fmt::print(
                m_output,

                "[{:%Y-%m-%d %H:%M:%S}] {} - {}\n",

                fmt::styled(
                    std::chrono::system_clock::from_time_t(std::chrono::system_clock::to_time_t(msg.m_timestamp)),
                    fmt::emphasis::bold | fg(fmt::rgb(245, 245, 184))
                ),

                fmt::styled(lvl_to_str(msg.m_level), fmt::emphasis::bold),

                fmt::styled(msg.m_message, fg(fmt::rgb(255, 255, 230)))
            );
        }

        ROUTEKIT_INLINE void handle_overflow(log_message_t&& msg) {
            switch (m_overflow_strategy) {
                case e_overflow_strategy::block: {
                    std::unique_lock<std::mutex> lock(m_mutex);

                    m_condition.wait(lock, [this] {
                        return !m_running || m_log_buffer->size() < m_buffer_size;
                    });

                    if (m_running && m_log_buffer->push(std::move(msg)))
                        m_condition.notify_one();

                    break;
                }

                case e_overflow_strategy::discard_oldest: {
                    log_message_t dropped{};

                    if (m_log_buffer->pop(dropped) && m_log_buffer->push(std::move(msg)))
                        m_condition.notify_one();

                    break;
                }

                case e_overflow_strategy::discard_newest:
                    break;
            }
        }

        ROUTEKIT_INLINE void process_logs() {
            constexpr std::size_t k_batch_size = 256u;

            while (true) {
                {
                    std::unique_lock<std::mutex> lock(m_mutex);

                    m_condition.wait_for(lock, std::chrono::milliseconds(50), [this] {
                        return !m_running || !m_log_buffer->empty();
                    });

                    if (!m_running && m_log_buffer->empty())
                        break;
                }

                auto batch = m_log_buffer->take(k_batch_size);

                if (batch.empty())
                    continue;

                for (const auto& msg : batch)
                    write(msg);

                std::fflush(m_output);

                m_condition.notify_all();
            }
        }

      private:
        /** @brief Minimum level printed. */
        e_log_level m_log_level{e_log_level::none};

        /** @brief Flush after every synchronous write. */
        bool m_force_flush{};

        /** @brief Destination stream. */
        std::FILE* m_output{stdout};

        /** @brief Background writer state. */
        std::atomic<bool> m_running{};

        /** @brief Pending messages while the writer runs. */
        std::unique_ptr<log_buffer_t> m_log_buffer{};

        std::mutex m_mutex{};

        std::condition_variable m_condition{};

        std::thread m_worker_thread{};

        /** @brief Capacity used when the buffer is (re)created. */
        std::size_t m_buffer_size{16384u};

        /** @brief Overflow behavior for a full buffer. */
        e_overflow_strategy m_overflow_strategy{e_overflow_strategy::discard_oldest};
    };
#endif // ROUTEKIT_USE_LOGGING_IMPL
}

#endif // ROUTEKIT_SHARED_LOGGING_HXX
