#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <stemdeck/export_stemdeck.h>

namespace stemdeck {

    /**
     * @brief Handle of a live subscription
     *
     * Cancels the subscription when destroyed. Move-only.
     */
    class STEMDECK_EXPORT subscription {
        public:
            using cancel_t = std::function<void()>;

            subscription();
            explicit subscription(cancel_t cancel);
            ~subscription();

            subscription(subscription&& other) noexcept;
            subscription& operator=(subscription&& other) noexcept;

            subscription(const subscription&) = delete;
            subscription& operator=(const subscription&) = delete;

            /// Stop receiving notifications; safe to call more than once
            void unsubscribe();

            [[nodiscard]] bool active() const { return static_cast<bool>(m_cancel); }

        private:
            cancel_t m_cancel;
    };

    /**
     * @class document_store
     * @brief Remote hierarchical document store with change notification
     *
     * Paths are '/'-separated keys ("sessions/ab12/state"). Values are JSON
     * documents; objects form the hierarchy, so the value at "sessions"
     * contains every session below it.
     *
     * Implementations throw store_error on failure.
     */
    class STEMDECK_EXPORT document_store {
        public:
            /// Receives the value at the subscribed path; null when absent
            using callback_t = std::function<void(const nlohmann::json& value)>;

            virtual ~document_store();

            [[nodiscard]] virtual std::optional<nlohmann::json> read(const std::string& path) = 0;

            /// Replace the value at @p path, creating parents as needed
            virtual void write(const std::string& path, const nlohmann::json& value) = 0;

            virtual void remove(const std::string& path) = 0;

            /**
             * @brief Observe the value at @p path
             *
             * The callback receives the current value right away and again
             * after every write or removal at, below or above @p path that
             * changes it. It may run on any thread.
             */
            [[nodiscard]] virtual subscription subscribe(const std::string& path, callback_t callback) = 0;
    };

    /**
     * @brief Split a store path into its keys
     * @throws store_error on an empty path or an empty key
     */
    STEMDECK_EXPORT std::vector<std::string> split_path(const std::string& path);

    /**
     * @brief Join keys into a store path
     */
    STEMDECK_EXPORT std::string join_path(std::initializer_list<std::string> keys);

    /**
     * @class memory_document_store
     * @brief In-process document store shared by any number of devices
     *
     * Thread-safe. Callbacks run on the writing thread, outside the
     * store's lock.
     */
    class STEMDECK_EXPORT memory_document_store : public document_store {
        public:
            memory_document_store();
            ~memory_document_store() override;

            std::optional<nlohmann::json> read(const std::string& path) override;
            void write(const std::string& path, const nlohmann::json& value) override;
            void remove(const std::string& path) override;
            subscription subscribe(const std::string& path, callback_t callback) override;

            [[nodiscard]] std::size_t subscriber_count() const;

        private:
            struct impl;
            std::shared_ptr<impl> m_pimpl;
    };

} // namespace stemdeck
