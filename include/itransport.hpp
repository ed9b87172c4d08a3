#pragma once
#include <functional>
#include <string>


/**
 * @class ITransport
 * @brief An abstract base class for the persistent, message-oriented connection to the remote peer.
 *
 * Implementations deliver inbound frames on a single receive context of their own, in arrival
 * order. The owner must never block that context waiting for another inbound frame.
 */
class ITransport {

    public:
        using MessageHandler = std::function<void(std::string)>;
        using CloseHandler = std::function<void(const std::string&)>;

        virtual ~ITransport() = default;

        /**
         * @brief Opens the connection and starts delivering inbound frames.
         * @param host The hostname or IP address of the peer.
         * @param port The port number for the connection.
         * @param target The WebSocket target path.
         * @throws ConnectionError if the connection cannot be established.
         */
        virtual void open(const std::string& host, const std::string& port, const std::string& target) = 0;

        /**
         * @brief Queues a text frame for sending. Safe to call from any thread.
         * @throws ConnectionError if the transport is not open.
         */
        virtual void send(const std::string& message) = 0;

        /**
         * @brief Closes the connection and waits for the receive context to finish.
         *
         * Idempotent. Does not invoke the close handler.
         */
        virtual void close() = 0;

        virtual bool is_open() const = 0;

        void set_message_handler(MessageHandler handler) {
            on_message_ = std::move(handler);
        }

        // Invoked when the peer or the network ends the connection.
        void set_close_handler(CloseHandler handler) {
            on_close_ = std::move(handler);
        }

    protected:
        MessageHandler on_message_;
        CloseHandler on_close_;
};
