#ifndef PROTON_TRANSPORT_HPP
#define PROTON_TRANSPORT_HPP

#include "broker_transport.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <proton/connection.hpp>
#include <proton/connection_options.hpp>
#include <proton/container.hpp>
#include <proton/error_condition.hpp>
#include <proton/messaging_handler.hpp>
#include <proton/sender.hpp>
#include <proton/session.hpp>
#include <proton/tracker.hpp>
#include <proton/transport.hpp>
#include <proton/work_queue.hpp>
#include <string>
#include <thread>
#include <vector>

class proton_connection;

// Maps an AMQP 1.0 error condition onto a classic reply code and text
shutdown_info to_shutdown_info(const proton::error_condition& error, shutdown_initiator initiator);
uint16_t reply_code_for(const proton::error_condition& error);

// One AMQP session with a sender link per target address.
// Members marked "container thread" are only touched from the connection's work queue or handler.
class proton_channel : public broker_channel, public std::enable_shared_from_this<proton_channel> {
public:
    proton_channel(std::weak_ptr<proton_connection> connection,
                   channel_listener& listener,
                   std::chrono::milliseconds timeout);

    bool is_open() const override;
    void publish(const Message& msg) override;
    void close(const close_reason& reason) override;

    // Blocks until the broker confirms the session. Throws channel_unavailable_error.
    void wait_open();

    // Container thread
    void attach(proton::session s);
    void fail(const std::string& reason);
    bool owns(const proton::session& s) const;
    void on_session_open();
    void on_session_close(const proton::error_condition& error);
    void on_connection_lost(const shutdown_info& info, bool final);
    void on_sendable(proton::sender& s);
    void on_sender_error(proton::sender& s);
    void on_tracker_accept(proton::tracker& t);
    void on_tracker_reject(proton::tracker& t);
    void on_tracker_release(proton::tracker& t);
    void on_tracker_settle(proton::tracker& t);

private:
    struct pending_return {
        proton::tracker tracker;
        std::string address;
        returned_message msg;
    };

    void do_publish(const Message& msg, const std::string& address);
    proton::sender sender_for(const std::string& address);
    std::list<pending_return>::iterator find_pending(const proton::tracker& t);
    void return_message(returned_message msg);

    std::weak_ptr<proton_connection> connection_;
    channel_listener& listener_;
    std::chrono::milliseconds timeout_;

    // Container thread
    proton::session session_;
    std::map<std::string, proton::sender> senders_;
    std::list<pending_return> pending_;
    bool blocked_ = false;
    bool closing_ = false;
    close_reason closing_reason_;

    mutable std::mutex lock_;
    std::condition_variable state_changed_;
    std::atomic<bool> open_{false};
    bool closed_	= false;
    bool abandoned_ = false;
    std::string failure_;
};

// One AMQP connection. Acts as the Proton handler for the connection and every
// session, link and delivery on it, and forwards events to the listener.
class proton_connection : public broker_connection,
                          public proton::messaging_handler,
                          public std::enable_shared_from_this<proton_connection> {
public:
    proton_connection(const ClientConfig& config, connection_listener& listener);

    bool is_open() const override;
    std::shared_ptr<broker_channel> open_channel(channel_listener& listener) override;
    void close(const close_reason& reason) override;

    // Blocks until open, failed or timed out. Throws connection_init_error.
    void wait_open();

    // Runs f on the connection thread; false once the connection is finished
    bool post(std::function<void()> f);

    bool finished() const;

    // Container thread
    void notify_blocked(const std::string& reason);
    void notify_unblocked();
    void report_callback_error(const std::string& what);

    void on_connection_open(proton::connection& c) override;
    void on_connection_close(proton::connection& c) override;
    void on_connection_error(proton::connection& c) override;
    void on_transport_error(proton::transport& t) override;
    void on_transport_close(proton::transport& t) override;
    void on_session_open(proton::session& s) override;
    void on_session_close(proton::session& s) override;
    void on_session_error(proton::session& s) override;
    void on_sendable(proton::sender& s) override;
    void on_sender_error(proton::sender& s) override;
    void on_tracker_accept(proton::tracker& t) override;
    void on_tracker_reject(proton::tracker& t) override;
    void on_tracker_release(proton::tracker& t) override;
    void on_tracker_settle(proton::tracker& t) override;
    void on_error(const proton::error_condition& e) override;

private:
    enum class state { connecting, open, reconnecting, failed, closed };

    std::shared_ptr<proton_channel> channel_for(const proton::session& s) const;
    void connection_lost(const shutdown_info& info, bool final);

    template <class F>
    void guarded(const char* what, F&& f) {
        try {
            f();
        } catch (const std::exception& e) {
            report_callback_error(std::string(what) + ": " + e.what());
        } catch (...) {
            report_callback_error(std::string(what) + ": unknown exception");
        }
    }

    ClientConfig config_;
    connection_listener& listener_;

    // Container thread
    proton::connection connection_;
    std::vector<std::shared_ptr<proton_channel>> channels_;
    bool closing_ = false;
    close_reason closing_reason_;

    mutable std::mutex lock_;
    std::condition_variable state_changed_;
    proton::work_queue* work_queue_;
    state state_ = state::connecting;
    std::atomic<bool> open_{false};
    bool ever_opened_ = false;
    bool abandoned_	  = false;
    bool finished_	  = false;
    std::string failure_;
};

// broker_transport over a Proton container running on its own thread
class proton_transport : public broker_transport {
public:
    explicit proton_transport(const std::string& container_id);
    ~proton_transport() override;

    std::shared_ptr<broker_connection> open_connection(const ClientConfig& config,
                                                       connection_listener& listener) override;
    void shutdown() override;

private:
    proton::connection_options connection_options(const ClientConfig& config) const;

    std::unique_ptr<proton::container> container_;
    std::thread container_thread_;
    std::mutex lock_;
    std::vector<std::shared_ptr<proton_connection>> connections_;
    bool stopped_ = false;
};

#endif // PROTON_TRANSPORT_HPP
