#include "wspp_connection.H"

namespace predex::stream {

WsppConnection::WsppConnection(std::shared_ptr<spdlog::logger> logger) : logger(logger) {
    client.clear_access_channels(websocketpp::log::alevel::all);
    client.clear_error_channels(websocketpp::log::elevel::all);
    client.init_asio();

    client.set_tls_init_handler([](websocketpp::connection_hdl) {
        auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tlsv12_client);
        ctx->set_default_verify_paths();
        ctx->set_verify_mode(asio::ssl::verify_peer);
        return ctx;
    });

    client.set_open_handler([this](websocketpp::connection_hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        opened = true;
        cv.notify_all();
    });

    client.set_fail_handler([this](websocketpp::connection_hdl h) {
        websocketpp::lib::error_code ec;
        auto con = client.get_con_from_hdl(h, ec);
        mark_closed(con ? "connect failed: " + con->get_ec().message() : "connect failed");
    });

    client.set_close_handler([this](websocketpp::connection_hdl h) {
        websocketpp::lib::error_code ec;
        auto con = client.get_con_from_hdl(h, ec);
        if (con) {
            mark_closed("closed by remote, code " + std::to_string(con->get_remote_close_code()) +
                        " " + con->get_remote_close_reason());
        } else {
            mark_closed("closed");
        }
    });

    client.set_message_handler([this](websocketpp::connection_hdl, tls_client::message_ptr msg) {
        if (msg->get_opcode() == websocketpp::frame::opcode::text) {
            inbox.push(msg->get_payload());
        }
    });
}

WsppConnection::~WsppConnection() {
    close();
    if (io_thread.joinable()) {
        io_thread.join();
    }
}

void WsppConnection::mark_closed(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!closed) {
            closed = true;
            close_reason = reason;
        }
        cv.notify_all();
    }
    inbox.close();
    client.stop();
}

std::string WsppConnection::get_close_reason() {
    std::lock_guard<std::mutex> lock(mutex);
    return close_reason.empty() ? "connection closed" : close_reason;
}

void WsppConnection::connect(const std::string& url, std::chrono::milliseconds timeout) {
    websocketpp::lib::error_code ec;
    tls_client::connection_ptr con = client.get_connection(url, ec);
    if (ec) {
        throw StreamDisconnected("cannot connect to " + url + ": " + ec.message());
    }
    hdl = con->get_handle();
    client.connect(con);

    io_thread = std::thread([this]() {
        try {
            client.run();
        } catch (const std::exception& e) {
            logger->error("websocket io loop failed: {}", e.what());
            mark_closed(std::string("io loop failed: ") + e.what());
        }
    });

    std::unique_lock<std::mutex> lock(mutex);
    bool ready = cv.wait_for(lock, timeout, [this] { return opened || closed || close_requested; });
    if (!opened || closed) {
        std::string reason = ready ? close_reason : "connect timed out after " + std::to_string(timeout.count()) + "ms";
        lock.unlock();
        close();
        throw StreamDisconnected(reason.empty() ? "connect aborted" : reason);
    }
}

void WsppConnection::send(const std::string& text) {
    websocketpp::lib::error_code ec;
    client.send(hdl, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        throw StreamDisconnected("send failed: " + ec.message());
    }
}

std::optional<std::string> WsppConnection::receive(std::chrono::milliseconds timeout) {
    auto frame = inbox.pop_for(timeout);
    if (frame) {
        return frame;
    }
    if (inbox.is_closed()) {
        throw StreamDisconnected(get_close_reason());
    }
    return std::nullopt;
}

void WsppConnection::close() {
    bool was_open;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (close_requested) {
            return;
        }
        close_requested = true;
        was_open = opened && !closed;
        cv.notify_all();
    }

    if (was_open) {
        websocketpp::lib::error_code ec;
        client.close(hdl, websocketpp::close::status::going_away, "", ec);
        if (ec) {
            logger->debug("websocket close: {}", ec.message());
        }
    }
    inbox.close();
    client.stop();
}

ConnectionFactory wspp_connection_factory(std::shared_ptr<spdlog::logger> logger) {
    return [logger]() { return std::make_unique<WsppConnection>(logger); };
}

} // namespace predex::stream
