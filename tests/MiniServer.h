//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MiniServer.h
// Purpose: In-process Boost.Beast HTTP server on 127.0.0.1 for the HTTP and SSE transport tests
//==========================================================================================================
#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace toolhost {
namespace fakes {

//==========================================================================================================
// MiniServer
// Purpose: One thread per connection, one request per connection. Requests to the event-stream target are
//          answered with an open text/event-stream that carries every event passed to PushEvent.
//==========================================================================================================
class MiniServer {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;
    using Handler = std::function<Response(const Request&)>;

    explicit MiniServer(Handler handler, std::string eventStreamTarget = std::string())
        : handler_(std::move(handler)), streamTarget_(std::move(eventStreamTarget)) {}

    ~MiniServer() { Stop(); }

    unsigned short Start() {
        using boost::asio::ip::tcp;
        tcp::endpoint ep{boost::asio::ip::make_address("127.0.0.1"), 0};
        acceptor_.open(ep.protocol());
        acceptor_.set_option(tcp::acceptor::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();
        running_.store(true);
        acceptThread_ = std::thread([this]() { acceptLoop(); });
        return port_;
    }

    void Stop() {
        if (!running_.exchange(false)) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(eventMutex_);
            eventCv_.notify_all();
        }
        // Wake the blocking accept.
        boost::system::error_code ec;
        boost::asio::ip::tcp::socket poke{io_};
        poke.connect({boost::asio::ip::make_address("127.0.0.1"), port_}, ec);
        poke.close(ec);
        if (acceptThread_.joinable()) {
            acceptThread_.join();
        }
        acceptor_.close(ec);
        std::vector<std::thread> workers;
        {
            std::lock_guard<std::mutex> lk(workerMutex_);
            workers.swap(workers_);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    std::string Url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

    // Queues a raw event block ("event: x\ndata: y\n\n") for every open event stream.
    void PushEvent(const std::string& raw) {
        std::lock_guard<std::mutex> lk(eventMutex_);
        events_.push_back(raw);
        eventCv_.notify_all();
    }

    std::vector<Request> Requests() const {
        std::lock_guard<std::mutex> lk(requestMutex_);
        return requests_;
    }

    static Response Reply(const Request& req, boost::beast::http::status status, const std::string& body,
                          const std::string& contentType = "application/json") {
        Response res{status, req.version()};
        res.set(boost::beast::http::field::server, "mini-server");
        if (!contentType.empty()) {
            res.set(boost::beast::http::field::content_type, contentType);
        }
        res.keep_alive(false);
        res.body() = body;
        res.prepare_payload();
        return res;
    }

private:
    void acceptLoop() {
        while (running_.load()) {
            boost::asio::ip::tcp::socket socket{io_};
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec || !running_.load()) {
                continue;
            }
            std::lock_guard<std::mutex> lk(workerMutex_);
            workers_.emplace_back([this, s = std::move(socket)]() mutable { serve(std::move(s)); });
        }
    }

    void serve(boost::asio::ip::tcp::socket socket) {
        boost::beast::tcp_stream stream{std::move(socket)};
        try {
            boost::beast::flat_buffer buffer;
            Request req;
            boost::beast::http::read(stream, buffer, req);
            {
                std::lock_guard<std::mutex> lk(requestMutex_);
                requests_.push_back(req);
            }
            if (!streamTarget_.empty() && req.method() == boost::beast::http::verb::get &&
                std::string(req.target()) == streamTarget_) {
                Response head = handler_(req);
                if (head.result() == boost::beast::http::status::ok) {
                    streamEvents(stream);
                    return;
                }
                boost::beast::http::write(stream, head);
            } else {
                Response res = handler_(req);
                boost::beast::http::write(stream, res);
            }
            boost::system::error_code ec;
            stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        } catch (const boost::system::system_error&) {
            // Client went away mid-request.
            return;
        }
    }

    // Writes the stream head without a length so the body runs until the connection closes.
    void streamEvents(boost::beast::tcp_stream& stream) {
        const std::string head =
            "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nCache-Control: no-cache\r\n\r\n";
        boost::asio::write(stream.socket(), boost::asio::buffer(head));
        std::size_t next = 0;
        std::unique_lock<std::mutex> lk(eventMutex_);
        while (running_.load()) {
            eventCv_.wait(lk, [&]() { return !running_.load() || next < events_.size(); });
            while (running_.load() && next < events_.size()) {
                std::string raw = events_[next++];
                lk.unlock();
                boost::system::error_code ec;
                boost::asio::write(stream.socket(), boost::asio::buffer(raw), ec);
                lk.lock();
                if (ec) {
                    return;
                }
            }
        }
        boost::system::error_code ec;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }

    Handler handler_;
    std::string streamTarget_;
    boost::asio::io_context io_;
    boost::asio::ip::tcp::acceptor acceptor_{io_};
    std::thread acceptThread_;
    std::atomic<bool> running_{false};
    unsigned short port_{0};

    std::mutex workerMutex_;
    std::vector<std::thread> workers_;

    mutable std::mutex requestMutex_;
    std::vector<Request> requests_;

    std::mutex eventMutex_;
    std::condition_variable eventCv_;
    std::deque<std::string> events_;
};

// Port that refuses connections: bound once, then released.
inline unsigned short closedPort() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor a{io, {boost::asio::ip::make_address("127.0.0.1"), 0}};
    unsigned short port = a.local_endpoint().port();
    a.close();
    return port;
}

} // namespace fakes
} // namespace toolhost
