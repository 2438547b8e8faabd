// server/server.hpp
#pragma once
#include "request_dispatcher.hpp"
#include "thread_pool.hpp"
#include <sys/types.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>

// Frames larger than this are refused and the connection is closed.
constexpr size_t kMaxRequestBytes = 4 * 1024 * 1024;

// Parses "<COMMAND>:<length>". Returns false on a malformed header.
bool parse_request_header(const std::string& header, std::string& command, size_t& length);
std::string format_response(const Response& response);

class MeterStoreServer {
private:
    std::atomic<int> server_fd{-1};
    int port;
    RequestDispatcher& dispatcher;
    std::unique_ptr<ThreadPool> thread_pool;
    size_t thread_count;

    std::atomic<size_t> active_connections{0};
    std::atomic<size_t> total_requests{0};
    std::atomic<bool> done{false};

    // Open client sockets, shut down by stop() to unblock their readers
    std::mutex clients_mutex;
    std::set<int> client_fds;

    // Serves one connection, then releases its socket whatever happened.
    void handle_client(int client_fd);
    void serve_connection(int client_fd);
    std::string read_line(int fd);
    ssize_t read_full(int fd, void* buf, size_t count);
    bool write_full(int fd, const std::string& data);

public:
    MeterStoreServer(int p, size_t threads, RequestDispatcher& request_dispatcher);
    ~MeterStoreServer();

    bool start();
    void run();
    // Async-signal-safe: flags the loop and unblocks accept().
    void request_stop();
    // Closes the listener and every open client connection.
    void stop();

    size_t requests_served() const { return total_requests.load(); }
};
