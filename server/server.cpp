// server/server.cpp
#include "server.hpp"
#include "logger.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>

bool parse_request_header(const std::string& header, std::string& command, size_t& length) {
    size_t colon_pos = header.find(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 == header.size()) {
        return false;
    }
    std::string digits = header.substr(colon_pos + 1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); }) ||
        digits.size() > 12) {
        return false;
    }
    command = header.substr(0, colon_pos);
    length = std::stoull(digits);
    return true;
}

std::string format_response(const Response& response) {
    // Error messages quote client bytes, which need not be valid UTF-8
    std::string body = response.body.dump(-1, ' ', false, json::error_handler_t::replace);
    return response.status + ":" + std::to_string(body.size()) + "\n" + body;
}

MeterStoreServer::MeterStoreServer(int p, size_t threads, RequestDispatcher& request_dispatcher)
    : port(p), dispatcher(request_dispatcher), thread_count(threads) {

    size_t num_threads = threads > 0
        ? threads
        : std::min(static_cast<size_t>(std::thread::hardware_concurrency() * 2), static_cast<size_t>(120));
    thread_pool = std::make_unique<ThreadPool>(std::max(num_threads, static_cast<size_t>(1)), "connections");
}

MeterStoreServer::~MeterStoreServer() {
    stop();
    thread_pool->shutdown();
}

bool MeterStoreServer::start() {
    server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        Logger::error("Socket creation failed");
        return false;
    }

    int opt = 1;
    setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port);

    if (::bind(server_fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        Logger::error("Bind failed on port " + std::to_string(port));
        return false;
    }

    if (listen(server_fd, 1024) < 0) {
        Logger::error("Listen failed");
        return false;
    }

    std::stringstream ss;
    ss << "meterstore listening on port " << port
       << " (threads=" << (thread_count ? std::to_string(thread_count) : std::string("auto")) << ")";
    Logger::success(ss.str());
    return true;
}

void MeterStoreServer::run() {
    if (server_fd == -1) {
        Logger::error("Server not started - call start() first");
        return;
    }

    Logger::info("Server running - waiting for connections...");

    while (!done.load()) {
        struct sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_socket = accept(server_fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_socket < 0) {
            if (!done.load()) {
                Logger::error("Accept failed");
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(clients_mutex);
            client_fds.insert(client_socket);
        }
        active_connections++;
        bool queued = thread_pool->enqueue([this, client_socket]() {
            handle_client(client_socket);
        });
        if (!queued) {
            std::lock_guard<std::mutex> lock(clients_mutex);
            client_fds.erase(client_socket);
            close(client_socket);
            active_connections--;
        }
    }

    Logger::info("Server stopped accepting connections");
}

void MeterStoreServer::handle_client(int client_socket) {
    try {
        serve_connection(client_socket);
    } catch (const std::exception& e) {
        Logger::error("Connection " + std::to_string(client_socket) + " aborted: " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(clients_mutex);
        client_fds.erase(client_socket);
    }
    close(client_socket);
    active_connections--;
}

void MeterStoreServer::serve_connection(int client_socket) {
    while (!done.load()) {
        std::string header = read_line(client_socket);
        if (header.empty()) break;

        std::string command;
        size_t body_length = 0;
        if (!parse_request_header(header, command, body_length)) {
            write_full(client_socket, format_response(RequestDispatcher::error_response(
                status::kInvalid, "validation", "Malformed header '" + header + "'")));
            break;
        }
        if (body_length > kMaxRequestBytes) {
            write_full(client_socket, format_response(RequestDispatcher::error_response(
                status::kInvalid, "validation",
                "Request of " + std::to_string(body_length) + " bytes exceeds the limit")));
            break;
        }

        std::string body(body_length, '\0');
        if (body_length > 0 &&
            read_full(client_socket, &body[0], body_length) != static_cast<ssize_t>(body_length)) {
            break;
        }

        Response response = dispatcher.dispatch(command, body);
        total_requests++;
        if (!write_full(client_socket, format_response(response))) {
            break;
        }
    }
}

std::string MeterStoreServer::read_line(int fd) {
    std::string line;
    char c;
    while (recv(fd, &c, 1, 0) == 1) {
        if (c == '\n') break;
        if (c != '\r') line += c;
        if (line.size() > 256) break;
    }
    return line;
}

ssize_t MeterStoreServer::read_full(int fd, void* buf, size_t count) {
    size_t total = 0;
    char* ptr = static_cast<char*>(buf);

    while (total < count) {
        ssize_t n = recv(fd, ptr + total, count - total, 0);
        if (n <= 0) return n;
        total += n;
    }
    return total;
}

bool MeterStoreServer::write_full(int fd, const std::string& data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t n = send(fd, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (n <= 0) return false;
        total += n;
    }
    return true;
}

void MeterStoreServer::request_stop() {
    done.store(true);
    int fd = server_fd.load();
    if (fd != -1) {
        shutdown(fd, SHUT_RDWR);
    }
}

void MeterStoreServer::stop() {
    done.store(true);
    int fd = server_fd.exchange(-1);
    if (fd != -1) {
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }
    std::lock_guard<std::mutex> lock(clients_mutex);
    for (int fd : client_fds) {
        shutdown(fd, SHUT_RDWR);
    }
}
