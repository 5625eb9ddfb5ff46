#include "linux_port_prober.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <cerrno>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace quay {

LinuxPortProber::LinuxPortProber(std::chrono::milliseconds timeout)
    : timeout_(timeout)
{
}

bool LinuxPortProber::is_port_open(uint16_t port, std::chrono::milliseconds timeout) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    bool open = false;
    int ret = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (ret == 0) {
        open = true;
    } else if (errno == EINPROGRESS) {
        pollfd pfd{fd, POLLOUT, 0};
        int ready;
        do {
            ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (ready < 0 && errno == EINTR);

        if (ready > 0) {
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                open = true;
            }
        }
    }

    close(fd);
    return open;
}

std::map<uint16_t, bool> LinuxPortProber::probe(const std::vector<uint16_t>& ports) {
    // Each task owns one slot; results are merged only after every join.
    std::vector<char> results(ports.size(), 0);
    std::vector<std::thread> workers;
    workers.reserve(ports.size());

    for (size_t i = 0; i < ports.size(); ++i) {
        try {
            workers.emplace_back([&results, &ports, i, timeout = timeout_]() {
                results[i] = is_port_open(ports[i], timeout) ? 1 : 0;
            });
        } catch (const std::system_error& e) {
            // Out of threads: probe inline so the port still gets an answer
            spdlog::warn("probe thread for port {} failed to start: {}", ports[i], e.what());
            results[i] = is_port_open(ports[i], timeout_) ? 1 : 0;
        }
    }

    for (auto& worker : workers) {
        worker.join();
    }

    std::map<uint16_t, bool> open_by_port;
    for (size_t i = 0; i < ports.size(); ++i) {
        open_by_port[ports[i]] = results[i] != 0;
    }
    return open_by_port;
}

} // namespace quay
