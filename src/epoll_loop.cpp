#include "epoll_loop.hpp"
#include "bindings.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <sys/timerfd.h>
#include <unistd.h>

EpollLoop::EpollLoop() : epoll_fd(-1) {
}

EpollLoop::~EpollLoop() {
    cleanup();
}

bool EpollLoop::initialize() {
    if (epoll_fd >= 0) {
        return true;
    }
    epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd < 0) {
        perror("Failed to create epoll");
        return false;
    }
    return true;
}

void EpollLoop::cleanup() {
    for (auto& timer : timers) {
        if (timer.fd >= 0) {
            close(timer.fd);
        }
    }
    timers.clear();
    if (epoll_fd >= 0) {
        close(epoll_fd);
        epoll_fd = -1;
    }
}

int EpollLoop::add_timer(int interval_ms, TimerCallback callback) {
    if (epoll_fd < 0 || interval_ms <= 0) {
        return -1;
    }

    int fd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        perror("Failed to create timerfd");
        return -1;
    }

    struct itimerspec spec;
    memset(&spec, 0, sizeof(spec));
    spec.it_interval.tv_sec = interval_ms / 1000;
    spec.it_interval.tv_nsec = static_cast<long>(interval_ms % 1000) * 1000000L;
    spec.it_value = spec.it_interval;
    if (timerfd_settime(fd, 0, &spec, nullptr) < 0) {
        perror("Failed to arm timerfd");
        close(fd);
        return -1;
    }

    struct epoll_event event;
    memset(&event, 0, sizeof(event));
    event.events = EPOLLIN;
    event.data.fd = fd;
    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &event) < 0) {
        perror("Failed to add timer to epoll");
        close(fd);
        return -1;
    }

    timers.push_back(Timer{fd, interval_ms, std::move(callback)});
    return fd;
}

int EpollLoop::run_once(int timeout_ms) {
    if (epoll_fd < 0) {
        return -1;
    }

    struct epoll_event events[8];
    int nfds = epoll_wait(epoll_fd, events, 8, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) return 0;
        perror("epoll_wait failed");
        return -1;
    }

    for (int i = 0; i < nfds; i++) {
        for (auto& timer : timers) {
            if (timer.fd == events[i].data.fd) {
                handle_timer(timer);
                break;
            }
        }
    }

    return nfds;
}

void EpollLoop::handle_timer(Timer& timer) {
    uint64_t expirations = 0;
    ssize_t n = read(timer.fd, &expirations, sizeof(expirations));
    if (n != sizeof(expirations)) {
        if (n < 0 && errno != EAGAIN) {
            perror("Failed to read timerfd");
        }
        return;
    }

    // Missed periods are coalesced into one callback
    if (expirations > 1) {
        DEBUG_LOG("[loop] %dms timer overran by %llu period(s)\n", timer.interval_ms,
                  static_cast<unsigned long long>(expirations - 1));
    }
    if (timer.callback) {
        timer.callback();
    }
}
