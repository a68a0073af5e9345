#ifndef EPOLL_LOOP_HPP
#define EPOLL_LOOP_HPP

#include <functional>
#include <vector>
#include <sys/epoll.h>

// Single-threaded loop that runs periodic callbacks from timerfds.
class EpollLoop {
public:
    using TimerCallback = std::function<void()>;

    EpollLoop();
    ~EpollLoop();

    EpollLoop(const EpollLoop&) = delete;
    EpollLoop& operator=(const EpollLoop&) = delete;

    bool initialize();
    void cleanup();

    // Returns the timer fd, or -1 on failure
    int add_timer(int interval_ms, TimerCallback callback);

    // Runs due callbacks; 0 on timeout or EINTR, -1 on error
    int run_once(int timeout_ms = 250);

private:
    struct Timer {
        int fd;
        int interval_ms;
        TimerCallback callback;
    };

    int epoll_fd;
    std::vector<Timer> timers;

    void handle_timer(Timer& timer);
};

#endif // EPOLL_LOOP_HPP
