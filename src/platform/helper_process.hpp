#ifndef HELPER_PROCESS_HPP
#define HELPER_PROCESS_HPP

#include <glibmm.h>

#include <chrono>
#include <deque>
#include <string>
#include <vector>

// Owns one child process spawned with stdout/stderr pipes. Output lines and the
// exit status are delivered from the default GLib main context.
class HelperProcess {
public:
    using LineSlot = sigc::slot<void(const std::string&)>;
    using ExitSlot = sigc::slot<void(int)>;

    // Throws Glib::SpawnError when argv cannot be executed.
    HelperProcess(const std::vector<std::string>& argv, const LineSlot& on_line,
                  const ExitSlot& on_exit);
    ~HelperProcess();

    HelperProcess(const HelperProcess&) = delete;
    HelperProcess& operator=(const HelperProcess&) = delete;

    Glib::Pid pid() const { return m_pid; }
    bool running() const { return m_running; }
    int wait_status() const { return m_wait_status; }

    bool send_signal(int signo) const;
    // Drops the line and exit slots; the child is still reaped on exit.
    void detach();
    // Blocking reap, only for teardown outside the main loop's control.
    bool wait_for_exit(std::chrono::milliseconds timeout);

    std::string output_tail() const;

    static bool exited_normally(int wait_status);
    static int exit_code(int wait_status);

private:
    bool on_output(Glib::IOCondition condition, int fd);
    void on_child_exit(Glib::Pid pid, int wait_status);
    bool consume(int fd, std::string& partial);
    void emit_line(std::string line);
    void close_pipes();

    Glib::Pid m_pid = 0;
    bool m_running = false;
    int m_wait_status = 0;
    int m_stdout_fd = -1;
    int m_stderr_fd = -1;
    std::string m_stdout_partial;
    std::string m_stderr_partial;
    std::deque<std::string> m_tail;

    sigc::connection m_stdout_watch;
    sigc::connection m_stderr_watch;
    sigc::connection m_child_watch;
    LineSlot m_on_line;
    ExitSlot m_on_exit;
};

#endif
