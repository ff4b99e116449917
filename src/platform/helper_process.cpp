#include "platform/helper_process.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace {
constexpr size_t kMaxTailLines = 64;
constexpr std::chrono::milliseconds kTeardownGrace{2000};

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags != -1) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}
}

HelperProcess::HelperProcess(const std::vector<std::string>& argv, const LineSlot& on_line,
                             const ExitSlot& on_exit)
    : m_on_line(on_line), m_on_exit(on_exit) {
    Glib::spawn_async_with_pipes("", argv,
                                 Glib::SpawnFlags::DO_NOT_REAP_CHILD | Glib::SpawnFlags::SEARCH_PATH,
                                 {}, &m_pid, nullptr, &m_stdout_fd, &m_stderr_fd);
    m_running = true;

    set_nonblocking(m_stdout_fd);
    set_nonblocking(m_stderr_fd);

    const auto conditions = Glib::IOCondition::IO_IN | Glib::IOCondition::IO_HUP |
                            Glib::IOCondition::IO_ERR;
    const int stdout_fd = m_stdout_fd;
    const int stderr_fd = m_stderr_fd;
    m_stdout_watch = Glib::signal_io().connect(
        [this, stdout_fd](Glib::IOCondition condition) { return on_output(condition, stdout_fd); },
        stdout_fd, conditions);
    m_stderr_watch = Glib::signal_io().connect(
        [this, stderr_fd](Glib::IOCondition condition) { return on_output(condition, stderr_fd); },
        stderr_fd, conditions);
    m_child_watch = Glib::signal_child_watch().connect(
        sigc::mem_fun(*this, &HelperProcess::on_child_exit), m_pid);
}

HelperProcess::~HelperProcess() {
    m_stdout_watch.disconnect();
    m_stderr_watch.disconnect();
    m_child_watch.disconnect();

    if (m_running) {
        if (!send_signal(SIGTERM)) {
            // Elevated children reject our signals; waiting would only block.
            std::cerr << "Warning: could not terminate helper process " << m_pid << '\n';
        } else if (!wait_for_exit(kTeardownGrace) && send_signal(SIGKILL)) {
            wait_for_exit(kTeardownGrace);
        }
    }

    close_pipes();
}

bool HelperProcess::send_signal(int signo) const {
    if (!m_running || m_pid <= 0) {
        return false;
    }
    return ::kill(m_pid, signo) == 0;
}

void HelperProcess::detach() {
    m_on_line = LineSlot();
    m_on_exit = ExitSlot();
}

bool HelperProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    if (!m_running) {
        return true;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        pid_t result = ::waitpid(m_pid, &status, WNOHANG);
        if (result == m_pid || (result == -1 && errno == ECHILD)) {
            m_running = false;
            m_wait_status = status;
            Glib::spawn_close_pid(m_pid);
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        g_usleep(50 * 1000);
    }
}

std::string HelperProcess::output_tail() const {
    std::string text;
    for (const auto& line : m_tail) {
        text += line;
        text += '\n';
    }
    return text;
}

bool HelperProcess::exited_normally(int wait_status) {
    return WIFEXITED(wait_status);
}

int HelperProcess::exit_code(int wait_status) {
    if (WIFEXITED(wait_status)) {
        return WEXITSTATUS(wait_status);
    }
    if (WIFSIGNALED(wait_status)) {
        return 128 + WTERMSIG(wait_status);
    }
    return -1;
}

bool HelperProcess::on_output(Glib::IOCondition, int fd) {
    std::string& partial = (fd == m_stdout_fd) ? m_stdout_partial : m_stderr_partial;
    if (consume(fd, partial)) {
        return true;
    }

    if (!partial.empty()) {
        emit_line(std::move(partial));
        partial.clear();
    }
    return false;
}

void HelperProcess::on_child_exit(Glib::Pid pid, int wait_status) {
    if (m_stdout_fd != -1) {
        consume(m_stdout_fd, m_stdout_partial);
    }
    if (m_stderr_fd != -1) {
        consume(m_stderr_fd, m_stderr_partial);
    }
    if (!m_stdout_partial.empty()) {
        emit_line(std::move(m_stdout_partial));
        m_stdout_partial.clear();
    }
    if (!m_stderr_partial.empty()) {
        emit_line(std::move(m_stderr_partial));
        m_stderr_partial.clear();
    }

    m_stdout_watch.disconnect();
    m_stderr_watch.disconnect();
    close_pipes();

    Glib::spawn_close_pid(pid);
    m_running = false;
    m_wait_status = wait_status;

    // The exit slot may destroy this object; nothing may follow it.
    ExitSlot on_exit = m_on_exit;
    if (on_exit) {
        on_exit(wait_status);
    }
}

bool HelperProcess::consume(int fd, std::string& partial) {
    char buffer[4096];
    while (true) {
        ssize_t count = ::read(fd, buffer, sizeof(buffer));
        if (count > 0) {
            partial.append(buffer, static_cast<size_t>(count));
            size_t newline;
            while ((newline = partial.find('\n')) != std::string::npos) {
                std::string line = partial.substr(0, newline);
                partial.erase(0, newline + 1);
                emit_line(std::move(line));
            }
            continue;
        }
        if (count == -1 && errno == EINTR) {
            continue;
        }
        if (count == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        // EOF or a read error: the pipe is done.
        return false;
    }
}

void HelperProcess::emit_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    m_tail.push_back(line);
    while (m_tail.size() > kMaxTailLines) {
        m_tail.pop_front();
    }

    if (m_on_line) {
        m_on_line(line);
    }
}

void HelperProcess::close_pipes() {
    if (m_stdout_fd != -1) {
        ::close(m_stdout_fd);
        m_stdout_fd = -1;
    }
    if (m_stderr_fd != -1) {
        ::close(m_stderr_fd);
        m_stderr_fd = -1;
    }
}
