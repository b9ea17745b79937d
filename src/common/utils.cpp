#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>
#include <thread>

namespace autograder {
using namespace std;

static int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    else
        return -1;
}

process_result exec_program(const char **argv, const filesystem::path &output, chrono::milliseconds timeout) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0:  // 子进程
            // 子进程自成一个进程组，超时时连同编译器派生的子进程（cc1plus、ld）一起终止
            setpgid(0, 0);
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            if (!output.empty()) {
                int fd = open(output.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
                if (fd < 0) _exit(EXIT_FAILURE);
                dup2(fd, STDOUT_FILENO);
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        default:  // 父进程
            break;
    }

    process_result result;
    int status;
    if (timeout == chrono::milliseconds::zero()) {
        if (waitpid(pid, &status, 0) < 0)
            throw system_error(errno, system_category(), "unable to wait for child process");
        result.exit_code = decode_status(status);
        return result;
    }

    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            result.exit_code = decode_status(status);
            return result;
        }
        if (ret < 0)
            throw system_error(errno, system_category(), "unable to wait for child process");

        if (chrono::steady_clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.timed_out = true;
            result.exit_code = -1;
            return result;
        }
        this_thread::sleep_for(chrono::milliseconds(10));  // 10ms，避免忙等
    }
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace autograder
