// command_runner.cpp - fork/exec of external disk utilities with captured output.

#include "system/command_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace winusb {

namespace {

Result MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        const int err = errno;
        return Result::Fail(err, "pipe failed: " + std::string(std::strerror(err)));
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

Result WriteFully(int fd, std::string_view data) {
    while (!data.empty()) {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n > 0) {
            data.remove_prefix(static_cast<size_t>(n));
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        const int err = errno;
        return Result::Fail(err, "write to child stdin failed: " + std::string(std::strerror(err)));
    }
    return Result::Ok();
}

int ExitCodeFromStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

class PosixCommandRunner final : public ICommandRunner {
  public:
    Result Run(const std::vector<std::string>& argv,
               std::string_view stdin_data,
               CommandOutput& out) const override {
        out = CommandOutput{};
        if (argv.empty()) return Result::Fail(EINVAL, "empty command");

        Fd in_read, in_write, out_read, out_write;
        if (auto r = MakePipe(in_read, in_write); !r.is_ok()) return r;
        if (auto r = MakePipe(out_read, out_write); !r.is_ok()) return r;

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        LogDebug("exec: %s", JoinCommand(argv).c_str());

        const pid_t pid = ::fork();
        if (pid < 0) {
            const int err = errno;
            return Result::Fail(err, "fork failed: " + std::string(std::strerror(err)));
        }

        if (pid == 0) {
            ::dup2(in_read.Get(), STDIN_FILENO);
            ::dup2(out_write.Get(), STDOUT_FILENO);
            ::dup2(out_write.Get(), STDERR_FILENO);
            ::execvp(args[0], args.data());
            const char msg[] = "exec failed\n";
            (void)!::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            ::_exit(127);
        }

        in_read.Close();
        out_write.Close();

        // SIGPIPE from a child that exits without reading stdin must not kill us.
        struct sigaction ignore{}, previous{};
        ignore.sa_handler = SIG_IGN;
        ::sigaction(SIGPIPE, &ignore, &previous);
        Result write_result = WriteFully(in_write.Get(), stdin_data);
        ::sigaction(SIGPIPE, &previous, nullptr);
        in_write.Close();
        if (!write_result.is_ok()) {
            LogDebug("%s", write_result.msg.c_str());
        }

        char buf[4096];
        while (true) {
            const ssize_t n = ::read(out_read.Get(), buf, sizeof(buf));
            if (n > 0) {
                out.output.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n == -1 && errno == EINTR) continue;
            break;
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                const int err = errno;
                return Result::Fail(err, "waitpid failed: " + std::string(std::strerror(err)));
            }
        }

        out.exit_code = ExitCodeFromStatus(status);
        LogDebug("exit %d: %s", out.exit_code, argv[0].c_str());
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const ICommandRunner> DefaultCommandRunner() {
    static const std::shared_ptr<const ICommandRunner> kDefault =
        std::make_shared<PosixCommandRunner>();
    return kDefault;
}

std::string JoinCommand(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

} // namespace winusb
