#include "platform/ProcessImpl.hpp"
#include <errno.h>
#include <sys/wait.h>
#include <unistd.h>

namespace svcctl::process::detail {

    namespace {

        //---Закрывает дескриптор при выходе из области видимости
        struct FdGuard final {
            int fd = -1;
            ~FdGuard() { if (fd >= 0) ::close(fd); }
            void reset() { if (fd >= 0) ::close(fd); fd = -1; }
        };

        //---Чтение всего вывода из канала до EOF
        static void drainPipe(int fd, std::string& out)
        {
            char buf[4096];
            for (;;)
            {
                const ssize_t n = ::read(fd, buf, sizeof(buf));
                if (n > 0) { out.append(buf, (size_t)n); continue; }
                if (n < 0 && errno == EINTR) continue;
                break;
            }
        }

    } // namespace

	//---Платформенно-специфичная реализация запуска процесса для POSIX
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        out = {};

        FdGuard readEnd;
        FdGuard writeEnd;
        if (opt.captureOutput)
        {
            int fds[2];
            if (::pipe(fds) != 0)
            {
                out.sysError = (std::uint32_t)errno;
                out.exitCode = (int)out.sysError;
                return false;
            }
            readEnd.fd = fds[0];
            writeEnd.fd = fds[1];
        }

        //---argv готовим до fork: в дочернем процессе только exec
        std::vector<std::string> argvStorage;
        argvStorage.reserve(args.size() + 1);
        argvStorage.push_back(exe.string());
        argvStorage.insert(argvStorage.end(), args.begin(), args.end());

        std::vector<char*> argv;
        argv.reserve(argvStorage.size() + 1);
        for (auto& s : argvStorage) argv.push_back(s.data());
        argv.push_back(nullptr);

        pid_t pid = fork();
        if (pid < 0)
        {
            out.started = false;
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            return false;
        }

        if (pid == 0)
        {
            if (!opt.workingDir.empty())
                (void)chdir(opt.workingDir.c_str());

            if (opt.captureOutput)
            {
                (void)dup2(writeEnd.fd, STDOUT_FILENO);
                ::close(writeEnd.fd);
                ::close(readEnd.fd);
            }

            execvp(argv[0], argv.data());
            _exit(127); // exec failed
        }

        out.started = true;

        if (opt.captureOutput)
        {
            writeEnd.reset();
            drainPipe(readEnd.fd, out.output);
        }

        int status = 0;
        pid_t w;
        do
        {
            w = waitpid(pid, &status, 0);
        } while (w < 0 && errno == EINTR);

        if (w < 0)
        {
            out.sysError = (std::uint32_t)errno;
            out.exitCode = (int)out.sysError;
            return false;
        }

        if (WIFEXITED(status))
            out.exitCode = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            out.exitCode = 128 + WTERMSIG(status);
        else
            out.exitCode = 1;

        return true;
    }

} // namespace svcctl::process::detail
