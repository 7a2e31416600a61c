#include "service_control/Process.hpp"
#include "platform/ProcessImpl.hpp"

#include <sstream>

#include <glog/logging.h>

namespace svcctl::process {

    //---Запуск процесса: делегирует платформенной реализации
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt)
    {
        return detail::runPlatform(exe, args, out, opt);
    }

    //---Реальный запуск нативной команды с захватом stdout
    bool SystemCommandRunner::run(const std::string& program, const std::vector<std::string>& args,
        RunResult& out)
    {
        VLOG(1) << "exec: " << formatCommand(program, args);

        RunOptions opt;
        opt.captureOutput = true;
        return process::run(fs::path(program), args, out, opt);
    }

    std::string formatCommand(const std::string& program, const std::vector<std::string>& args)
    {
        std::ostringstream os;
        os << program;
        for (const auto& a : args) os << ' ' << a;
        return os.str();
    }

} // namespace svcctl::process
