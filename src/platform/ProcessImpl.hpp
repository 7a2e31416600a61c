#pragma once
#include "service_control/Process.hpp"

namespace svcctl::process::detail {

    //---fork/execvp/waitpid (ProcessPosix.cpp)
    //   false → процесс не запущен или не дождались, код errno в out.sysError
    bool runPlatform(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt);

} // namespace svcctl::process::detail
