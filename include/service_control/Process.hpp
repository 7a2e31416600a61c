#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace svcctl::process {

    namespace fs = std::filesystem;

    //---Параметры запуска
    struct RunOptions final {
        fs::path workingDir;          // пусто - каталог не меняется
        bool captureOutput = false;   // stdout дочернего процесса → RunResult::output
    };

    //---Итог запуска
    struct RunResult final {
        bool started = false;         // fork/exec прошли
        int exitCode = 0;             // код выхода; 128+N при сигнале N; 127 если exec не удался
        std::uint32_t sysError = 0;   // errno при ошибке запуска
        std::string output;           // захваченный stdout
    };

    //---Блокирующий запуск exe (без '/' ищется в PATH), без таймаута
    //   true - процесс отработал, смотреть exitCode; false - запуск не удался
    bool run(const fs::path& exe, const std::vector<std::string>& args,
        RunResult& out, const RunOptions& opt = {});

    //---Исполнитель нативных команд (подменяется в тестах)
    class ICommandRunner {
    public:
        virtual ~ICommandRunner() = default;

        //---Запустить program с args, собрать stdout в out.output
        virtual bool run(const std::string& program, const std::vector<std::string>& args,
            RunResult& out) = 0;
    };

    //---Реальный исполнитель: fork/exec через process::run
    class SystemCommandRunner final : public ICommandRunner {
    public:
        bool run(const std::string& program, const std::vector<std::string>& args,
            RunResult& out) override;
    };

    //---"program arg1 arg2" - для логов и сообщений об ошибках
    std::string formatCommand(const std::string& program, const std::vector<std::string>& args);

} // namespace svcctl::process
