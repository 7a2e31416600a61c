#include "platform/BackendBase.hpp"
#include "service_control/Platform.hpp"
#include "service_control/Privileges.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

#include <glog/logging.h>

namespace svcctl {

    namespace {

        const char* const kOk = "\t\t\t\t\t[  OK  ]";
        const char* const kFailed = "\t\t\t\t\t[FAILED]";

        //---Закрывает дескриптор файла на любом пути выхода
        struct FileGuard final {
            int fd = -1;
            ~FileGuard() { if (fd >= 0) ::close(fd); }

            //---Явное закрытие с проверкой ошибки
            int close()
            {
                const int rc = ::close(fd);
                fd = -1;
                return rc;
            }
        };

        static std::string errnoText(const std::string& what, const fs::path& p, int err)
        {
            std::ostringstream os;
            os << what << " " << p.string() << ": " << std::strerror(err);
            return os.str();
        }

    } // namespace

    //---Проверка корректности имени службы
    bool isValidServiceName(const std::string& name)
    {
        //---Имя попадает в пути и shell-скрипты: без пробелов и слэшей
        if (name.empty() || name == "." || name == "..") return false;

        for (char c : name)
        {
            const bool ok =
                (c >= 'a' && c <= 'z') ||
                (c >= 'A' && c <= 'Z') ||
                (c >= '0' && c <= '9') ||
                c == '_' || c == '.' || c == '-' || c == '@';
            if (!ok) return false;
        }
        return true;
    }

    BackendBase::BackendBase(BackendKind kind, const ServiceDescriptor& descriptor,
        BackendConfig config, const std::string& defaultTemplate)
        : kind_(kind),
          descriptor_(descriptor),
          config_(std::move(config)),
          template_(config_.templateText.empty() ? defaultTemplate : config_.templateText),
          runner_(config_.runner)
    {
        if (!runner_) runner_ = std::make_shared<process::SystemCommandRunner>();
    }

    fs::path BackendBase::rooted(const fs::path& absolute) const
    {
        return config_.rootDir / absolute.relative_path();
    }

    fs::path BackendBase::descriptorPath() const
    {
        return rooted(relativeDescriptorPath());
    }

    bool BackendBase::isInstalled() const
    {
        std::error_code ec;
        return fs::exists(fs::symlink_status(descriptorPath(), ec));
    }

    //---Значения подстановок по умолчанию
    TemplateValues BackendBase::templateValues(const ResolvedExecutable& exe,
        const std::vector<std::string>& args) const
    {
        std::vector<std::string> all = exe.arguments;
        all.insert(all.end(), args.begin(), args.end());

        std::string programArguments;
        for (const auto& a : all)
            programArguments += "\t\t<string>" + escapeXml(a) + "</string>\n";

        const std::string joinedArgs = joinStrings(args, " ");

        TemplateValues v;
        v["Name"] = descriptor_.name;
        v["Description"] = descriptor_.description;
        v["Dependencies"] = joinStrings(descriptor_.dependencies, " ");
        v["Path"] = exe.commandLine;
        v["Args"] = joinedArgs;
        v["Command"] = joinedArgs.empty() ? exe.commandLine : exe.commandLine + " " + joinedArgs;
        v["Executable"] = exe.executable.string();
        v["Arguments"] = joinStrings(all, " ");
        v["ProgramArguments"] = programArguments;
        return v;
    }

    //---Отрисовка дескриптора: путь exe + шаблон
    bool BackendBase::renderDescriptor(const std::vector<std::string>& args,
        std::string& out, ServiceError* error) const
    {
        ResolvedExecutable exe;
        std::string err;
        if (!resolveExecutable(descriptor_, config_.searchPath, exe, &err))
        {
            if (error) *error = makeError(ErrorCode::IoError, err);
            return false;
        }

        if (!renderTemplate(template_, templateValues(exe, args), out, &err))
        {
            if (error) *error = makeError(ErrorCode::TemplateError, err);
            return false;
        }
        return true;
    }

    //---Создание файла дескриптора (O_EXCL: параллельная установка получит ошибку)
    bool BackendBase::writeDescriptorFile(const std::string& text, ServiceError* error) const
    {
        const fs::path p = descriptorPath();

        std::error_code ec;
        //---Создаем директорию, если она не существует; ошибка не фатальна, попробуем писать
        fs::create_directories(p.parent_path(), ec);

        FileGuard f;
        f.fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, descriptorMode());
        if (f.fd < 0)
        {
            if (error) *error = makeError(ErrorCode::IoError, errnoText("Failed to create", p, errno));
            return false;
        }

        //---Файл создан нами: при любой ошибке ниже удаляем, чтобы не остаться "установленными"
        auto fail = [&](const char* what, int err) {
            if (error) *error = makeError(ErrorCode::IoError, errnoText(what, p, err));
            if (f.fd >= 0) f.close();
            std::error_code rmEc;
            fs::remove(p, rmEc);
            return false;
        };

        const char* data = text.data();
        size_t left = text.size();
        while (left > 0)
        {
            const ssize_t n = ::write(f.fd, data, left);
            if (n < 0)
            {
                if (errno == EINTR) continue;
                return fail("Failed to write", errno);
            }
            data += n;
            left -= (size_t)n;
        }

        //---umask мог урезать права при создании
        if (::fchmod(f.fd, descriptorMode()) != 0)
            return fail("Failed to chmod", errno);

        if (f.close() != 0)
            return fail("Failed to close", errno);

        return true;
    }

    bool BackendBase::runNative(const NativeCommand& cmd, ServiceError* error)
    {
        const std::string line = process::formatCommand(cmd.program, cmd.args);
        LOG(INFO) << "run: " << line;

        process::RunResult rr;
        const bool ok = runner_->run(cmd.program, cmd.args, rr);
        if (!ok || !rr.started)
        {
            if (error)
            {
                std::ostringstream os;
                os << line << ": failed to start. sysError=" << rr.sysError;
                *error = makeError(ErrorCode::CommandFailed, os.str());
            }
            return false;
        }

        if (rr.exitCode != 0)
        {
            if (error)
            {
                std::ostringstream os;
                os << line << ": exitCode=" << rr.exitCode;
                *error = makeError(ErrorCode::CommandFailed, os.str());
            }
            return false;
        }
        return true;
    }

    void BackendBase::runBestEffort(const NativeCommand& cmd, ActionResult& result)
    {
        ServiceError err;
        if (!runNative(cmd, &err)) addWarning(result, err.detail);
    }

    void BackendBase::addWarning(ActionResult& result, std::string text)
    {
        LOG(WARNING) << text;
        result.warnings.push_back(std::move(text));
    }

    //---Состояние: ошибка команды = остановлена
    RuntimeStatus BackendBase::queryStatus()
    {
        const NativeCommand cmd = statusCommand();

        process::RunResult rr;
        const bool ok = runner_->run(cmd.program, cmd.args, rr);
        if (!ok || !rr.started || rr.exitCode != 0) return {};

        return statusParser().parse(rr.output);
    }

    bool BackendBase::passGate(ActionResult& result, const std::string& action)
    {
        ServiceError err = checkPrivileges(*runner_);
        if (!err.ok())
        {
            result = failure(action, std::move(err));
            return false;
        }

        if (!isValidServiceName(descriptor_.name))
        {
            result = failure(action, makeError(ErrorCode::InvalidArgument));
            return false;
        }
        return true;
    }

    ActionResult BackendBase::failure(const std::string& action, ServiceError error) const
    {
        ActionResult r;
        r.error = std::move(error);
        return failure(action, std::move(r));
    }

    ActionResult BackendBase::failure(const std::string& action, ActionResult result) const
    {
        result.message = action + kFailed;
        return result;
    }

    ActionResult BackendBase::success(const std::string& action, ActionResult result) const
    {
        result.message = action + kOk;
        result.error = {};
        return result;
    }

    //---Установка службы
    ActionResult BackendBase::install(const std::vector<std::string>& args)
    {
        const std::string action = "Install " + descriptor_.description + ":";

        ActionResult r;
        if (!passGate(r, action)) return r;

        if (isInstalled()) return failure(action, makeError(ErrorCode::AlreadyInstalled));

        //--- 1) Путь к exe и текст дескриптора
        std::string text;
        if (!renderDescriptor(args, text, &r.error)) return failure(action, std::move(r));

        //--- 2) Запись дескриптора
        if (!writeDescriptorFile(text, &r.error)) return failure(action, std::move(r));

        //--- 3) Регистрация в нативном менеджере
        if (!registerService(r))
        {
            //---Незарегистрированный дескриптор не должен выглядеть установленным
            std::error_code ec;
            fs::remove(descriptorPath(), ec);
            if (ec) addWarning(r, "Failed to remove " + descriptorPath().string() + ": " + ec.message());
            return failure(action, std::move(r));
        }

        LOG(INFO) << "installed " << descriptor_.name << " (" << toString(kind_) << "): "
                  << descriptorPath().string();
        return success(action, std::move(r));
    }

    //---Удаление службы (работающую тоже можно удалить)
    ActionResult BackendBase::remove()
    {
        const std::string action = "Removing " + descriptor_.description + ":";

        ActionResult r;
        if (!passGate(r, action)) return r;

        if (!isInstalled()) return failure(action, makeError(ErrorCode::NotInstalled));

        unregisterBeforeRemove(r);

        std::error_code ec;
        fs::remove(descriptorPath(), ec);
        if (ec)
        {
            r.error = makeError(ErrorCode::IoError,
                "Failed to remove " + descriptorPath().string() + ": " + ec.message());
            return failure(action, std::move(r));
        }

        unregisterAfterRemove(r);

        LOG(INFO) << "removed " << descriptor_.name << " (" << toString(kind_) << ")";
        return success(action, std::move(r));
    }

    //---Запуск службы
    ActionResult BackendBase::start()
    {
        const std::string action = "Starting " + descriptor_.description + ":";

        ActionResult r;
        if (!passGate(r, action)) return r;

        if (!isInstalled()) return failure(action, makeError(ErrorCode::NotInstalled));

        r.runtime = queryStatus();
        if (r.runtime->running)
        {
            r.error = makeError(ErrorCode::AlreadyRunning);
            return failure(action, std::move(r));
        }

        if (!runNative(startCommand(), &r.error)) return failure(action, std::move(r));

        return success(action, std::move(r));
    }

    //---Остановка службы
    ActionResult BackendBase::stop()
    {
        const std::string action = "Stopping " + descriptor_.description + ":";

        ActionResult r;
        if (!passGate(r, action)) return r;

        if (!isInstalled()) return failure(action, makeError(ErrorCode::NotInstalled));

        r.runtime = queryStatus();
        if (!r.runtime->running)
        {
            r.error = makeError(ErrorCode::AlreadyStopped);
            return failure(action, std::move(r));
        }

        if (!runNative(stopCommand(), &r.error)) return failure(action, std::move(r));

        return success(action, std::move(r));
    }

    //---Состояние службы
    ActionResult BackendBase::status()
    {
        ActionResult r;
        if (!passGate(r, "Status:")) return r;

        if (!isInstalled())
        {
            r.error = makeError(ErrorCode::NotInstalled);
            r.message = "Status could not be determined";
            return r;
        }

        r.runtime = queryStatus();
        r.message = r.runtime->describe();
        return r;
    }

    //---Запуск полезной нагрузки
    ActionResult BackendBase::run(IExecutable& payload)
    {
        ActionResult r;
        payload.run();
        r.message = "Running " + descriptor_.description + ": completed.";
        return r;
    }

} // namespace svcctl
