#include "platform/BackendBase.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace svcctl {

    namespace fs = std::filesystem;

    namespace {

        //---Добавляет кавычки к строке, если она содержит пробелы или кавычки
        static std::string quoteIfNeeded(const std::string& s)
        {
            //---Для ExecStart systemd поддерживает кавычки
            if (s.empty()) return "\"\"";

            bool need = false;
            for (char c : s)
            {
                if (c == ' ' || c == '\t' || c == '"') { need = true; break; }
            }
            if (!need) return s;

            std::string out;
            out.reserve(s.size() + 2);
            out.push_back('"');
            for (char c : s)
            {
                if (c == '"') out += "\\\"";  //---Экранируем кавычки внутри строки
                else out.push_back(c);
            }
            out.push_back('"');
            return out;
        }

        //---Слово командной строки ExecStart: '%' (спецификаторы) и обратный слэш удваиваются, пробелы в кавычках
        static std::string execWord(const std::string& s)
        {
            std::string out;
            out.reserve(s.size());
            for (char c : s)
            {
                if (c == '%' || c == '\\') out.push_back(c);
                out.push_back(c);
            }
            return quoteIfNeeded(out);
        }

        static std::string execWords(const std::vector<std::string>& words)
        {
            std::string out;
            for (const auto& w : words)
            {
                if (!out.empty()) out.push_back(' ');
                out += execWord(w);
            }
            return out;
        }

        const std::string kSystemdTemplate =
            "[Unit]\n"
            "Description={{Description}}\n"
            "Requires={{Dependencies}}\n"
            "After={{Dependencies}}\n"
            "\n"
            "[Service]\n"
            "PIDFile=/var/run/{{Name}}.pid\n"
            "ExecStartPre=/bin/rm -f /var/run/{{Name}}.pid\n"
            "ExecStart={{Command}}\n"
            "Restart=on-failure\n"                 // Перезапускать при ошибках
            "\n"
            "[Install]\n"
            "WantedBy=multi-user.target\n";        // Запускать в multi-user режиме

    } // namespace

    const std::string& systemdTemplate() { return kSystemdTemplate; }

    //---BackendLinuxSystemd - реализация сервисного бэкенда для Linux/systemd
    class BackendLinuxSystemd final : public BackendBase {
    public:
        BackendLinuxSystemd(const ServiceDescriptor& descriptor, BackendConfig config)
            : BackendBase(BackendKind::Systemd, descriptor, std::move(config), kSystemdTemplate)
        {
        }

    protected:
        // системный unit - размещается в /etc/systemd/system/
        fs::path relativeDescriptorPath() const override
        {
            return fs::path("/etc/systemd/system") / unitName();
        }

        //---systemd предупреждает об исполняемых unit-файлах
        mode_t descriptorMode() const override { return 0644; }

        TemplateValues templateValues(const ResolvedExecutable& exe,
            const std::vector<std::string>& args) const override
        {
            TemplateValues v = BackendBase::templateValues(exe, args);
            v["Description"] = toSingleLine(descriptor().description);

            //---Каждое слово ExecStart отдельно: exe и аргументы
            std::string path = execWord(exe.executable.string());
            if (!exe.arguments.empty()) path += " " + execWords(exe.arguments);

            const std::string extra = execWords(args);
            v["Path"] = path;
            v["Args"] = extra;
            v["Command"] = extra.empty() ? path : path + " " + extra;
            return v;
        }

        //--- Перезагрузка конфигурации systemd и включение автозапуска
        bool registerService(ActionResult& result) override
        {
            if (!runNative({ "systemctl", { "daemon-reload" } }, &result.error))
                return false;

            return runNative({ "systemctl", { "enable", unitName() } }, &result.error);
        }

        //---Отключение автозапуска (best-effort)
        void unregisterBeforeRemove(ActionResult& result) override
        {
            runBestEffort({ "systemctl", { "disable", unitName() } }, result);
        }

        //---Перезагрузка конфигурации systemd (важно после удаления файла)
        void unregisterAfterRemove(ActionResult& result) override
        {
            runBestEffort({ "systemctl", { "daemon-reload" } }, result);
        }

        NativeCommand startCommand() const override { return { "systemctl", { "start", unitName() } }; }
        NativeCommand stopCommand() const override { return { "systemctl", { "stop", unitName() } }; }
        NativeCommand statusCommand() const override { return { "systemctl", { "status", unitName() } }; }

        const StatusParser& statusParser() const override { return parser_; }

    private:
        //---Возвращает полное имя unit с расширением .service
        std::string unitName() const { return descriptor().name + ".service"; }

        const StatusParser parser_ = systemdStatusParser();
    };

    //---Фабричная функция для создания экземпляра бэкенда Linux/systemd
    std::unique_ptr<IServiceBackend> makeSystemdBackend(const ServiceDescriptor& descriptor, BackendConfig config)
    {
        return std::make_unique<BackendLinuxSystemd>(descriptor, std::move(config));
    }

} // namespace svcctl
