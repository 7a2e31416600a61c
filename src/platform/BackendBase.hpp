#pragma once
#include "service_control/BackendConfig.hpp"
#include "service_control/IServiceBackend.hpp"
#include "service_control/Paths.hpp"
#include "service_control/Process.hpp"
#include "service_control/StatusParser.hpp"
#include "service_control/TemplateRenderer.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace svcctl {

    namespace fs = std::filesystem;

    //---Нативная команда: программа + аргументы
    struct NativeCommand final {
        std::string program;
        std::vector<std::string> args;
    };

    //---Общая машина состояний для всех бэкэндов
    //   Наследники задают путь дескриптора, шаблон, команды и парсер статуса
    class BackendBase : public IServiceBackend {
    public:
        BackendBase(BackendKind kind, const ServiceDescriptor& descriptor,
            BackendConfig config, const std::string& defaultTemplate);

        BackendKind kind() const override { return kind_; }
        const ServiceDescriptor& descriptor() const override { return descriptor_; }

        fs::path descriptorPath() const override;
        bool isInstalled() const override;

        const std::string& templateText() const override { return template_; }

        bool renderDescriptor(const std::vector<std::string>& args,
            std::string& out, ServiceError* error) const override;

        ActionResult install(const std::vector<std::string>& args) override;
        ActionResult remove() override;
        ActionResult start() override;
        ActionResult stop() override;
        ActionResult status() override;
        ActionResult run(IExecutable& payload) override;

    protected:
        //---Путь дескриптора относительно корня ("/etc/init.d/<name>")
        virtual fs::path relativeDescriptorPath() const = 0;

        //---Права на файл дескриптора
        virtual mode_t descriptorMode() const { return 0755; }

        //---Значения подстановок шаблона
        virtual TemplateValues templateValues(const ResolvedExecutable& exe,
            const std::vector<std::string>& args) const;

        //---Регистрация после записи дескриптора. false → ошибка в result.error
        virtual bool registerService(ActionResult& result) { (void)result; return true; }

        //---Отмена регистрации (best-effort) до и после удаления дескриптора
        virtual void unregisterBeforeRemove(ActionResult& result) { (void)result; }
        virtual void unregisterAfterRemove(ActionResult& result) { (void)result; }

        virtual NativeCommand startCommand() const = 0;
        virtual NativeCommand stopCommand() const = 0;
        virtual NativeCommand statusCommand() const = 0;
        virtual const StatusParser& statusParser() const = 0;

        //---Путь от корня конфигурации: rootDir / "etc/..."
        fs::path rooted(const fs::path& absolute) const;

        //---Запуск команды; exitCode != 0 или ошибка запуска → CommandFailed
        bool runNative(const NativeCommand& cmd, ServiceError* error);

        //---Запуск команды без фатальной ошибки, неудача → предупреждение
        void runBestEffort(const NativeCommand& cmd, ActionResult& result);

        //---Предупреждение best-effort шага: в результат и в лог
        static void addWarning(ActionResult& result, std::string text);

        //---Текущее состояние службы (без кеширования)
        RuntimeStatus queryStatus();

        const BackendConfig& config() const { return config_; }

    private:
        //---Проверка прав и имени; false → result заполнен ошибкой
        bool passGate(ActionResult& result, const std::string& action);

        bool writeDescriptorFile(const std::string& text, ServiceError* error) const;

        ActionResult failure(const std::string& action, ServiceError error) const;
        ActionResult failure(const std::string& action, ActionResult result) const;
        ActionResult success(const std::string& action, ActionResult result) const;

        const BackendKind kind_;
        const ServiceDescriptor descriptor_;
        const BackendConfig config_;
        const std::string template_;
        std::shared_ptr<process::ICommandRunner> runner_;
    };

    //---Проверка корректности имени службы
    //   разрешенные символы: A-Z, a-z, 0-9, '_', '.', '-', '@'
    bool isValidServiceName(const std::string& name);

    //---rc.conf: есть незакомментированная строка <name>_enable="YES"
    bool isRcdServiceEnabled(const std::string& rcConf, const std::string& name);

    //---Фабрики бэкэндов (по одной на файл реализации)
    std::unique_ptr<IServiceBackend> makeSystemdBackend(const ServiceDescriptor& descriptor, BackendConfig config);
    std::unique_ptr<IServiceBackend> makeUpstartBackend(const ServiceDescriptor& descriptor, BackendConfig config);
    std::unique_ptr<IServiceBackend> makeSysVBackend(const ServiceDescriptor& descriptor, BackendConfig config);
    std::unique_ptr<IServiceBackend> makeLaunchdBackend(const ServiceDescriptor& descriptor, BackendConfig config);
    std::unique_ptr<IServiceBackend> makeBsdRcdBackend(const ServiceDescriptor& descriptor, BackendConfig config);

    //---Шаблоны по умолчанию
    const std::string& systemdTemplate();
    const std::string& upstartTemplate();
    const std::string& sysvTemplate();
    const std::string& launchdTemplate();
    const std::string& bsdRcdTemplate();

} // namespace svcctl
