#include "platform/BackendBase.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace svcctl {

    namespace fs = std::filesystem;

    namespace {

        const std::string kUpstartTemplate =
            "# {{Name}} {{Description}}\n"
            "\n"
            "description     \"{{Description}}\"\n"
            "\n"
            "start on runlevel [2345]\n"
            "stop on runlevel [016]\n"
            "\n"
            "respawn\n"
            "#kill timeout 5\n"
            "\n"
            "exec {{Command}} >> /var/log/{{Name}}.log 2>> /var/log/{{Name}}.err\n";

    } // namespace

    const std::string& upstartTemplate() { return kUpstartTemplate; }

    //---BackendLinuxUpstart - задание upstart в /etc/init, управление start/stop/status
    class BackendLinuxUpstart final : public BackendBase {
    public:
        BackendLinuxUpstart(const ServiceDescriptor& descriptor, BackendConfig config)
            : BackendBase(BackendKind::Upstart, descriptor, std::move(config), kUpstartTemplate),
              parser_(upstartStatusParser(descriptor.name))
        {
        }

    protected:
        fs::path relativeDescriptorPath() const override
        {
            return fs::path("/etc/init") / (descriptor().name + ".conf");
        }

        //---Описание: комментарий и строка description "..."
        TemplateValues templateValues(const ResolvedExecutable& exe,
            const std::vector<std::string>& args) const override
        {
            TemplateValues v = BackendBase::templateValues(exe, args);
            v["Description"] = escapeShellQuoted(toSingleLine(descriptor().description));
            return v;
        }

        NativeCommand startCommand() const override { return { "start", { descriptor().name } }; }
        NativeCommand stopCommand() const override { return { "stop", { descriptor().name } }; }
        NativeCommand statusCommand() const override { return { "status", { descriptor().name } }; }

        const StatusParser& statusParser() const override { return parser_; }

    private:
        const StatusParser parser_;
    };

    std::unique_ptr<IServiceBackend> makeUpstartBackend(const ServiceDescriptor& descriptor, BackendConfig config)
    {
        return std::make_unique<BackendLinuxUpstart>(descriptor, std::move(config));
    }

} // namespace svcctl
