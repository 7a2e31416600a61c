#include "platform/BackendBase.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace svcctl {

    namespace fs = std::filesystem;

    namespace {

        const std::string kLaunchdTemplate = R"XML(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE plist PUBLIC "-//Apple//DTD PLIST 1.0//EN" "http://www.apple.com/DTDs/PropertyList-1.0.dtd">
<plist version="1.0">
<dict>
	<key>KeepAlive</key>
	<true/>
	<key>Label</key>
	<string>{{Name}}</string>
	<key>ProgramArguments</key>
	<array>
		<string>{{Executable}}</string>
{{ProgramArguments}}	</array>
	<key>RunAtLoad</key>
	<true/>
	<key>WorkingDirectory</key>
	<string>/usr/local/var</string>
	<key>StandardErrorPath</key>
	<string>/usr/local/var/log/{{Name}}.err</string>
	<key>StandardOutPath</key>
	<string>/usr/local/var/log/{{Name}}.log</string>
</dict>
</plist>
)XML";

    } // namespace

    const std::string& launchdTemplate() { return kLaunchdTemplate; }

    //---BackendDarwinLaunchd - plist в /Library/LaunchDaemons, управление launchctl
    class BackendDarwinLaunchd final : public BackendBase {
    public:
        BackendDarwinLaunchd(const ServiceDescriptor& descriptor, BackendConfig config)
            : BackendBase(BackendKind::Launchd, descriptor, std::move(config), kLaunchdTemplate),
              parser_(launchdStatusParser(descriptor.name))
        {
        }

    protected:
        fs::path relativeDescriptorPath() const override
        {
            return fs::path("/Library/LaunchDaemons") / (descriptor().name + ".plist");
        }

        //---plist не исполняемый
        mode_t descriptorMode() const override { return 0644; }

        //---Все значения попадают в XML: экранируем
        TemplateValues templateValues(const ResolvedExecutable& exe,
            const std::vector<std::string>& args) const override
        {
            TemplateValues v = BackendBase::templateValues(exe, args);
            for (auto& kv : v)
            {
                //---ProgramArguments уже собран из экранированных элементов
                if (kv.first == "ProgramArguments") continue;
                kv.second = escapeXml(kv.second);
            }
            return v;
        }

        //---Загрузка/выгрузка идёт по пути к plist
        NativeCommand startCommand() const override { return { "launchctl", { "load", descriptorPath().string() } }; }
        NativeCommand stopCommand() const override { return { "launchctl", { "unload", descriptorPath().string() } }; }
        NativeCommand statusCommand() const override { return { "launchctl", { "list", descriptor().name } }; }

        const StatusParser& statusParser() const override { return parser_; }

    private:
        const StatusParser parser_;
    };

    std::unique_ptr<IServiceBackend> makeLaunchdBackend(const ServiceDescriptor& descriptor, BackendConfig config)
    {
        return std::make_unique<BackendDarwinLaunchd>(descriptor, std::move(config));
    }

} // namespace svcctl
