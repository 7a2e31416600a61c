#include "platform/BackendBase.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <glog/logging.h>

namespace svcctl {

    namespace fs = std::filesystem;

    namespace {

        const std::string kBsdRcdTemplate = R"SH(#!/bin/sh
#
# PROVIDE: {{Name}}
# REQUIRE: networking syslog
# KEYWORD:

# Add the following lines to /etc/rc.conf to enable the {{Name}}:
#
# {{Name}}_enable="YES"
#


. /etc/rc.subr

name="{{Name}}"
rcvar="{{Name}}_enable"
command="{{Executable}}"
pidfile="/var/run/$name.pid"

start_cmd="/usr/sbin/daemon -p $pidfile -f $command {{Arguments}}"
load_rc_config $name
run_rc_command "$1"
)SH";

    } // namespace

    const std::string& bsdRcdTemplate() { return kBsdRcdTemplate; }

    //---Есть ли в rc.conf незакомментированная строка <name>_enable="YES"
    bool isRcdServiceEnabled(const std::string& rcConf, const std::string& name)
    {
        const std::string needle = name + "_enable=\"YES\"";

        std::istringstream in(rcConf);
        std::string line;
        while (std::getline(in, line))
        {
            const size_t pos = line.find(needle);
            if (pos == std::string::npos) continue;

            //---Первый непробельный символ строки не должен быть '#'
            const size_t first = line.find_first_not_of(" \t");
            if (first != std::string::npos && line[first] == '#') continue;

            //---Имя не должно быть хвостом другого имени (foo_bar_enable)
            if (pos > 0)
            {
                const char prev = line[pos - 1];
                if (prev != ' ' && prev != '\t' && prev != ';') continue;
            }
            return true;
        }
        return false;
    }

    //---BackendBsdRcd - rc.subr-скрипт в /usr/local/etc/rc.d, управление service(8)
    class BackendBsdRcd final : public BackendBase {
    public:
        BackendBsdRcd(const ServiceDescriptor& descriptor, BackendConfig config)
            : BackendBase(BackendKind::BsdRcd, descriptor, std::move(config), kBsdRcdTemplate),
              parser_(rcdStatusParser(descriptor.name))
        {
        }

    protected:
        fs::path relativeDescriptorPath() const override
        {
            return fs::path("/usr/local/etc/rc.d") / descriptor().name;
        }

        NativeCommand startCommand() const override { return { "service", { descriptor().name, verb("start") } }; }
        NativeCommand stopCommand() const override { return { "service", { descriptor().name, verb("stop") } }; }
        NativeCommand statusCommand() const override { return { "service", { descriptor().name, verb("status") } }; }

        const StatusParser& statusParser() const override { return parser_; }

    private:
        //---Служба не включена в rc.conf → one<cmd>
        std::string verb(const std::string& cmd) const
        {
            const fs::path rcConf = rooted("/etc/rc.conf");

            std::ifstream f(rcConf);
            if (f)
            {
                std::ostringstream text;
                text << f.rdbuf();
                if (isRcdServiceEnabled(text.str(), descriptor().name)) return cmd;
            }

            LOG(INFO) << "Service " << descriptor().name << " is not enabled in " << rcConf.string()
                      << ", using one" << cmd << " instead";
            return "one" + cmd;
        }

        const StatusParser parser_;
    };

    std::unique_ptr<IServiceBackend> makeBsdRcdBackend(const ServiceDescriptor& descriptor, BackendConfig config)
    {
        return std::make_unique<BackendBsdRcd>(descriptor, std::move(config));
    }

} // namespace svcctl
