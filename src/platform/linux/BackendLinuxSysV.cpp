#include "platform/BackendBase.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace svcctl {

    namespace fs = std::filesystem;

    namespace {

        //---Уровни запуска: S87 при старте, K17 при остановке/перезагрузке
        const char* const kStartLevels[] = { "2", "3", "4", "5" };
        const char* const kKillLevels[] = { "0", "1", "6" };
        const char* const kStartPrefix = "S87";
        const char* const kKillPrefix = "K17";

        const std::string kSysVTemplate = R"SH(#! /bin/sh
#
#       /etc/rc.d/init.d/{{Name}}
#
#       Starts {{Name}} as a daemon
#
# chkconfig: 2345 87 17
# description: Starts and stops a single {{Name}} instance on this system

### BEGIN INIT INFO
# Provides: {{Name}}
# Required-Start: $network $named
# Required-Stop: $network $named
# Default-Start: 2 3 4 5
# Default-Stop: 0 1 6
# Short-Description: This service manages the {{Description}}.
# Description: {{Description}}
### END INIT INFO

#
# Source function library.
#
if [ -f /etc/rc.d/init.d/functions ]; then
    . /etc/rc.d/init.d/functions
fi

exec="{{Executable}}"
servname="{{Description}}"

proc="{{Name}}"
pidfile="/var/run/$proc.pid"
lockfile="/var/lock/subsys/$proc"
stdoutlog="/var/log/$proc.log"
stderrlog="/var/log/$proc.err"

[ -d $(dirname $lockfile) ] || mkdir -p $(dirname $lockfile)

[ -e /etc/sysconfig/$proc ] && . /etc/sysconfig/$proc

start() {
    [ -x $exec ] || exit 5

    if [ -f $pidfile ]; then
        if ! [ -d "/proc/$(cat $pidfile)" ]; then
            rm $pidfile
            if [ -f $lockfile ]; then
                rm $lockfile
            fi
        fi
    fi

    if ! [ -f $pidfile ]; then
        printf "Starting $servname:\t"
        echo "$(date)" >> $stdoutlog
        $exec {{Arguments}} >> $stdoutlog 2>> $stderrlog &
        echo $! > $pidfile
        touch $lockfile
        success
        echo
    else
        # failure
        echo
        printf "$pidfile still exists...\n"
        exit 7
    fi
}

stop() {
    echo -n $"Stopping $servname: "
    killproc -p $pidfile $proc
    retval=$?
    echo
    [ $retval -eq 0 ] && rm -f $lockfile
    return $retval
}

restart() {
    stop
    start
}

rh_status() {
    status -p $pidfile $proc
}

rh_status_q() {
    rh_status >/dev/null 2>&1
}

case "$1" in
    start)
        rh_status_q && exit 0
        $1
        ;;
    stop)
        rh_status_q || exit 0
        $1
        ;;
    restart)
        $1
        ;;
    status)
        rh_status
        ;;
    *)
        echo $"Usage: $0 {start|stop|status|restart}"
        exit 2
esac

exit $?
)SH";

    } // namespace

    const std::string& sysvTemplate() { return kSysVTemplate; }

    //---BackendLinuxSysV - init-скрипт в /etc/init.d и симлинки уровней запуска
    class BackendLinuxSysV final : public BackendBase {
    public:
        BackendLinuxSysV(const ServiceDescriptor& descriptor, BackendConfig config)
            : BackendBase(BackendKind::SysV, descriptor, std::move(config), kSysVTemplate),
              parser_(sysvStatusParser(descriptor.name))
        {
        }

    protected:
        fs::path relativeDescriptorPath() const override
        {
            return fs::path("/etc/init.d") / descriptor().name;
        }

        //---Описание и путь попадают в строки "..." и комментарии скрипта
        TemplateValues templateValues(const ResolvedExecutable& exe,
            const std::vector<std::string>& args) const override
        {
            TemplateValues v = BackendBase::templateValues(exe, args);
            v["Description"] = escapeShellQuoted(toSingleLine(descriptor().description));
            v["Executable"] = escapeShellQuoted(toSingleLine(exe.executable.string()));
            return v;
        }

        //---Симлинки уровней запуска: неудача одной ссылки не прерывает остальные
        bool registerService(ActionResult& result) override
        {
            const fs::path target = descriptorPath();
            for (const char* level : kStartLevels)
                linkRunlevel(target, runlevelLink(level, kStartPrefix), result);
            for (const char* level : kKillLevels)
                linkRunlevel(target, runlevelLink(level, kKillPrefix), result);
            return true;
        }

        void unregisterAfterRemove(ActionResult& result) override
        {
            for (const char* level : kStartLevels)
                unlinkRunlevel(runlevelLink(level, kStartPrefix), result);
            for (const char* level : kKillLevels)
                unlinkRunlevel(runlevelLink(level, kKillPrefix), result);
        }

        NativeCommand startCommand() const override { return { "service", { descriptor().name, "start" } }; }
        NativeCommand stopCommand() const override { return { "service", { descriptor().name, "stop" } }; }
        NativeCommand statusCommand() const override { return { "service", { descriptor().name, "status" } }; }

        const StatusParser& statusParser() const override { return parser_; }

    private:
        //---/etc/rc<level>.d/<prefix><name>
        fs::path runlevelLink(const char* level, const char* prefix) const
        {
            return rooted(fs::path("/etc") / (std::string("rc") + level + ".d") / (prefix + descriptor().name));
        }

        static void linkRunlevel(const fs::path& target, const fs::path& link, ActionResult& result)
        {
            std::error_code ec;
            fs::create_symlink(target, link, ec);
            if (ec) addWarning(result, "Failed to create runlevel link " + link.string() + ": " + ec.message());
        }

        static void unlinkRunlevel(const fs::path& link, ActionResult& result)
        {
            //---Отсутствующая ссылка не ошибка
            std::error_code ec;
            fs::remove(link, ec);
            if (ec) addWarning(result, "Failed to remove runlevel link " + link.string() + ": " + ec.message());
        }

        const StatusParser parser_;
    };

    std::unique_ptr<IServiceBackend> makeSysVBackend(const ServiceDescriptor& descriptor, BackendConfig config)
    {
        return std::make_unique<BackendLinuxSysV>(descriptor, std::move(config));
    }

} // namespace svcctl
