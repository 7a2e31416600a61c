#include "service_control/Platform.hpp"
#include "platform/BackendBase.hpp"

#include <cctype>

#include <glog/logging.h>

namespace svcctl {

	namespace {
		//------------------------------------------------------------
		//	Существует ли маркер относительно корня
		//------------------------------------------------------------
		static bool markerExists(const fs::path& rootDir, const char* marker) {
			std::error_code ec;
			return fs::exists(rootDir / fs::path(marker).relative_path(), ec);
		}
	} // namespace

	//------------------------------------------------------------
	//	Выбор бэкэнда для текущей платформы
	//------------------------------------------------------------
	BackendKind selectBackendKind(const fs::path& rootDir) {
#if defined(__APPLE__)
		(void)rootDir;
		return BackendKind::Launchd;
#elif defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__) || defined(__DragonFly__)
		(void)rootDir;
		return BackendKind::BsdRcd;
#else
		//---Более новая подсистема проверяется первой
		if (markerExists(rootDir, "/run/systemd/system")) return BackendKind::Systemd;
		if (markerExists(rootDir, "/sbin/initctl")) return BackendKind::Upstart;
		return BackendKind::SysV;
#endif
	}
	//------------------------------------------------------------
	//	Создание бэкэнда для текущей платформы
	//------------------------------------------------------------
	std::unique_ptr<IServiceBackend> makeBackend(const ServiceDescriptor& descriptor, BackendConfig config) {
		const BackendKind kind = selectBackendKind(config.rootDir);
		LOG(INFO) << "detected service manager: " << toString(kind);
		return makeBackend(kind, descriptor, std::move(config));
	}
	//------------------------------------------------------------
	//	Создание бэкэнда заданного вида
	//------------------------------------------------------------
	std::unique_ptr<IServiceBackend> makeBackend(BackendKind kind,
		const ServiceDescriptor& descriptor, BackendConfig config) {
		switch (kind)
		{
		case BackendKind::Systemd:	return makeSystemdBackend(descriptor, std::move(config));
		case BackendKind::Upstart:	return makeUpstartBackend(descriptor, std::move(config));
		case BackendKind::SysV:		return makeSysVBackend(descriptor, std::move(config));
		case BackendKind::Launchd:	return makeLaunchdBackend(descriptor, std::move(config));
		case BackendKind::BsdRcd:	return makeBsdRcdBackend(descriptor, std::move(config));
		}
		return nullptr;
	}
	//------------------------------------------------------------
	//	Шаблон дескриптора по умолчанию
	//------------------------------------------------------------
	const std::string& defaultTemplate(BackendKind kind) {
		switch (kind)
		{
		case BackendKind::Systemd:	return systemdTemplate();
		case BackendKind::Upstart:	return upstartTemplate();
		case BackendKind::SysV:		break;
		case BackendKind::Launchd:	return launchdTemplate();
		case BackendKind::BsdRcd:	return bsdRcdTemplate();
		}
		return sysvTemplate();
	}

	const char* toString(BackendKind kind) {
		switch (kind)
		{
		case BackendKind::Systemd:	return "systemd";
		case BackendKind::Upstart:	return "upstart";
		case BackendKind::SysV:		return "sysv";
		case BackendKind::Launchd:	return "launchd";
		case BackendKind::BsdRcd:	return "rcd";
		}
		return "unknown";
	}
	//------------------------------------------------------------
	//	Разбор имени бэкэнда (без учёта регистра)
	//------------------------------------------------------------
	std::optional<BackendKind> parseBackendKind(const std::string& text) {
		std::string v = text;
		for (char& c : v) c = (char)std::tolower(static_cast<unsigned char>(c));

		if (v == "systemd") return BackendKind::Systemd;
		if (v == "upstart") return BackendKind::Upstart;
		if (v == "sysv" || v == "systemv") return BackendKind::SysV;
		if (v == "launchd") return BackendKind::Launchd;
		if (v == "rcd" || v == "rc.d" || v == "bsd") return BackendKind::BsdRcd;
		return std::nullopt;
	}
}; //---namespace svcctl
