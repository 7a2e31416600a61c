#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "BackendConfig.hpp"
#include "IServiceBackend.hpp"
#include "ServiceDescriptor.hpp"

namespace svcctl {

	namespace fs = std::filesystem;

	//---Выбор бэкэнда для текущей платформы
	//	Linux: /run/systemd/system → systemd, /sbin/initctl → upstart, иначе SysV.
	//	macOS: launchd, BSD: rc.d (без проверок)
	BackendKind selectBackendKind(const fs::path& rootDir = "/");

	//---Создание бэкэнда для текущей платформы
	std::unique_ptr<IServiceBackend> makeBackend(const ServiceDescriptor& descriptor,
		BackendConfig config = {});

	//---Создание бэкэнда заданного вида (явный выбор)
	std::unique_ptr<IServiceBackend> makeBackend(BackendKind kind,
		const ServiceDescriptor& descriptor, BackendConfig config = {});

	//---Шаблон дескриптора по умолчанию
	const std::string& defaultTemplate(BackendKind kind);

	//---"systemd" / "upstart" / "sysv" / "launchd" / "rcd"
	const char* toString(BackendKind kind);
	std::optional<BackendKind> parseBackendKind(const std::string& text);

};//---namespace svcctl
