#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "ServiceDescriptor.hpp"
#include "ServiceError.hpp"

namespace svcctl {

	namespace fs = std::filesystem;

	//---Виды нативных менеджеров служб
	enum class BackendKind {
		Systemd,
		Upstart,
		SysV,
		Launchd,
		BsdRcd
	};

	//---Полезная нагрузка службы (вызывается синхронно из run)
	class IExecutable {
	public:
		virtual ~IExecutable() = default;

		virtual void run() = 0;
	};

	//---Интерфейс бэкэнда управления службой
	//	Один экземпляр привязан к одному ServiceDescriptor
	class IServiceBackend {
	public:
		virtual ~IServiceBackend() = default;

		virtual BackendKind kind() const = 0;
		virtual const ServiceDescriptor& descriptor() const = 0;

		//---Путь к файлу дескриптора; его наличие = "установлено"
		virtual fs::path descriptorPath() const = 0;
		virtual bool isInstalled() const = 0;

		//---Действующий текст шаблона (из BackendConfig или по умолчанию)
		virtual const std::string& templateText() const = 0;

		//---Отрисовка дескриптора без записи на диск
		virtual bool renderDescriptor(const std::vector<std::string>& args,
			std::string& out, ServiceError* error) const = 0;

		virtual ActionResult install(const std::vector<std::string>& args = {}) = 0;
		virtual ActionResult remove() = 0;
		virtual ActionResult start() = 0;
		virtual ActionResult stop() = 0;
		virtual ActionResult status() = 0;

		//---Синхронный запуск полезной нагрузки, не зависит от состояния установки
		virtual ActionResult run(IExecutable& payload) = 0;
	};
};//---namespace svcctl
