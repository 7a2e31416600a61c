#include "service_control/Installer.hpp"
#include "service_control/Platform.hpp"
#include "service_control/ServiceDescriptor.hpp"
#include "service_control/IServiceBackend.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <glog/logging.h>

namespace svcctl {

	namespace {
		//------------------------------------------------------------
		//	Чтение файла шаблона целиком
		//------------------------------------------------------------
		static bool readTemplateFile(const std::string& path, std::string& out, std::string* error)
		{
			std::ifstream f(path, std::ios::binary);
			if (!f)
			{
				if (error) *error = "Failed to open template file: " + path;
				return false;
			}
			std::ostringstream os;
			os << f.rdbuf();
			if (f.bad())
			{
				if (error) *error = "Failed to read template file: " + path;
				return false;
			}
			out = os.str();
			return true;
		}
	} // namespace

	//------------------------------------------------------------
	//	Логирование ошибки и возврат кода ошибки
	//------------------------------------------------------------
	static int fail(const std::string& msg, int code = 1) {
		LOG(ERROR) << msg;
		return code;
	}
	//------------------------------------------------------------
	//	Проверка, что строка пустая или содержит только пробельные символы
	//------------------------------------------------------------
	static bool isEmptyOrWhitespace(const std::string& s) {
		for (char c : s)
		{
			if (!std::isspace(static_cast<unsigned char>(c))) return false;
		}
		return true;
	}
	//------------------------------------------------------------
	//	Вывод результата операции: строка для человека + предупреждения
	//------------------------------------------------------------
	static int report(const ActionResult& r, std::ostream& os) {

		if (!r.message.empty()) os << r.message << "\n";

		for (const auto& w : r.warnings) os << "warning: " << w << "\n";

		if (!r.ok())
			return fail(std::string(toString(r.error.code)) + ": " + r.error.detail);
		return 0;
	}
	//------------------------------------------------------------
	//	Оркестратор: выполнение команды над бэкэндом текущей платформы
	//------------------------------------------------------------
	int runInstaller(const CliOptions& opt, std::ostream& os) {

		//---Валидация опций
		if (opt.name.empty()) return fail("Missing required option: --name=<service_name>", 2);

		//---Описание службы
		ServiceDescriptor descriptor;
		descriptor.name = opt.name;
		descriptor.description = opt.description;

		//---Если описание службы пустое → использование имени службы
		if (isEmptyOrWhitespace(descriptor.description))
		{
			descriptor.description = descriptor.name;
		}
		descriptor.arguments = opt.args;
		descriptor.dependencies = opt.deps;

		//---Конфигурация бэкэнда
		BackendConfig config;
		if (!opt.rootDir.empty()) config.rootDir = opt.rootDir;

		if (!opt.templateFile.empty())
		{
			std::string err;
			if (!readTemplateFile(opt.templateFile, config.templateText, &err)) return fail(err, 2);
		}

		//---Создание бэкенда: явный выбор или автоопределение
		std::unique_ptr<IServiceBackend> backend;
		if (!opt.backend.empty())
		{
			const auto kind = parseBackendKind(opt.backend);
			if (!kind) return fail("Unknown backend: " + opt.backend, 2);
			backend = makeBackend(*kind, descriptor, std::move(config));
		}
		else
		{
			backend = makeBackend(descriptor, std::move(config));
		}

		//---Проверка доступности бэкенда
		if (!backend) return fail("Backend not available on this platform.");

		switch (opt.cmd)
		{
		case Command::Install:	return report(backend->install(), os);
		case Command::Remove:	return report(backend->remove(), os);
		case Command::Start:	return report(backend->start(), os);
		case Command::Stop:		return report(backend->stop(), os);
		case Command::Status:	return report(backend->status(), os);
		case Command::Print:
		{
			std::string text;
			ServiceError err;
			if (!backend->renderDescriptor({}, text, &err))
				return fail(std::string(toString(err.code)) + ": " + err.detail);
			os << "# " << backend->descriptorPath().string() << "\n" << text;
			return 0;
		}
		case Command::Help:
		case Command::Invalid:
			break;
		}
		return 2;
	}
}; //---namespace svcctl
