#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include "Process.hpp"

namespace svcctl {

	namespace fs = std::filesystem;

	//---Параметры конструирования бэкэнда
	struct BackendConfig final {

		//---Корень файловой системы: все пути дескрипторов и маркеров от него
		fs::path rootDir = "/";

		//---Текст шаблона дескриптора. Пусто → шаблон бэкэнда по умолчанию
		std::string templateText;

		//---Список каталогов для поиска exe (формат PATH). Пусто → $PATH
		std::string searchPath;

		//---Исполнитель нативных команд. nullptr → SystemCommandRunner
		std::shared_ptr<process::ICommandRunner> runner;
	};
};//---namespace svcctl
