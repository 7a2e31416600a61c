#include "service_control/Paths.hpp"
#include "platform/PlatformImpl.hpp"

#include <cstdlib>
#include <unistd.h>

namespace svcctl {

	namespace {
		//------------------------------------------------------------
		//	Файл существует, обычный и исполняемый
		//------------------------------------------------------------
		static bool isExecutableFile(const fs::path& p) {
			std::error_code ec;
			if (!fs::is_regular_file(p, ec)) return false;
			return ::access(p.c_str(), X_OK) == 0;
		}
	} // namespace

	//---Путь к собственному исполняемому файлу
	fs::path selfExePath() {
		return platform::selfExePath();
	}
	//------------------------------------------------------------
	//	Поиск исполняемого файла по списку каталогов
	//------------------------------------------------------------
	fs::path lookPath(const std::string& name, const std::string& searchPath) {

		if (name.empty()) return {};

		//---Имя со слэшем → проверяем как путь, без поиска
		if (name.find('/') != std::string::npos)
		{
			const fs::path p(name);
			if (!isExecutableFile(p)) return {};
			std::error_code ec;
			const fs::path abs = fs::absolute(p, ec);
			return ec ? p : abs.lexically_normal();
		}

		std::string dirs = searchPath;
		if (dirs.empty())
		{
			const char* env = std::getenv("PATH");
			if (env) dirs = env;
		}

		size_t begin = 0;
		for (;;)
		{
			const size_t end = dirs.find(':', begin);
			std::string dir = dirs.substr(begin, end == std::string::npos ? std::string::npos : end - begin);

			//---Пустой элемент PATH = текущий каталог
			if (dir.empty()) dir = ".";

			const fs::path candidate = fs::path(dir) / name;
			if (isExecutableFile(candidate))
			{
				std::error_code ec;
				const fs::path abs = fs::absolute(candidate, ec);
				return ec ? candidate : abs.lexically_normal();
			}

			if (end == std::string::npos) break;
			begin = end + 1;
		}
		return {};
	}
	//------------------------------------------------------------
	//	Определение пути к исполняемому файлу службы
	//------------------------------------------------------------
	bool resolveExecutable(const ServiceDescriptor& descriptor, const std::string& searchPath,
		ResolvedExecutable& out, std::string* error) {

		out = {};

		//---Сначала имя службы в PATH, затем собственный exe
		fs::path exe = lookPath(descriptor.name, searchPath);
		if (exe.empty()) exe = selfExePath();

		if (exe.empty())
		{
			if (error) *error = "cannot resolve executable path for service '" + descriptor.name + "'";
			return false;
		}

		out.executable = exe;
		out.arguments = descriptor.arguments;
		out.commandLine = exe.string();

		//---Аргументы добавляются только если они есть
		if (!descriptor.arguments.empty())
			out.commandLine += " " + joinStrings(descriptor.arguments, " ");

		return true;
	}
	//------------------------------------------------------------
	//	Склейка строк
	//------------------------------------------------------------
	std::string joinStrings(const std::vector<std::string>& items, const std::string& sep) {
		std::string out;
		for (size_t i = 0; i < items.size(); i++)
		{
			if (i) out += sep;
			out += items[i];
		}
		return out;
	}
} // namespace svcctl
