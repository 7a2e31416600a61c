#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "ServiceDescriptor.hpp"

namespace svcctl {

	namespace fs = std::filesystem;

	//---Результат определения исполняемого файла службы
	struct ResolvedExecutable final {
		fs::path executable;				//	Абсолютный путь к exe
		std::vector<std::string> arguments;	//	Аргументы из ServiceDescriptor
		std::string commandLine;			//	"<exe> [arg1 arg2 ...]"
	};

	//---Путь к собственному исполняемому файлу (пусто, если не определён)
	fs::path selfExePath();

	//---Поиск исполняемого файла по списку каталогов (формат PATH)
	//	Имя со '/' проверяется напрямую. Пустой элемент PATH = текущий каталог.
	//	Пусто → не найден
	fs::path lookPath(const std::string& name, const std::string& searchPath);

	//---Определение пути к исполняемому файлу службы:
	//	1) имя службы в searchPath (пусто → $PATH)
	//	2) иначе собственный исполняемый файл
	//	Аргументы добавляются через пробел только если они есть
	bool resolveExecutable(const ServiceDescriptor& descriptor, const std::string& searchPath,
		ResolvedExecutable& out, std::string* error);

	//---Склейка строк через разделитель
	std::string joinStrings(const std::vector<std::string>& items, const std::string& sep);

};//---namespace svcctl
