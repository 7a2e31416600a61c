#pragma once
#include <string>
#include <iostream>
#include <vector>

namespace svcctl {

	//---Команды CLI
	enum class Command {
	Help,
	Install,
	Remove,
	Start,
	Stop,
	Status,
	Print,
	Invalid
	};

	//---Опции командной строки
	struct CliOptions final {

		//---Команда
		Command cmd = Command::Help;

		//---Параметры службы
		std::string name;							//	Имя службы
		std::string description;					//	Описание службы
		std::vector<std::string> args;				//	Аргументы exe службы
		std::vector<std::string> deps;				//	Зависимости (systemd)

		//---Конфигурация бэкэнда
		std::string backend;						//	Явный выбор бэкэнда (пусто - автоопределение)
		std::string templateFile;					//	Файл с заменой шаблона дескриптора
		std::string rootDir;						//	Корень файловой системы (пусто - "/")
		std::string logDir;							//	Каталог логов (пусто - только stderr)
	};

	CliOptions parseCli(int argc, char** argv);
	void printHelp(std::ostream& os);

	//---Разбиение строки по пробелам (и запятым, если allowComma)
	std::vector<std::string> splitList(const std::string& text, bool allowComma);

};//---namespace svcctl
