#include <iostream>
#include "service_control/Installer.hpp"
#include "service_control/Cli.hpp"
#include "service_control/Logging.hpp"

int main(int argc, char** argv) {

	//---Разбор аргументов командной строки
	const svcctl::CliOptions opt = svcctl::parseCli(argc, argv);

	//---Если запрошена справка или команда некорректна → вывод справки и выход
	if (opt.cmd == svcctl::Command::Help || opt.cmd == svcctl::Command::Invalid)
	{
		svcctl::printHelp(std::cout);
		return (opt.cmd == svcctl::Command::Invalid) ? 2 : 0;
	}

	//---Инициализация логгера
	svcctl::initLogging(argv[0], opt.logDir);

	//---Выполнение команды над службой
	return svcctl::runInstaller(opt);
}
