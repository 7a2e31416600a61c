#pragma once
#include <iostream>
#include "Cli.hpp"

namespace svcctl {

	//---Оркестратор: выполнение команды CLI над бэкэндом текущей платформы
	//	0 - успех, 1 - ошибка операции, 2 - ошибка параметров
	int runInstaller(const CliOptions& opt, std::ostream& os = std::cout);

};//---namespace svcctl
