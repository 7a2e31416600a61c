#pragma once
#include <string>
#include <vector>

namespace svcctl {

	//---Описание службы (неизменяемо после передачи в бэкэнд)
	struct ServiceDescriptor final {

		//---Параметры службы
		std::string name;						//	Обязательное поле, ключ путей и регистрации
		std::string description;				//	Текст для дескриптора

		std::vector<std::string> arguments;		//	Аргументы exe, добавляются к пути при установке
		std::vector<std::string> dependencies;	//	Службы, после которых стартуем (только systemd)
	};
};//---namespace svcctl
