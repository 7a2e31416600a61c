#pragma once
#include <optional>
#include <string>
#include <vector>

namespace svcctl {

	//---Коды ошибок операций со службой
	enum class ErrorCode {
		None,
		UnsupportedSystem,			//	Нет способа проверить права (id -g недоступен)
		InsufficientPrivileges,		//	Запуск не от root
		AlreadyInstalled,			//	Файл дескриптора уже существует
		NotInstalled,				//	Файла дескриптора нет
		AlreadyRunning,				//	Служба уже запущена
		AlreadyStopped,				//	Служба уже остановлена
		InvalidArgument,			//	Недопустимое имя службы
		TemplateError,				//	Ошибка в шаблоне дескриптора
		IoError,					//	Ошибка файловой системы (текст системы в detail)
		CommandFailed				//	Нативная команда не запустилась или вернула != 0
	};

	//---Ошибка: код для проверки + текст для человека
	struct ServiceError final {
		ErrorCode code = ErrorCode::None;
		std::string detail;

		bool ok() const { return code == ErrorCode::None; }
	};

	//---Состояние службы, полученное из вывода нативного менеджера
	struct RuntimeStatus final {
		bool running = false;
		std::optional<long> pid;

		//---"Service (pid  N) is running..." / "Service is running..." / "Service is stopped"
		std::string describe() const;
	};

	//---Результат операции жизненного цикла
	struct ActionResult final {
		std::string message;					//	Строка для человека, не разбирать!
		ServiceError error;						//	Машинно-проверяемая ошибка
		std::vector<std::string> warnings;		//	Неудачи best-effort шагов (симлинки, disable)
		std::optional<RuntimeStatus> runtime;	//	Для start/stop/status

		bool ok() const { return error.ok(); }
	};

	//---Имя кода ошибки ("NotInstalled" и т.п.)
	const char* toString(ErrorCode code);

	//---Стандартный текст ошибки для кода
	std::string defaultMessage(ErrorCode code);

	//---Сборка ошибки: detail пустой → стандартный текст
	ServiceError makeError(ErrorCode code, std::string detail = {});

};//---namespace svcctl
