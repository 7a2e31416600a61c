#pragma once
#include <regex>
#include <string>

#include "ServiceError.hpp"

namespace svcctl {

	//---Разбор текстового вывода нативного менеджера
	//	presence - "служба есть/активна", pid - первая группа = номер процесса
	class StatusParser final {
	public:
		StatusParser(const std::string& presencePattern, const std::string& pidPattern);

		//---Нет совпадения presence → остановлена, pid не извлекается
		RuntimeStatus parse(const std::string& output) const;

		const std::string& presencePattern() const { return presenceText_; }
		const std::string& pidPattern() const { return pidText_; }

	private:
		std::string presenceText_;
		std::string pidText_;
		std::regex presence_;
		std::regex pid_;
	};

	//---Экранирование спецсимволов regex в имени службы
	std::string escapeRegex(const std::string& text);

	//---Парсеры бэкэндов
	StatusParser systemdStatusParser();
	StatusParser upstartStatusParser(const std::string& name);
	StatusParser sysvStatusParser(const std::string& name);
	StatusParser launchdStatusParser(const std::string& name);
	StatusParser rcdStatusParser(const std::string& name);

};//---namespace svcctl
