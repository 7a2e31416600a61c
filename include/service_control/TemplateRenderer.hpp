#pragma once
#include <map>
#include <string>

namespace svcctl {

	//---Значения подстановок: ключ "Name" заменяет "{{Name}}"
	using TemplateValues = std::map<std::string, std::string>;

	//---Подстановка значений в шаблон
	//	Неизвестная или незакрытая подстановка → false и текст ошибки.
	//	Подставленные значения повторно не разбираются
	bool renderTemplate(const std::string& templ, const TemplateValues& values,
		std::string& out, std::string* error);

	//---Экранирование &, <, >, ", ' для plist
	std::string escapeXml(const std::string& text);

	//---Удаление \r и \n: значение остаётся в одной строке дескриптора
	std::string toSingleLine(const std::string& text);

	//---Экранирование ", \, $ и ` для строки в двойных кавычках sh
	std::string escapeShellQuoted(const std::string& text);

};//---namespace svcctl
