#include "service_control/TemplateRenderer.hpp"

namespace svcctl {

	//------------------------------------------------------------
	//	Подстановка значений в шаблон
	//------------------------------------------------------------
	bool renderTemplate(const std::string& templ, const TemplateValues& values,
		std::string& out, std::string* error) {

		std::string result;
		result.reserve(templ.size() + 256);

		size_t pos = 0;
		for (;;)
		{
			const size_t open = templ.find("{{", pos);
			if (open == std::string::npos)
			{
				result.append(templ, pos, std::string::npos);
				break;
			}
			result.append(templ, pos, open - pos);

			const size_t close = templ.find("}}", open + 2);
			if (close == std::string::npos)
			{
				if (error) *error = "unterminated placeholder at offset " + std::to_string(open);
				return false;
			}

			const std::string key = templ.substr(open + 2, close - open - 2);
			const auto it = values.find(key);
			if (it == values.end())
			{
				if (error) *error = "unknown placeholder {{" + key + "}}";
				return false;
			}
			result += it->second;
			pos = close + 2;
		}

		out = std::move(result);
		return true;
	}
	//------------------------------------------------------------
	//	Экранирование для XML
	//------------------------------------------------------------
	std::string escapeXml(const std::string& text) {
		std::string out;
		out.reserve(text.size());
		for (char c : text)
		{
			switch (c)
			{
			case '&':  out += "&amp;"; break;
			case '<':  out += "&lt;"; break;
			case '>':  out += "&gt;"; break;
			case '"':  out += "&quot;"; break;
			case '\'': out += "&apos;"; break;
			default:   out.push_back(c); break;
			}
		}
		return out;
	}
	//------------------------------------------------------------
	//	Значение в одну строку
	//------------------------------------------------------------
	std::string toSingleLine(const std::string& text) {
		std::string out;
		out.reserve(text.size());
		for (char c : text)
		{
			if (c == '\r' || c == '\n') continue;
			out.push_back(c);
		}
		return out;
	}
	//------------------------------------------------------------
	//	Экранирование для двойных кавычек sh
	//------------------------------------------------------------
	std::string escapeShellQuoted(const std::string& text) {
		std::string out;
		out.reserve(text.size());
		for (char c : text)
		{
			if (c == '"' || c == '\\' || c == '$' || c == '`') out.push_back('\\');
			out.push_back(c);
		}
		return out;
	}
}; //---namespace svcctl
