#include "service_control/Cli.hpp"
#include <iomanip>
#include <map>
#include <set>
#include <string_view>

namespace svcctl {

	namespace {

		//---Флаги команд (ровно один на запуск)
		struct CommandFlag final {
			const char* flag;
			Command cmd;
		};

		const CommandFlag kCommands[] = {
			{ "--install", Command::Install },
			{ "--remove",  Command::Remove },
			{ "--start",   Command::Start },
			{ "--stop",    Command::Stop },
			{ "--status",  Command::Status },
			{ "--print",   Command::Print },
		};

		//---Разобранная командная строка: флаги и пары ключ=значение
		struct RawArgs final {
			std::set<std::string> flags;
			std::map<std::string, std::string> values;

			std::string value(const std::string& key) const {
				const auto it = values.find(key);
				return it == values.end() ? std::string() : it->second;
			}
		};

		//------------------------------------------------------------
		//	Снятие парных кавычек ("..." или '...')
		//------------------------------------------------------------
		static std::string unquote(std::string_view v) {
			if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front())
				v = v.substr(1, v.size() - 2);
			return std::string(v);
		}
		//------------------------------------------------------------
		//	Один проход по argv: "--key=value" → values, остальное → flags
		//	Повторный ключ: побеждает первое вхождение
		//------------------------------------------------------------
		static RawArgs collect(int argc, char** argv) {
			RawArgs raw;
			for (int i = 1; i < argc; i++)
			{
				const std::string_view a = argv[i];
				const size_t eq = a.find('=');
				if (eq == std::string_view::npos)
				{
					raw.flags.insert(std::string(a));
					continue;
				}
				raw.values.emplace(std::string(a.substr(0, eq)), unquote(a.substr(eq + 1)));
			}
			return raw;
		}
	} // namespace

	//------------------------------------------------------------
	//	Разбиение списка по пробелам (и запятым)
	//------------------------------------------------------------
	std::vector<std::string> splitList(const std::string& text, bool allowComma) {
		std::vector<std::string> out;
		std::string cur;
		for (char c : text)
		{
			const bool sep = c == ' ' || c == '\t' || (allowComma && c == ',');
			if (sep)
			{
				if (!cur.empty()) out.push_back(cur);
				cur.clear();
				continue;
			}
			cur.push_back(c);
		}
		if (!cur.empty()) out.push_back(cur);
		return out;
	}
	//------------------------------------------------------------
	//	Разбор командной строки
	//------------------------------------------------------------
	CliOptions parseCli(int argc, char** argv) {

		const RawArgs raw = collect(argc, argv);
		CliOptions o;

		//---Параметры службы
		o.name = raw.value("--name");
		o.description = raw.value("--desc");
		o.args = splitList(raw.value("--args"), false);
		o.deps = splitList(raw.value("--deps"), true);

		//---Конфигурация бэкэнда и логов
		o.backend = raw.value("--backend");
		o.templateFile = raw.value("--template");
		o.rootDir = raw.value("--root");
		o.logDir = raw.value("--log-dir");

		//---Команда: ни одной → Help, больше одной → Invalid
		int found = 0;
		for (const auto& c : kCommands)
		{
			if (!raw.flags.count(c.flag)) continue;
			o.cmd = c.cmd;
			found++;
		}
		if (found == 0) o.cmd = Command::Help;
		else if (found > 1) o.cmd = Command::Invalid;

		return o;
	}
	//------------------------------------------------------------
	//	Строка справки: опция и описание в колонках
	//------------------------------------------------------------
	static void printOpt(std::ostream& os, const std::string& opt, const std::string& desc) {
		os << "  " << std::left << std::setw(22) << opt << desc << "\n";
	}
	//------------------------------------------------------------
	//	Справка
	//------------------------------------------------------------
	void printHelp(std::ostream& os) {
		os << "service-control: install and control a service under the native init system\n\n"
		   << "Usage: service-control <command> --name=<name> [options]\n\n"
		   << "Commands (exactly one):\n";

		printOpt(os, "--install", "Write the descriptor and register it");
		printOpt(os, "--remove", "Unregister and delete the descriptor");
		printOpt(os, "--start", "Start the installed service");
		printOpt(os, "--stop", "Stop the running service");
		printOpt(os, "--status", "Show running state and pid");
		printOpt(os, "--print", "Print the rendered descriptor, change nothing");

		os << "\nOptions:\n";
		printOpt(os, "--name=<name>", "Service name, [A-Za-z0-9_.@-] (required)");
		printOpt(os, "--desc=\"...\"", "Description (default: the name)");
		printOpt(os, "--args=\"...\"", "Arguments for the service executable");
		printOpt(os, "--deps=\"a b\"", "Dependencies, space or comma separated (systemd)");
		printOpt(os, "--backend=<kind>", "systemd|upstart|sysv|launchd|rcd (default: detect)");
		printOpt(os, "--template=<file>", "Replace the built-in descriptor template");
		printOpt(os, "--root=<dir>", "Filesystem root for descriptors (default: /)");
		printOpt(os, "--log-dir=<dir>", "Also write glog files there");

		os << "\nExit codes: 0 success, 1 operation failed, 2 usage error\n\n"
		   << "Example:\n"
		   << "  service-control --install --name=sampled --desc=\"Sample Daemon\" --args=\"--flag\" --deps=network\n";
	}
};//---namespace svcctl
