#include "service_control/StatusParser.hpp"

#include <cerrno>
#include <cstdlib>

namespace svcctl {

	StatusParser::StatusParser(const std::string& presencePattern, const std::string& pidPattern)
		: presenceText_(presencePattern),
		  pidText_(pidPattern),
		  presence_(presencePattern),
		  pid_(pidPattern)
	{
	}
	//------------------------------------------------------------
	//	Разбор вывода нативного менеджера
	//------------------------------------------------------------
	RuntimeStatus StatusParser::parse(const std::string& output) const {

		RuntimeStatus st;
		if (!std::regex_search(output, presence_)) return st;

		st.running = true;

		std::smatch m;
		if (std::regex_search(output, m, pid_) && m.size() > 1)
		{
			errno = 0;
			const long v = std::strtol(m[1].str().c_str(), nullptr, 10);
			if (errno != ERANGE && v > 0) st.pid = v;
		}
		return st;
	}
	//------------------------------------------------------------
	//	Экранирование спецсимволов regex
	//------------------------------------------------------------
	std::string escapeRegex(const std::string& text) {
		static const std::string special = "\\^$.|?*+()[]{}";
		std::string out;
		out.reserve(text.size() * 2);
		for (char c : text)
		{
			if (special.find(c) != std::string::npos) out.push_back('\\');
			out.push_back(c);
		}
		return out;
	}

	//---systemctl status: "Active: active (running)" / "Main PID: 4321 (name)"
	StatusParser systemdStatusParser() {
		return StatusParser("Active: active", "Main PID: ([0-9]+)");
	}

	//---status <name>: "<name> start/running, process 4321"
	StatusParser upstartStatusParser(const std::string& name) {
		return StatusParser(escapeRegex(name) + " start/running", "process ([0-9]+)");
	}

	//---service <name> status: "<name> (pid  4321) is running..."
	StatusParser sysvStatusParser(const std::string& name) {
		return StatusParser(escapeRegex(name), "pid +([0-9]+)");
	}

	//---launchctl list <name>: "\"PID\" = 4321;"
	StatusParser launchdStatusParser(const std::string& name) {
		return StatusParser(escapeRegex(name), "\"PID\" = ([0-9]+);");
	}

	//---service <name> status: "<name> is running as pid 4321."
	StatusParser rcdStatusParser(const std::string& name) {
		return StatusParser(escapeRegex(name), "pid +([0-9]+)");
	}
}; //---namespace svcctl
