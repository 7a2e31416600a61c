#include "platform/PlatformImpl.hpp"
#include <climits>
#include <cstdint>
#include <unistd.h>
#include <vector>

#if defined(__APPLE__)
#include <mach-o/dyld.h>
#elif defined(__FreeBSD__)
#include <sys/types.h>
#include <sys/sysctl.h>
#endif

namespace svcctl::platform {

	//---Получение пути к собственному исполняемому файлу
	fs::path selfExePath()
	{
#if defined(__APPLE__)
		std::uint32_t size = 0;
		(void)_NSGetExecutablePath(nullptr, &size);
		std::vector<char> buf(size + 1, '\0');
		if (_NSGetExecutablePath(buf.data(), &size) != 0) return {};

		std::error_code ec;
		fs::path p = fs::canonical(fs::path(buf.data()), ec);
		return ec ? fs::path(buf.data()) : p;
#elif defined(__FreeBSD__)
		int mib[4] = { CTL_KERN, KERN_PROC, KERN_PROC_PATHNAME, -1 };
		std::vector<char> buf(PATH_MAX, '\0');
		size_t len = buf.size();
		if (::sysctl(mib, 4, buf.data(), &len, nullptr, 0) != 0) return {};
		return fs::path(buf.data());
#else
		std::vector<char> buf(4096, '\0');
		ssize_t n = ::readlink("/proc/self/exe", buf.data(), buf.size() - 1);
		if (n <= 0) return {};
		buf[(size_t)n] = '\0';
		return fs::path(buf.data());
#endif
	}

} // namespace svcctl::platform
