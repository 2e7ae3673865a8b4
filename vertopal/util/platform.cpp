#include "platform.hpp"
#include "../config/settings.hpp"
#include <boost/algorithm/string.hpp>
#include <sys/utsname.h>

namespace vertopal::util {

std::string platform_info() {
    struct utsname info{};
    if (uname(&info) != 0) {
        return "unknown";
    }

    std::string system = boost::algorithm::to_lower_copy(std::string(info.sysname));
    if (system == "darwin") system = "macOs";

    std::string release = info.release;
    if (auto dash = release.find('-'); dash != std::string::npos) {
        release.resize(dash);
    }

    std::string machine = info.machine;
    if (machine == "x86_64" || machine == "amd64") machine = "x64";
    else if (machine == "aarch64") machine = "arm64";

    std::string result = system;
    if (!release.empty()) result += " " + release;
    result += "; " + machine;
    return result;
}

std::string user_agent() {
    static const std::string agent = std::string(settings::USER_AGENT_LIB) + "/" +
                                     std::string(settings::LIBRARY_VERSION) +
                                     " (" + platform_info() + ")";
    return agent;
}

}
