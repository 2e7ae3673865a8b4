#ifndef VERTOPAL_UTIL_PLATFORM_HPP
#define VERTOPAL_UTIL_PLATFORM_HPP

#include <string>

namespace vertopal::util {

// "linux 6.1.0; x64" style description of the running system
std::string platform_info();

// "VertopalCppLib/1.0.0 (linux 6.1.0; x64)"
std::string user_agent();

}

#endif
