#include <string>
#include <hostcall/core/hello.h>

namespace hostcall::core{

std::string hello() { return std::string(GREETING); }

}
