#include "string.hpp"
#include <string>
#include <system_error>

namespace fastuuid::utils::string {

std::string str_err(int errnum)
{
    return std::system_category().message(errnum);
}

} // namespace fastuuid::utils::string
