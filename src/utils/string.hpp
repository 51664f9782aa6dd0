#pragma once
#include <string>

namespace fastuuid::utils::string {

std::string str_err(int errnum);

} // namespace fastuuid::utils::string
