#pragma once

#include "stkm/Extensions.hpp"

#include <cstdio>
#include <string_view>

namespace stkm {

void report_error(std::string_view message, FILE* file = stderr);
void report_warning(std::string_view message, FILE* file = stderr);
void report_info(std::string_view message, FILE* file = stderr);

// rejected extensions are warnings, never fatal
void report_extensions(LoadReport const& report, bool verbose, FILE* file = stderr);

} // stkm
