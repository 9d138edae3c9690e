#pragma once

#include <iostream>
#include <mailwire/detail/result.hpp>

inline void print_error(const mailwire::error_info& err)
{
    std::cout << "Error: " << mailwire::to_string(err.code) << " - " << err.message << "\n";
    if (!err.detail.empty())
        std::cout << "Detail:\n" << err.detail;
    if (err.sys)
        std::cout << "Sys: " << err.sys.message() << "\n";
    if (mailwire::is_temporary(err))
        std::cout << "The failure is temporary, retrying later may succeed.\n";
}
