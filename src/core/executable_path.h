#pragma once
#include <string>

namespace eio::core {

    // Absolute path of the running binary, empty if it cannot be resolved
    std::string getExecutablePath();

    // Directory holding the running binary; config.ini is looked up here
    std::string getExecutableDirectory();

}// namespace eio::core
