#pragma once

#include <cstdlib>
#include <string>

namespace eclp {

// TRACE=1 turns on "TRACE <event> key=value ..." lines on stdout.
inline bool trace_enabled() {
    static const bool enabled = (std::getenv("TRACE") && std::string(std::getenv("TRACE")) == "1");
    return enabled;
}

} // namespace eclp
