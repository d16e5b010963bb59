#pragma once

#include "http_server.hpp"

#include <string>

namespace skill
{
    // Resolves "module:object" (object defaults to "application") to a
    // request handler. Throws config_error for unknown applications.
    request_handler resolve_application(const std::string &name);
}
