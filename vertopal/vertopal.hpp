#ifndef VERTOPAL_HPP
#define VERTOPAL_HPP

// Configuration and logging
#include <vertopal/config/config.hpp>
#include <vertopal/config/settings.hpp>
#include <vertopal/util/logger.hpp>

// Errors
#include <vertopal/api/errors.hpp>
#include <vertopal/api/response_inspector.hpp>

// API
#include <vertopal/api/enums.hpp>
#include <vertopal/api/credential.hpp>
#include <vertopal/api/transport.hpp>
#include <vertopal/api/api_v1.hpp>
#include <vertopal/api/converter.hpp>        // converter and conversion workflow

// Input and output adapters
#include <vertopal/io/protocols.hpp>
#include <vertopal/io/file.hpp>
#include <vertopal/io/memory.hpp>

// HTTP client
#include <vertopal/http/client/client.hpp>      // standalone client implementing http_backend
#include <vertopal/http/client/form.hpp>

// Utilities
#include <vertopal/util/format.hpp>
#include <vertopal/util/stream_chunker.hpp>

#endif // VERTOPAL_HPP
