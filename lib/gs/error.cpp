/* This file is part of Graph Sentinel project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cerrno>
#include <cstring>
#include <typeinfo>
#include <gs/error.hpp>
#include <gs/logger.hpp>

namespace graph_sentinel {
    error::error(const std::string &msg, const std::source_location &loc)
        : error { true, fmt::format("{} at {}:{}", msg, loc.file_name(), loc.line()) }
    {
    }

    error::error(const std::string &msg, const std::exception &cause, const std::source_location &loc)
        : error { true, fmt::format("{} at {}:{} caused by {}: {}", msg, loc.file_name(), loc.line(), typeid(cause).name(), cause.what()) }
    {
    }

    error::error(const bool trace, const std::string &msg): std::runtime_error { msg }
    {
        if (trace)
            logger::debug("an exception created: {}", msg);
    }

    error_sys::error_sys(const std::string &msg, const std::source_location &loc)
        : error { fmt::format("{}, errno: {}, strerror: {}", msg, errno, std::strerror(errno)), loc }
    {
    }
}
