#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>

#include <asio.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "native.h"
#include "utils.hpp"
#include "logo.hpp"
#include "file.hpp"
#include "crypto.hpp"
#include "parser.hpp"
#include "http.hpp"
#include "retry.hpp"
#include "cmd.hpp"
#include "config.hpp"
#include "chain.hpp"
#include "price.hpp"
#include "pipeline.hpp"
#include "adapters.hpp"
#include "daemon.hpp"

namespace tad
{
    inline constexpr int MAJOR_VERSION = 1;
    inline constexpr int MINOR_VERSION = 0;
    inline constexpr int PATCH_VERSION = 0;
}
