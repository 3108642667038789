#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <format>
#include <iterator>
#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "utils.hpp"
#include "file.hpp"
#include "cmd.hpp"
#include "config.hpp"
#include "log.hpp"
#include "json_file_store.hpp"
#include "sum_tree.hpp"
#include "projector.hpp"

namespace pdp
{
    static constexpr std::uint32_t MAJOR_VERSION = 0;
    static constexpr std::uint32_t MINOR_VERSION = 1;
    static constexpr std::uint32_t PATCH_VERSION = 0;
}
