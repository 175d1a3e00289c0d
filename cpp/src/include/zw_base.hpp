#pragma once
/**
 * @file zw_base.hpp
 * @brief Layer 1: Basic utilities (formatting, debug/panic, module definitions).
 *
 * Pulls in layer 0 and the header-only or near-header-only helpers that every other
 * component relies on. Nothing here depends on a running service.
 */
#include "zw_platform.hpp"

// Standard library support required by format_tools, debug_info and module_def
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
#include "utils/module_def.hpp"
