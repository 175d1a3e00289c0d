#pragma once
/**
 * @file zw_service.hpp
 * @brief Layer 2: Services with a managed lifetime (lifecycle manager, logger).
 */
#include "zw_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
