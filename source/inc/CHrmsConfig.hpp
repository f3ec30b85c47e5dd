/**
 * @file CHrmsConfig.hpp
 * @brief Loading and validation of the "hrms" configuration module
 * @version 0.1
 * @date 2025-12-02
 */
#ifndef LAP_HRMS_HRMSCONFIG_HPP
#define LAP_HRMS_HRMSCONFIG_HPP

#include <nlohmann/json.hpp>
#include <lap/core/CResult.hpp>

#include "CDataType.hpp"
#include "CHrmsErrorDomain.hpp"

namespace lap
{
namespace hrms
{
    /**
     * @brief Decode an "hrms" module block, absent fields keep their defaults
     * @return kInvalidArgument when a field has the wrong JSON type
     */
    core::Result< HrmsConfig > ParseHrmsConfig( const nlohmann::json& moduleConfig ) noexcept;

    /**
     * @brief Load the "hrms" module from core::ConfigManager
     *
     * The PORT environment variable, when set to a number, overrides port.
     */
    core::Result< HrmsConfig > LoadHrmsConfig() noexcept;

    core::Result< void > ValidateConfig( const HrmsConfig& config ) noexcept;

} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_HRMSCONFIG_HPP
