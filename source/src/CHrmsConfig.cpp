/**
 * @file CHrmsConfig.cpp
 * @brief Loading and validation of the "hrms" configuration module
 * @version 0.1
 * @date 2025-12-02
 */

#include <cerrno>
#include <cstdlib>
#include <lap/core/CConfig.hpp>
#include "CHrmsConfig.hpp"

namespace lap
{
namespace hrms
{
    core::Result< HrmsConfig > ParseHrmsConfig( const nlohmann::json& moduleConfig ) noexcept
    {
        using result = core::Result< HrmsConfig >;

        HrmsConfig config;
        if ( moduleConfig.is_null() || moduleConfig.empty() ) return result::FromValue( config );

        if ( !moduleConfig.is_object() ) {
            LAP_HRMS_LOG_ERROR << "HRMS module config is not an object";
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        try {
            config.storageRoot          = moduleConfig.value( "storageRoot", config.storageRoot );
            config.instance             = moduleConfig.value( "instance", config.instance );
            config.keepRedundancy       = moduleConfig.value( "keepRedundancy", config.keepRedundancy );
            config.persistTimeoutMs     = moduleConfig.value( "persistTimeoutMs", config.persistTimeoutMs );
            config.address              = moduleConfig.value( "address", config.address );
            core::UInt64 port           = moduleConfig.value( "port", static_cast< core::UInt64 >( config.port ) );
            if ( port > 65535U ) {
                LAP_HRMS_LOG_ERROR << "port out of range: " << port;
                return result::FromError( HrmsErrc::kInvalidArgument );
            }
            config.port                 = static_cast< core::UInt32 >( port );
            config.ioThreads            = moduleConfig.value( "ioThreads", config.ioThreads );
            config.pbkdf2Iterations     = moduleConfig.value( "pbkdf2Iterations", config.pbkdf2Iterations );

            core::String backendType    = moduleConfig.value( "backendType", core::String( "file" ) );
            if ( backendType == "file" ) {
                config.backendType = BackendType::kFile;
            } else if ( backendType == "memory" ) {
                config.backendType = BackendType::kMemory;
            } else {
                LAP_HRMS_LOG_ERROR << "Unknown backendType: " << backendType;
                return result::FromError( HrmsErrc::kInvalidArgument );
            }

            auto collections = moduleConfig.value( "collections", nlohmann::json::object() );
            for ( auto&& it : collections.items() ) {
                Collection collection;
                if ( !CollectionFromName( it.key(), collection ) ) {
                    LAP_HRMS_LOG_WARN << "Ignoring config of unknown collection: " << it.key();
                    continue;
                }

                auto fields = it.value().value( "allowedFields", nlohmann::json::array() );
                config.allowedFields[ it.key() ] = fields.get< core::Vector< core::String > >();
            }
        } catch ( const nlohmann::json::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Failed to decode hrms config: " << e.what();
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        return result::FromValue( config );
    }

    core::Result< HrmsConfig > LoadHrmsConfig() noexcept
    {
        using result = core::Result< HrmsConfig >;

        nlohmann::json moduleConfig;
        try {
            auto& configMgr = core::ConfigManager::getInstance();
            moduleConfig = configMgr.getModuleConfigJson( LAP_HRMS_CONFIG_MODULE );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Failed to read hrms config: " << e.what();
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        if ( moduleConfig.is_null() || moduleConfig.empty() ) {
            LAP_HRMS_LOG_WARN << "HRMS module config not found, using defaults";
        }

        auto parseResult = ParseHrmsConfig( moduleConfig );
        if ( !parseResult.HasValue() ) return parseResult;

        HrmsConfig config = parseResult.Value();

        const core::Char* envPort = ::std::getenv( "PORT" );
        if ( envPort != nullptr && *envPort != '\0' ) {
            core::Char* end = nullptr;
            errno = 0;
            unsigned long long port = ::std::strtoull( envPort, &end, 10 );
            if ( end == nullptr || *end != '\0' || envPort[0] == '-' ) {
                LAP_HRMS_LOG_WARN << "Ignoring non-numeric PORT: " << envPort;
            } else if ( errno == ERANGE || port > 65535ULL ) {
                LAP_HRMS_LOG_WARN << "Ignoring out of range PORT: " << envPort;
            } else {
                config.port = static_cast< core::UInt32 >( port );
            }
        }

        return result::FromValue( config );
    }

    core::Result< void > ValidateConfig( const HrmsConfig& config ) noexcept
    {
        using result = core::Result< void >;

        if ( config.port == 0 || config.port > 65535U ) {
            LAP_HRMS_LOG_ERROR << "port out of range: " << config.port;
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        if ( config.persistTimeoutMs == 0 ) {
            LAP_HRMS_LOG_ERROR << "persistTimeoutMs cannot be zero";
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        if ( config.ioThreads == 0 ) {
            LAP_HRMS_LOG_ERROR << "ioThreads cannot be zero";
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        if ( config.pbkdf2Iterations == 0 ) {
            LAP_HRMS_LOG_ERROR << "pbkdf2Iterations cannot be zero";
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        if ( config.backendType == BackendType::kFile && config.storageRoot.empty() ) {
            LAP_HRMS_LOG_ERROR << "storageRoot cannot be empty for the file backend";
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        return result::FromValue();
    }

} // namespace hrms
} // namespace lap
