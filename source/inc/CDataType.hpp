/**
 * @file CDataType.hpp
 * @author ddkv587 (ddkv587@gmail.com)
 * @brief Common types, log context and defaults of the HRMS record store
 * @version 0.1
 * @date 2025-12-02
 * 
 * 
 */
#ifndef LAP_HRMS_DATATYPE_HPP
#define LAP_HRMS_DATATYPE_HPP

#include <nlohmann/json.hpp>

// core
#include <lap/core/CCore.hpp>
#include <lap/core/CTypedef.hpp>
#include <lap/core/CString.hpp>
#include <lap/log/CLog.hpp>

namespace lap 
{
namespace hrms 
{
    // ========================================================================
    // Logging Configuration
    // ========================================================================
    #define LAP_HRMS_LOG_CONTEXT_ID       "HR"
    #define LAP_HRMS_LOG_CONTEXT_DESC     "HRMS log ctx"

#ifdef LAP_DEBUG
    #define LAP_HRMS_LOG                  LAP_LOG( LAP_HRMS_LOG_CONTEXT_ID, LAP_HRMS_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kVerbose )
    #define LAP_HRMS_LOG_VERBOSE          LAP_HRMS_LOG.LogVerbose().WithLocation( __FILE__, __LINE__ )
    #define LAP_HRMS_LOG_DEBUG            LAP_HRMS_LOG.LogDebug().WithLocation( __FILE__, __LINE__ )
    #define LAP_HRMS_LOG_INFO             LAP_HRMS_LOG.LogInfo().WithLocation( __FILE__, __LINE__ )
#else
    #define LAP_HRMS_LOG                  LAP_LOG( LAP_HRMS_LOG_CONTEXT_ID, LAP_HRMS_LOG_CONTEXT_DESC, ::lap::log::LogLevel::kWarn )
    #define LAP_HRMS_LOG_VERBOSE          LAP_HRMS_LOG.LogOff()
    #define LAP_HRMS_LOG_DEBUG            LAP_HRMS_LOG.LogOff()
    #define LAP_HRMS_LOG_INFO             LAP_HRMS_LOG.LogOff()
#endif
    #define LAP_HRMS_LOG_WARN             LAP_HRMS_LOG.LogWarn().WithLocation( __FILE__, __LINE__ )
    #define LAP_HRMS_LOG_ERROR            LAP_HRMS_LOG.LogError().WithLocation( __FILE__, __LINE__ )
    #define LAP_HRMS_LOG_FATAL            LAP_HRMS_LOG.LogFatal().WithLocation( __FILE__, __LINE__ )

    // ========================================================================
    // Default Configuration
    // ========================================================================
    #define LAP_HRMS_CONFIG_MODULE                  "hrms"
    #define LAP_HRMS_DEFAULT_STORAGE_ROOT           "/tmp/lap_hrms"
    #define LAP_HRMS_DEFAULT_INSTANCE               "default"
    #define LAP_HRMS_DEFAULT_ADDRESS                "0.0.0.0"
    #define LAP_HRMS_DEFAULT_PORT                   3000U
    #define LAP_HRMS_DEFAULT_IO_THREADS             4U
    #define LAP_HRMS_DEFAULT_PERSIST_TIMEOUT_MS     5000U
    #define LAP_HRMS_DEFAULT_PBKDF2_ITERATIONS      100000U

    // Storage layout
    #define LAP_HRMS_DOCUMENT_FILE                  "hrms_data.json"
    #define LAP_HRMS_REDUNDANCY_FILE                "hrms_data.json.bak"
    #define LAP_HRMS_CATEGORY_CURRENT               "current"
    #define LAP_HRMS_CATEGORY_UPDATE                "update"
    #define LAP_HRMS_CATEGORY_REDUNDANCY            "redundancy"

    // Record fields with fixed meaning
    #define LAP_HRMS_FIELD_ID                       "id"
    #define LAP_HRMS_FIELD_EMPLOYEE_ID              "employeeId"
    #define LAP_HRMS_FIELD_DATE                     "date"
    #define LAP_HRMS_FIELD_STATUS                   "status"
    #define LAP_HRMS_FIELD_USERNAME                 "username"
    #define LAP_HRMS_FIELD_PASSWORD                 "password"
    #define LAP_HRMS_FIELD_ROLE                     "role"
    #define LAP_HRMS_FIELD_DISPLAY_NAME             "display_name"

    #define LAP_HRMS_ROLE_SUPERADMIN                "superadmin"

    /**
     * @brief A record is a flat mapping of field name to JSON value
     */
    using Record = nlohmann::json;

    /**
     * @brief The five named collections of the document, in persisted order
     */
    enum class Collection : core::UInt8
    {
        kUsers              = 0,
        kEmployees          = 1,
        kAttendance         = 2,
        kLeaves             = 3,
        kNotifications      = 4
    };

    constexpr core::UInt8 kCollectionCount = 5;

    constexpr Collection kAllCollections[ kCollectionCount ] = {
        Collection::kUsers,
        Collection::kEmployees,
        Collection::kAttendance,
        Collection::kLeaves,
        Collection::kNotifications
    };

    constexpr const core::Char* CollectionName( Collection collection ) noexcept
    {
        switch ( collection ) {
        case Collection::kUsers:            return "users";
        case Collection::kEmployees:        return "employees";
        case Collection::kAttendance:       return "attendance";
        case Collection::kLeaves:           return "leaves";
        case Collection::kNotifications:    return "notifications";
        }
        return "unknown";
    }

    core::Bool CollectionFromName( core::StringView name, Collection &collection ) noexcept;

    /**
     * @brief What a completed mutation did to its target record
     */
    enum class ChangeKind : core::UInt8
    {
        kCreated    = 0,
        kUpdated    = 1,
        kDeleted    = 2
    };

    constexpr const core::Char* ChangeKindName( ChangeKind kind ) noexcept
    {
        switch ( kind ) {
        case ChangeKind::kCreated:  return "created";
        case ChangeKind::kUpdated:  return "updated";
        case ChangeKind::kDeleted:  return "deleted";
        }
        return "unknown";
    }

    enum class BackendType : core::UInt8
    {
        kFile       = 0,
        kMemory     = 1
    };

    /**
     * @brief HRMS module configuration
     * Loaded from Core::ConfigManager "hrms" module
     */
    struct HrmsConfig {
        core::String storageRoot{ LAP_HRMS_DEFAULT_STORAGE_ROOT };
        core::String instance{ LAP_HRMS_DEFAULT_INSTANCE };
        BackendType backendType{ BackendType::kFile };
        core::Bool keepRedundancy{ true };
        core::UInt32 persistTimeoutMs{ LAP_HRMS_DEFAULT_PERSIST_TIMEOUT_MS };

        core::String address{ LAP_HRMS_DEFAULT_ADDRESS };
        core::UInt32 port{ LAP_HRMS_DEFAULT_PORT };
        core::UInt32 ioThreads{ LAP_HRMS_DEFAULT_IO_THREADS };

        core::UInt32 pbkdf2Iterations{ LAP_HRMS_DEFAULT_PBKDF2_ITERATIONS };

        // collection name -> fields accepted from callers, empty means any field
        core::Map< core::String, core::Vector< core::String > > allowedFields;
    };

} // namespace hrms
} // namespace lap

#endif
