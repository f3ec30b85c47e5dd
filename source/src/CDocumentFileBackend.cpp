/**
 * @file CDocumentFileBackend.cpp
 * @brief JSON file backend of the HRMS document store
 * @version 0.1
 * @date 2025-12-02
 * 
 * @note This implementation follows Core module constraints:
 * - Uses core::File::Util::ReadBinary/WriteBinary (no std::ifstream/ofstream)
 * - Uses core::Path for path operations
 * - Uses core::Result for error handling
 */

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <nlohmann/json.hpp>
#include <lap/core/CFile.hpp>
#include <lap/core/CPath.hpp>
#include "CDocumentFileBackend.hpp"
#include "CDocumentMemoryBackend.hpp"
#include "CStoragePathManager.hpp"

namespace lap
{
namespace hrms
{
    core::UniqueHandle< IDocumentBackend > CreateDocumentBackend( const HrmsConfig& config ) noexcept
    {
        if ( config.backendType == BackendType::kMemory ) {
            LAP_HRMS_LOG_INFO << "Using memory-only document backend";
            return core::MakeUnique< DocumentMemoryBackend >();
        }

        return core::MakeUnique< DocumentFileBackend >( config.storageRoot, config.instance, config.keepRedundancy );
    }

    // ==================== IDocumentBackend Interface Implementation ====================

    core::Result< Document > DocumentFileBackend::Load() noexcept
    {
        using result = core::Result< Document >;

        if ( !m_bAvailable ) return result::FromError( HrmsErrc::kStorageUnavailable );

        core::LockGuard lock( m_mtxFile );

        core::String currentPath = getCurrentPath();
        core::Bool bFirstRun = !core::File::Util::exists( currentPath.data() );

        if ( !bFirstRun ) {
            core::Vector< core::UInt8 > fileData;
            if ( !core::File::Util::ReadBinary( currentPath.data(), fileData ) ) {
                LAP_HRMS_LOG_ERROR << "DocumentFileBackend::Load failed to read file: " << currentPath;
                return result::FromError( HrmsErrc::kStorageUnavailable );
            }
            bFirstRun = fileData.empty();
        }

        if ( bFirstRun ) {
            LAP_HRMS_LOG_INFO << "No stored document found (first run), initializing: " << currentPath;

            Document document;
            auto persistResult = persistUnlocked( document );
            if ( !persistResult.HasValue() ) {
                LAP_HRMS_LOG_ERROR << "Cannot persist the initial document";
                return result::FromError( HrmsErrc::kStorageUnavailable );
            }
            return result::FromValue( ::std::move( document ) );
        }

        auto parseResult = parseFromFile( currentPath );
        if ( parseResult.HasValue() ) return parseResult;

        // unreadable medium is not corruption, keep redundancy untouched
        if ( parseResult.Error().Value() == static_cast< core::ErrorDomain::CodeType >( HrmsErrc::kStorageUnavailable ) ) {
            return parseResult;
        }

        LAP_HRMS_LOG_WARN << "Current document is corrupted, trying redundancy copy";
        return recoverFromRedundancy();
    }

    core::Result< void > DocumentFileBackend::Persist( const Document& document ) noexcept
    {
        using result = core::Result< void >;

        if ( !m_bAvailable ) return result::FromError( HrmsErrc::kStorageUnavailable );

        core::LockGuard lock( m_mtxFile );
        return persistUnlocked( document );
    }

    core::Result< core::UInt64 > DocumentFileBackend::GetSize() const noexcept
    {
        using result = core::Result< core::UInt64 >;

        if ( !m_bAvailable ) return result::FromError( HrmsErrc::kNotInitialized );

        core::LockGuard lock( m_mtxFile );

        core::String currentPath = getCurrentPath();
        if ( !core::File::Util::exists( currentPath.data() ) ) {
            return result::FromValue( static_cast< core::UInt64 >( 0 ) );
        }

        core::Vector< core::UInt8 > fileData;
        if ( !core::File::Util::ReadBinary( currentPath, fileData ) ) {
            LAP_HRMS_LOG_WARN << "DocumentFileBackend::GetSize failed to read file: " << currentPath;
            return result::FromError( HrmsErrc::kStorageUnavailable );
        }

        return result::FromValue( static_cast< core::UInt64 >( fileData.size() ) );
    }

    // ==================== Persist Workflow ====================

    core::Result< void > DocumentFileBackend::persistUnlocked( const Document& document ) noexcept
    {
        using result = core::Result< void >;

        core::String updatePath = getUpdatePath();

        // Phase 1: Save to update/ directory (not current/)
        auto saveResult = saveToFile( updatePath, document );
        if ( !saveResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Failed to save to update/ directory";
            core::File::Util::remove( updatePath.data() );
            return saveResult;
        }

        // Phase 2: Validate data integrity
        auto validateResult = validateDataIntegrity( updatePath );
        if ( !validateResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Integrity validation failed, aborting commit";
            core::File::Util::remove( updatePath.data() );
            return result::FromError( HrmsErrc::kStorageError );
        }

        // Phase 3: Backup current/ to redundancy/
        if ( m_bKeepRedundancy ) {
            auto backupResult = backupToRedundancy();
            if ( !backupResult.HasValue() ) {
                LAP_HRMS_LOG_ERROR << "Backup to redundancy failed, aborting commit";
                core::File::Util::remove( updatePath.data() );
                return backupResult;
            }
        }

        // Phase 4: Atomic replace
        auto replaceResult = atomicReplaceCurrentWithUpdate();
        if ( !replaceResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Atomic replace failed - current document preserved";
            core::File::Util::remove( updatePath.data() );
            return replaceResult;
        }

        LAP_HRMS_LOG_DEBUG << "Document committed: " << getCurrentPath();
        return result::FromValue();
    }

    // ==================== File I/O Operations (using core::File) ====================

    core::Result< Document > DocumentFileBackend::parseFromFile( core::StringView strFile ) const noexcept
    {
        using result = core::Result< Document >;

        core::Vector< core::UInt8 > fileData;
        if ( !core::File::Util::ReadBinary( strFile.data(), fileData ) ) {
            LAP_HRMS_LOG_WARN << "DocumentFileBackend::parseFromFile failed to read file: " << strFile.data();
            return result::FromError( HrmsErrc::kStorageUnavailable );
        }

        core::String jsonContent( fileData.begin(), fileData.end() );

        nlohmann::json root;
        try {
            root = nlohmann::json::parse( jsonContent );
        } catch ( const nlohmann::json::parse_error& e ) {
            LAP_HRMS_LOG_WARN.logFormat( "DocumentFileBackend::parseFromFile parse JSON %s failed with exception: %s!!!", strFile.data(), e.what() );
            return result::FromError( HrmsErrc::kIntegrityCorrupted );
        }

        return Document::FromJson( root );
    }

    core::Result< void > DocumentFileBackend::saveToFile( core::StringView strFile, const Document& document ) const noexcept
    {
        using result = core::Result< void >;

        try {
            std::string jsonContent = document.ToJson().dump( 4 );

            if ( !core::File::Util::WriteBinary( strFile.data(),
                                                 reinterpret_cast< const core::UInt8* >( jsonContent.data() ),
                                                 jsonContent.size(),
                                                 true ) ) {
                LAP_HRMS_LOG_ERROR << "DocumentFileBackend::saveToFile failed to write file: " << strFile.data();
                return result::FromError( HrmsErrc::kStorageError );
            }

            return result::FromValue();
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR.logFormat( "DocumentFileBackend::saveToFile %s failed with exception: %s!!!", strFile.data(), e.what() );
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

    // ==================== Integrity & Backup Methods ====================

    core::Result< void > DocumentFileBackend::validateDataIntegrity( core::StringView filePath ) const noexcept
    {
        using result = core::Result< void >;

        if ( !core::File::Util::exists( filePath.data() ) ) {
            LAP_HRMS_LOG_ERROR << "Integrity check failed: File not found - " << filePath.data();
            return result::FromError( HrmsErrc::kIntegrityCorrupted );
        }

        auto parseResult = parseFromFile( filePath );
        if ( !parseResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Integrity check failed: staged document is not decodable - " << filePath.data();
            return result::FromError( HrmsErrc::kIntegrityCorrupted );
        }

        return result::FromValue();
    }

    core::Result< void > DocumentFileBackend::backupToRedundancy() const noexcept
    {
        using result = core::Result< void >;

        core::String currentPath = getCurrentPath();
        core::String redundancyPath = getRedundancyPath();

        if ( !core::File::Util::exists( currentPath.data() ) ) {
            // first commit, nothing to back up
            return result::FromValue();
        }

        core::Vector< core::UInt8 > fileData;
        if ( !core::File::Util::ReadBinary( currentPath.data(), fileData ) ) {
            LAP_HRMS_LOG_ERROR << "Failed to read current file for backup: " << currentPath.data();
            return result::FromError( HrmsErrc::kStorageError );
        }

        // an empty current/ file carries nothing worth keeping
        if ( fileData.empty() ) return result::FromValue();

        if ( !core::File::Util::WriteBinary( redundancyPath.data(),
                                             fileData.data(),
                                             fileData.size(),
                                             true ) ) {
            LAP_HRMS_LOG_ERROR << "Failed to write redundancy backup: " << redundancyPath.data();
            return result::FromError( HrmsErrc::kStorageError );
        }

        return result::FromValue();
    }

    core::Result< void > DocumentFileBackend::atomicReplaceCurrentWithUpdate() const noexcept
    {
        using result = core::Result< void >;

        core::String updatePath = getUpdatePath();
        core::String currentPath = getCurrentPath();

        // POSIX rename is atomic within one filesystem
        if ( ::rename( updatePath.c_str(), currentPath.c_str() ) != 0 ) {
            LAP_HRMS_LOG_ERROR << "Atomic rename failed: " << ::strerror( errno );
            return result::FromError( HrmsErrc::kStorageError );
        }

        return result::FromValue();
    }

    core::Result< Document > DocumentFileBackend::recoverFromRedundancy() noexcept
    {
        using result = core::Result< Document >;

        core::String redundancyPath = getRedundancyPath();
        if ( !core::File::Util::exists( redundancyPath.data() ) ) {
            LAP_HRMS_LOG_ERROR << "No redundancy copy available: " << redundancyPath;
            return result::FromError( HrmsErrc::kIntegrityCorrupted );
        }

        auto parseResult = parseFromFile( redundancyPath );
        if ( !parseResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Redundancy copy is corrupted too: " << redundancyPath;
            return result::FromError( HrmsErrc::kIntegrityCorrupted );
        }

        // write the recovered version back without overwriting the redundancy copy with garbage
        core::Bool bKeepRedundancy = m_bKeepRedundancy;
        m_bKeepRedundancy = false;
        auto persistResult = persistUnlocked( parseResult.Value() );
        m_bKeepRedundancy = bKeepRedundancy;

        if ( !persistResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Cannot restore current document from redundancy";
            return result::FromError( HrmsErrc::kStorageUnavailable );
        }

        LAP_HRMS_LOG_WARN << "Current document restored from redundancy copy";
        return parseResult;
    }

    // ==================== Constructor & Destructor ====================

    DocumentFileBackend::~DocumentFileBackend() noexcept
    {
        m_bAvailable = false;
    }

    DocumentFileBackend::DocumentFileBackend( core::StringView storageRoot, core::StringView instance, core::Bool keepRedundancy ) noexcept
        : m_bKeepRedundancy( keepRedundancy )
        , m_instancePath( CStoragePathManager::getInstancePath( storageRoot, instance ) )
    {
        LAP_HRMS_LOG_INFO << "DocumentFileBackend initialized with instance: " << m_instancePath;

        auto createResult = CStoragePathManager::createStorageStructure( storageRoot, instance );
        if ( !createResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Failed to create document directory structure for: " << m_instancePath;
            m_bAvailable = false;
            return;
        }

        m_bAvailable = true;
    }

    // ==================== Directory Path Helpers ====================

    core::String DocumentFileBackend::getCurrentPath() const noexcept
    {
        return CStoragePathManager::getDocumentPath( m_instancePath, LAP_HRMS_CATEGORY_CURRENT, LAP_HRMS_DOCUMENT_FILE );
    }

    core::String DocumentFileBackend::getUpdatePath() const noexcept
    {
        return CStoragePathManager::getDocumentPath( m_instancePath, LAP_HRMS_CATEGORY_UPDATE, LAP_HRMS_DOCUMENT_FILE );
    }

    core::String DocumentFileBackend::getRedundancyPath() const noexcept
    {
        return CStoragePathManager::getDocumentPath( m_instancePath, LAP_HRMS_CATEGORY_REDUNDANCY, LAP_HRMS_REDUNDANCY_FILE );
    }

} // namespace hrms
} // namespace lap
