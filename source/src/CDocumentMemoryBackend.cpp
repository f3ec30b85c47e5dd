/**
 * @file CDocumentMemoryBackend.cpp
 * @brief Memory-only backend of the HRMS document store
 * @version 0.1
 * @date 2025-12-02
 */

#include "CDocumentMemoryBackend.hpp"

namespace lap
{
namespace hrms
{
    core::Result< Document > DocumentMemoryBackend::Load() noexcept
    {
        using result = core::Result< Document >;

        core::LockGuard lock( m_mtxData );
        try {
            return result::FromValue( m_document );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "DocumentMemoryBackend::Load failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageUnavailable );
        }
    }

    core::Result< void > DocumentMemoryBackend::Persist( const Document& document ) noexcept
    {
        using result = core::Result< void >;

        core::LockGuard lock( m_mtxData );
        try {
            m_document = document;
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "DocumentMemoryBackend::Persist failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }

        return result::FromValue();
    }

    core::Result< core::UInt64 > DocumentMemoryBackend::GetSize() const noexcept
    {
        using result = core::Result< core::UInt64 >;

        core::LockGuard lock( m_mtxData );
        try {
            return result::FromValue( static_cast< core::UInt64 >( m_document.ToJson().dump().size() ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_WARN << "DocumentMemoryBackend::GetSize failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }
} // namespace hrms
} // namespace lap
