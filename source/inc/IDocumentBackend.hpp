/**
 * @file IDocumentBackend.hpp
 * @brief Durable store interface - whole-document load and atomic persist
 * @version 0.1
 * @date 2025-12-02
 * 
 * Implementations own the single persisted document. There are no partial
 * or field-level writes: every Persist() replaces the whole document, and a
 * reader of the medium observes either the previous or the new version.
 */

#ifndef LAP_HRMS_IDOCUMENTBACKEND_HPP
#define LAP_HRMS_IDOCUMENTBACKEND_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CDocument.hpp"

namespace lap
{
namespace hrms
{
    /**
     * @brief Abstract interface for durable document stores
     *
     * Thread Safety:
     * - All methods must be thread-safe
     *
     * Error Handling:
     * - All methods return core::Result<T> with HrmsErrc codes, no exceptions thrown
     */
    class IDocumentBackend
    {
    public:
        IMP_OPERATOR_NEW(IDocumentBackend)

        virtual ~IDocumentBackend() noexcept = default;

        /**
         * @brief Read the persisted document
         *
         * When nothing was persisted yet the default document (five empty
         * collections) is returned and persisted immediately.
         *
         * @return kStorageUnavailable when the medium cannot be read or written,
         *         kIntegrityCorrupted when the stored data cannot be recovered
         */
        virtual core::Result< Document > Load() noexcept = 0;

        /**
         * @brief Replace the persisted document atomically
         * @return kStorageError on failure, the previous version stays intact
         */
        virtual core::Result< void > Persist( const Document& document ) noexcept = 0;

        /**
         * @brief Size in bytes of the persisted representation
         */
        virtual core::Result< core::UInt64 > GetSize() const noexcept = 0;

        virtual core::Bool SupportsPersistence() const noexcept = 0;

        virtual BackendType GetBackendType() const noexcept = 0;

        virtual core::Bool available() const noexcept = 0;
    };

    /**
     * @brief Create the backend selected by config.backendType
     */
    core::UniqueHandle< IDocumentBackend > CreateDocumentBackend( const HrmsConfig& config ) noexcept;

} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_IDOCUMENTBACKEND_HPP
