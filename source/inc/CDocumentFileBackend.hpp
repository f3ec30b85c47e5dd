/**
 * @file CDocumentFileBackend.hpp
 * @brief JSON file backend of the HRMS document store
 * @version 0.1
 * @date 2025-12-02
 * 
 * Features:
 * - Human-readable JSON storage
 * - Atomic write operations (staged update file + rename)
 * - Redundancy copy of the previous version for recovery
 * 
 * @note Uses core::File for all file I/O and core::Path for path operations
 */
#ifndef LAP_HRMS_DOCUMENTFILEBACKEND_HPP
#define LAP_HRMS_DOCUMENTFILEBACKEND_HPP

#include <nlohmann/json.hpp>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"
#include "IDocumentBackend.hpp"

namespace lap
{
namespace hrms
{
    /**
     * @brief JSON file backend for the document store
     * 
     * File Format:
     * ```json
     * {
     *   "users": [], "employees": [], "attendance": [],
     *   "leaves": [], "notifications": []
     * }
     * ```
     * 
     * Persist Workflow:
     * 1. Serialize into update/hrms_data.json
     * 2. Re-parse the update file to validate it
     * 3. Copy current/ to redundancy/ (if enabled)
     * 4. rename() update/ onto current/
     */
    class DocumentFileBackend final : public IDocumentBackend
    {
    public:
        IMP_OPERATOR_NEW(DocumentFileBackend)

    public:
        core::Result< Document > Load() noexcept override;
        core::Result< void > Persist( const Document& document ) noexcept override;

        /**
         * @brief Get document file size on disk
         */
        core::Result< core::UInt64 > GetSize() const noexcept override;

        core::Bool SupportsPersistence() const noexcept override            { return true; }
        BackendType GetBackendType() const noexcept override                { return BackendType::kFile; }
        core::Bool available() const noexcept override                      { return m_bAvailable; }

        ~DocumentFileBackend() noexcept override;
        DocumentFileBackend( core::StringView storageRoot, core::StringView instance, core::Bool keepRedundancy = true ) noexcept;

    protected:
        /**
         * @brief Read and decode one document file
         * @return kStorageUnavailable if unreadable, kIntegrityCorrupted if undecodable
         */
        core::Result< Document > parseFromFile( core::StringView strFile ) const noexcept;

        core::Result< void > saveToFile( core::StringView strFile, const Document& document ) const noexcept;

        /**
         * @brief Validate the staged file before it replaces current/
         */
        core::Result< void > validateDataIntegrity( core::StringView filePath ) const noexcept;

        core::Result< void > backupToRedundancy() const noexcept;

        /**
         * @brief Atomic replace: move update/ onto current/
         * @note Uses rename() for atomicity
         */
        core::Result< void > atomicReplaceCurrentWithUpdate() const noexcept;

        /**
         * @brief Load the redundancy copy and promote it to current/
         */
        core::Result< Document > recoverFromRedundancy() noexcept;

        core::Result< void > persistUnlocked( const Document& document ) noexcept;

        core::String getCurrentPath() const noexcept;
        core::String getUpdatePath() const noexcept;
        core::String getRedundancyPath() const noexcept;

        DocumentFileBackend() = delete;
        DocumentFileBackend( const DocumentFileBackend& ) = delete;
        DocumentFileBackend( DocumentFileBackend&& ) = delete;
        DocumentFileBackend& operator=( const DocumentFileBackend& ) = delete;

    private:
        core::Bool                                          m_bAvailable{ false };  ///< Storage structure exists
        core::Bool                                          m_bKeepRedundancy{ true };
        core::String                                        m_instancePath;         ///< Instance base path
        mutable core::Mutex                                 m_mtxFile;              ///< Serializes access to the files
    };
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_DOCUMENTFILEBACKEND_HPP
