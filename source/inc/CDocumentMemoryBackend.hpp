/**
 * @file CDocumentMemoryBackend.hpp
 * @brief Memory-only backend of the HRMS document store
 * @version 0.1
 * @date 2025-12-02
 * 
 * Keeps the last persisted document in process memory. Nothing survives a
 * restart; used for tests and for running without a writable medium.
 */
#ifndef LAP_HRMS_DOCUMENTMEMORYBACKEND_HPP
#define LAP_HRMS_DOCUMENTMEMORYBACKEND_HPP

#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"
#include "IDocumentBackend.hpp"

namespace lap
{
namespace hrms
{
    class DocumentMemoryBackend final : public IDocumentBackend
    {
    public:
        IMP_OPERATOR_NEW(DocumentMemoryBackend)

    public:
        core::Result< Document > Load() noexcept override;
        core::Result< void > Persist( const Document& document ) noexcept override;
        core::Result< core::UInt64 > GetSize() const noexcept override;

        core::Bool SupportsPersistence() const noexcept override            { return false; }
        BackendType GetBackendType() const noexcept override                { return BackendType::kMemory; }
        core::Bool available() const noexcept override                      { return true; }

        DocumentMemoryBackend() noexcept = default;
        ~DocumentMemoryBackend() noexcept override = default;

    private:
        DocumentMemoryBackend( const DocumentMemoryBackend& ) = delete;
        DocumentMemoryBackend& operator=( const DocumentMemoryBackend& ) = delete;

    private:
        mutable core::Mutex                                 m_mtxData;
        Document                                            m_document;
    };
} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_DOCUMENTMEMORYBACKEND_HPP
