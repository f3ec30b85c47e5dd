/**
 * @file CDocument.hpp
 * @brief In-memory document of the HRMS record store
 * @version 0.1
 * @date 2025-12-02
 * 
 * The document always holds the five named collections, each an ordered
 * JSON array of record objects. No I/O happens here; persistence and
 * notification are driven by RecordService.
 */
#ifndef LAP_HRMS_DOCUMENT_HPP
#define LAP_HRMS_DOCUMENT_HPP

#include <array>
#include <nlohmann/json.hpp>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>

#include "CDataType.hpp"
#include "CHrmsErrorDomain.hpp"

namespace lap
{
namespace hrms
{
    /**
     * @brief Outcome of Document::Upsert
     */
    struct UpsertOutcome
    {
        ChangeKind      kind;       ///< kCreated when appended, kUpdated when merged
        Record          stored;     ///< record as stored after the operation
    };

    class Document final
    {
    public:
        IMP_OPERATOR_NEW(Document)

        /**
         * @brief Build a document from its persisted JSON form
         * @note Absent or null collections become empty, a collection that is not
         *       an array of objects yields kIntegrityCorrupted
         */
        static core::Result< Document >         FromJson( const nlohmann::json& root ) noexcept;

        nlohmann::json                          ToJson() const;

        const nlohmann::json&                   GetCollection( Collection collection ) const noexcept;
        core::Size                              Count( Collection collection ) const noexcept;

        const Record*                           FindByIdentity( Collection collection, core::StringView idValue ) const noexcept;

        /**
         * @brief Locate an attendance record by its (employeeId, date) pair
         * @param keyFields record carrying at least employeeId and date
         * @return nullptr when the collection is not attendance or nothing matches
         */
        const Record*                           FindByCompositeKey( Collection collection, const Record& keyFields ) const noexcept;

        /**
         * @brief Merge into the matching record, or append when there is none
         *
         * Attendance matches on (employeeId, date), every other collection on id.
         * Merge is a shallow field overwrite: incoming fields replace or extend,
         * fields absent from the incoming record stay untouched.
         */
        UpsertOutcome                           Upsert( Collection collection, const Record& record );

        /**
         * @brief Drop every record carrying idValue, no-op when absent
         * @return true if a record was removed
         */
        core::Bool                              RemoveByIdentity( Collection collection, core::StringView idValue );

        core::Bool                              operator==( const Document& other ) const noexcept;
        core::Bool                              operator!=( const Document& other ) const noexcept    { return !( *this == other ); }

        Document();
        Document( const Document& ) = default;
        Document( Document&& ) noexcept = default;
        Document& operator=( const Document& ) = default;
        Document& operator=( Document&& ) noexcept = default;
        ~Document() = default;

    private:
        static core::Bool                       hasIdentity( const Record& record, core::StringView idValue ) noexcept;
        static core::Bool                       sameStringField( const Record& left, const Record& right, const core::Char* field ) noexcept;

        nlohmann::json&                         collectionRef( Collection collection ) noexcept;
        core::Int64                             indexOf( Collection collection, const Record& record ) const noexcept;

    private:
        std::array< nlohmann::json, kCollectionCount >      m_collections;
    };

} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_DOCUMENT_HPP
