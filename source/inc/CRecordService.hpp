/**
 * @file CRecordService.hpp
 * @brief The only component allowed to mutate the HRMS document
 * @version 0.1
 * @date 2025-12-02
 * 
 * Mutation workflow (single writer):
 * 1. Copy the committed snapshot into a staged document
 * 2. Assign identity, resolve target, upsert or remove on the staged copy
 * 3. Persist the staged copy on the storage worker (bounded wait)
 * 4. On success commit the staged copy as the new snapshot and publish
 * 
 * Readers take the committed snapshot and never wait for a writer's persist.
 * A persist that misses its deadline is reported as failed; the committed
 * document is written again behind it so the durable store never keeps it.
 */
#ifndef LAP_HRMS_RECORDSERVICE_HPP
#define LAP_HRMS_RECORDSERVICE_HPP

#include <atomic>
#include <functional>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <lap/core/CResult.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"
#include "CDocument.hpp"
#include "CFieldPolicy.hpp"
#include "CChangeNotifier.hpp"
#include "CHrmsErrorDomain.hpp"
#include "ICredentialService.hpp"
#include "IDocumentBackend.hpp"
#include "IIdentityGenerator.hpp"

namespace lap
{
namespace hrms
{
    /**
     * @brief Result of a successful create-or-update
     */
    struct UpsertResult
    {
        core::String        id;         ///< identity of the stored record
        ChangeKind          kind;
        Record              stored;     ///< record after merge
    };

    class RecordService final
    {
    public:
        IMP_OPERATOR_NEW(RecordService)

        using DocumentSnapshot = core::SharedHandle< const Document >;

    public:
        /**
         * @brief Load the document from the durable store
         * @return kStorageUnavailable or kIntegrityCorrupted, the service stays closed
         */
        core::Result< void >                    Open() noexcept;

        core::Bool                              IsOpen() const noexcept                 { return m_bOpen.load(); }

        /**
         * @brief Create or update a record of employees, attendance, leaves or notifications
         *
         * A missing or empty id is generated. Attendance requires employeeId and
         * date and collapses onto the stored record with the same pair.
         *
         * @return kValidationFailed, kInvalidArgument (users collection),
         *         kStorageError/kStorageUnavailable, kNotInitialized
         */
        core::Result< UpsertResult >            Upsert( Collection collection, const Record& record ) noexcept;

        /**
         * @brief Remove an employee, succeeds without change when absent
         */
        core::Result< void >                    DeleteEmployee( core::StringView id ) noexcept;

        /**
         * @brief Replace only the status field of an existing leave
         * @return kNotFound when no leave carries id
         */
        core::Result< void >                    UpdateLeaveStatus( core::StringView id, const nlohmann::json& status ) noexcept;

        /**
         * @brief Create a user with the superadmin role and a hashed credential
         * @return kValidationFailed on empty name or secret, kDuplicateUser on name collision
         */
        core::Result< void >                    CreateSuperAdmin( core::StringView username, core::StringView password ) noexcept;

        /**
         * @brief Verify a credential
         * @return public user view {id, username, role, display_name},
         *         kInvalidCredentials for an unknown name and a wrong secret alike
         */
        core::Result< Record >                  Login( core::StringView username, core::StringView password ) noexcept;

        /**
         * @brief Ordered records of the committed snapshot
         * @note users are returned as public views, never with their credential
         */
        core::Result< nlohmann::json >          List( Collection collection ) const noexcept;

        DocumentSnapshot                        Snapshot() const noexcept;

        static Record                           PublicUserView( const Record& user );

        RecordService( core::UniqueHandle< IDocumentBackend > backend,
                       core::SharedHandle< IEventPublisher > publisher,
                       core::SharedHandle< ICredentialService > credentials,
                       core::SharedHandle< IIdentityGenerator > identities,
                       const HrmsConfig& config );
        ~RecordService() noexcept;

    private:
        RecordService( const RecordService& ) = delete;
        RecordService& operator=( const RecordService& ) = delete;

        /**
         * @brief Run a storage call on the worker and wait at most m_persistTimeoutMs
         */
        template < typename T >
        core::Result< T >                       runOnStorageWorker( ::std::function< core::Result< T >() > task ) noexcept;

        /**
         * @brief Staged copy of the committed document
         * @note After a storage timeout the committed document is persisted again first
         * @note m_mtxWriter must be held
         */
        core::Result< Document >                stageUnlocked() noexcept;

        /**
         * @brief Persist staged and make it the committed snapshot
         * @note m_mtxWriter must be held
         */
        core::Result< void >                    commitUnlocked( Document&& staged ) noexcept;

        /**
         * @brief Queue a persist of the committed document behind a timed-out write
         */
        void                                    scheduleRestore() noexcept;

        void                                    publish( Collection collection, ChangeKind kind,
                                                         const core::String& name, nlohmann::json payload ) noexcept;

        static const core::Char*                eventName( Collection collection, ChangeKind kind ) noexcept;

        core::Result< void >                    validateRecord( Collection collection, const Record& record ) const noexcept;

        void                                    setSnapshot( Document&& document );

    private:
        core::UniqueHandle< IDocumentBackend >              m_backend;
        core::SharedHandle< IEventPublisher >               m_publisher;
        core::SharedHandle< ICredentialService >            m_credentials;
        core::SharedHandle< IIdentityGenerator >            m_identities;
        FieldPolicy                                         m_fieldPolicy;
        core::UInt32                                        m_persistTimeoutMs;

        ::std::atomic< core::Bool >                         m_bOpen{ false };
        core::Bool                                          m_bResyncRequired{ false };     ///< guarded by m_mtxWriter

        core::Mutex                                         m_mtxWriter;                    ///< serializes mutate + persist
        mutable core::RWLock                                m_rwSnapshot;                   ///< guards m_snapshot handle
        DocumentSnapshot                                    m_snapshot;

        ::boost::asio::thread_pool                          m_storageWorker{ 1 };
    };

} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_RECORDSERVICE_HPP
