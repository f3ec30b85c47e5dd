/**
 * @file CRecordService.cpp
 * @brief The only component allowed to mutate the HRMS document
 * @version 0.1
 * @date 2025-12-02
 */

#include <chrono>
#include <future>
#include <boost/asio/post.hpp>
#include "CRecordService.hpp"

namespace lap
{
namespace hrms
{
    RecordService::RecordService( core::UniqueHandle< IDocumentBackend > backend,
                                  core::SharedHandle< IEventPublisher > publisher,
                                  core::SharedHandle< ICredentialService > credentials,
                                  core::SharedHandle< IIdentityGenerator > identities,
                                  const HrmsConfig& config )
        : m_backend( ::std::move( backend ) )
        , m_publisher( ::std::move( publisher ) )
        , m_credentials( ::std::move( credentials ) )
        , m_identities( ::std::move( identities ) )
        , m_fieldPolicy( config.allowedFields )
        , m_persistTimeoutMs( config.persistTimeoutMs == 0 ? LAP_HRMS_DEFAULT_PERSIST_TIMEOUT_MS : config.persistTimeoutMs )
        , m_snapshot( ::std::make_shared< const Document >() )
    {
        ;
    }

    RecordService::~RecordService() noexcept
    {
        // let an in-flight persist finish before the backend goes away
        m_storageWorker.join();
        m_bOpen = false;
    }

    // ==================== Storage Worker ====================

    template < typename T >
    core::Result< T > RecordService::runOnStorageWorker( ::std::function< core::Result< T >() > task ) noexcept
    {
        using result = core::Result< T >;

        try {
            auto packaged = ::std::make_shared< ::std::packaged_task< core::Result< T >() > >( ::std::move( task ) );
            auto abandoned = ::std::make_shared< ::std::atomic< core::Bool > >( false );
            auto future = packaged->get_future();

            // a task the caller gave up on before it started is skipped
            ::boost::asio::post( m_storageWorker, [packaged, abandoned]() {
                if ( abandoned->load() ) return;
                ( *packaged )();
            } );

            if ( future.wait_for( ::std::chrono::milliseconds( m_persistTimeoutMs ) ) != ::std::future_status::ready ) {
                abandoned->store( true );
                LAP_HRMS_LOG_ERROR << "Storage operation did not complete within " << m_persistTimeoutMs << " ms";
                m_bResyncRequired = true;
                return result::FromError( HrmsErrc::kStorageUnavailable );
            }

            return future.get();
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Storage worker failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

    core::Result< void > RecordService::Open() noexcept
    {
        using result = core::Result< void >;

        if ( !m_backend ) {
            LAP_HRMS_LOG_FATAL << "RecordService has no durable store";
            return result::FromError( HrmsErrc::kNotInitialized );
        }

        core::LockGuard lock( m_mtxWriter );

        IDocumentBackend* backend = m_backend.get();
        auto loadResult = runOnStorageWorker< Document >( [backend]() { return backend->Load(); } );
        if ( !loadResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Cannot load the document: " << loadResult.Error().Message();
            return result::FromError( loadResult.Error() );
        }

        try {
            Document loaded = ::std::move( loadResult ).Value();
            setSnapshot( ::std::move( loaded ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Cannot install loaded document: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
        m_bResyncRequired = false;
        m_bOpen = true;

        LAP_HRMS_LOG_INFO << "Record store opened, employees: " << Snapshot()->Count( Collection::kEmployees )
                          << ", users: " << Snapshot()->Count( Collection::kUsers );
        return result::FromValue();
    }

    core::Result< Document > RecordService::stageUnlocked() noexcept
    {
        using result = core::Result< Document >;

        if ( !m_bOpen ) return result::FromError( HrmsErrc::kNotInitialized );

        if ( m_bResyncRequired ) {
            // a timed-out write may have landed after the caller was told it failed
            LAP_HRMS_LOG_WARN << "Previous storage operation timed out, restoring committed document";

            IDocumentBackend* backend = m_backend.get();
            DocumentSnapshot committed = Snapshot();
            auto restoreResult = runOnStorageWorker< void >( [backend, committed]() { return backend->Persist( *committed ); } );
            if ( !restoreResult.HasValue() ) {
                m_bResyncRequired = true;
                return result::FromError( HrmsErrc::kStorageUnavailable );
            }
            m_bResyncRequired = false;
        }

        try {
            return result::FromValue( Document( *Snapshot() ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Cannot stage document: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

    core::Result< void > RecordService::commitUnlocked( Document&& staged ) noexcept
    {
        using result = core::Result< void >;

        core::SharedHandle< Document > pending;
        try {
            pending = ::std::make_shared< Document >( ::std::move( staged ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Cannot allocate staged document: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }

        IDocumentBackend* backend = m_backend.get();
        auto persistResult = runOnStorageWorker< void >( [backend, pending]() { return backend->Persist( *pending ); } );
        if ( !persistResult.HasValue() ) {
            LAP_HRMS_LOG_ERROR << "Persist failed, mutation discarded: " << persistResult.Error().Message();
            if ( m_bResyncRequired ) scheduleRestore();
            return persistResult;
        }

        core::WriteLockGuard lock( m_rwSnapshot );
        m_snapshot = pending;

        return result::FromValue();
    }

    void RecordService::scheduleRestore() noexcept
    {
        // queued behind the timed-out write, brings the store back to the committed document
        try {
            IDocumentBackend* backend = m_backend.get();
            DocumentSnapshot committed = Snapshot();
            ::boost::asio::post( m_storageWorker, [backend, committed]() {
                auto restoreResult = backend->Persist( *committed );
                if ( !restoreResult.HasValue() ) {
                    LAP_HRMS_LOG_ERROR << "Restoring committed document failed: " << restoreResult.Error().Message();
                }
            } );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Cannot schedule restore of committed document: " << e.what();
        }
    }

    void RecordService::setSnapshot( Document&& document )
    {
        auto snapshot = ::std::make_shared< const Document >( ::std::move( document ) );

        core::WriteLockGuard lock( m_rwSnapshot );
        m_snapshot = snapshot;
    }

    RecordService::DocumentSnapshot RecordService::Snapshot() const noexcept
    {
        core::ReadLockGuard lock( m_rwSnapshot );
        return m_snapshot;
    }

    // ==================== Events ====================

    const core::Char* RecordService::eventName( Collection collection, ChangeKind kind ) noexcept
    {
        switch ( collection ) {
        case Collection::kEmployees:
            return kind == ChangeKind::kDeleted ? "employee_delete" : "employee_update";
        case Collection::kAttendance:
            return "attendance_update";
        case Collection::kLeaves:
            return kind == ChangeKind::kCreated ? "leave_created" : "leave_update";
        case Collection::kNotifications:
            return "notification";
        case Collection::kUsers:
            break;
        }

        return "";
    }

    void RecordService::publish( Collection collection, ChangeKind kind, const core::String& name, nlohmann::json payload ) noexcept
    {
        if ( !m_publisher || collection == Collection::kUsers ) return;

        try {
            ChangeEvent event{ collection, kind, name, ::std::move( payload ) };
            m_publisher->Publish( event );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Cannot build change event " << name << ": " << e.what();
        }
    }

    // ==================== Mutations ====================

    core::Result< void > RecordService::validateRecord( Collection collection, const Record& record ) const noexcept
    {
        using result = core::Result< void >;

        if ( !record.is_object() ) return result::FromError( HrmsErrc::kValidationFailed );

        auto&& id = record.find( LAP_HRMS_FIELD_ID );
        if ( id != record.end() && !id->is_null() && !id->is_string() ) {
            LAP_HRMS_LOG_DEBUG << "Rejecting non-string id on " << CollectionName( collection );
            return result::FromError( HrmsErrc::kValidationFailed );
        }

        if ( collection == Collection::kAttendance ) {
            for ( auto&& field : { LAP_HRMS_FIELD_EMPLOYEE_ID, LAP_HRMS_FIELD_DATE } ) {
                auto&& it = record.find( field );
                if ( it == record.end() || !it->is_string() || it->get_ref< const std::string& >().empty() ) {
                    LAP_HRMS_LOG_DEBUG << "Attendance record without " << field;
                    return result::FromError( HrmsErrc::kValidationFailed );
                }
            }
        }

        return result::FromValue();
    }

    core::Result< UpsertResult > RecordService::Upsert( Collection collection, const Record& record ) noexcept
    {
        using result = core::Result< UpsertResult >;

        if ( collection == Collection::kUsers ) {
            LAP_HRMS_LOG_WARN << "Users are only created through CreateSuperAdmin";
            return result::FromError( HrmsErrc::kInvalidArgument );
        }

        auto validateResult = validateRecord( collection, record );
        if ( !validateResult.HasValue() ) return result::FromError( validateResult.Error() );

        core::LockGuard lock( m_mtxWriter );

        auto stageResult = stageUnlocked();
        if ( !stageResult.HasValue() ) return result::FromError( stageResult.Error() );

        try {
            Document staged = ::std::move( stageResult ).Value();
            Record incoming = m_fieldPolicy.Filter( collection, record );

            auto&& id = incoming.find( LAP_HRMS_FIELD_ID );
            if ( id == incoming.end() || id->is_null() || id->get_ref< const std::string& >().empty() ) {
                core::String generated = m_identities->NewIdentity();
                if ( generated.empty() ) {
                    LAP_HRMS_LOG_ERROR << "Identity source returned no identity";
                    return result::FromError( HrmsErrc::kStorageError );
                }
                incoming[ LAP_HRMS_FIELD_ID ] = ::std::move( generated );
            }

            const Record* existing = ( collection == Collection::kAttendance )
                                   ? staged.FindByCompositeKey( collection, incoming )
                                   : staged.FindByIdentity( collection, incoming[ LAP_HRMS_FIELD_ID ].get_ref< const std::string& >() );
            if ( existing != nullptr ) FieldPolicy::Protect( collection, *existing, incoming );

            if ( collection == Collection::kAttendance ) {
                // identity must stay unique even though attendance matches on (employeeId, date)
                const Record* owner = staged.FindByIdentity( collection, incoming[ LAP_HRMS_FIELD_ID ].get_ref< const std::string& >() );
                if ( owner != nullptr && owner != existing ) {
                    LAP_HRMS_LOG_DEBUG << "Attendance id " << incoming[ LAP_HRMS_FIELD_ID ].get< core::String >()
                                       << " already belongs to another (employeeId, date)";
                    return result::FromError( HrmsErrc::kValidationFailed );
                }
            }

            UpsertOutcome outcome = staged.Upsert( collection, incoming );

            UpsertResult upsertResult;
            upsertResult.id     = outcome.stored[ LAP_HRMS_FIELD_ID ].get< core::String >();
            upsertResult.kind   = outcome.kind;
            upsertResult.stored = outcome.stored;

            auto commitResult = commitUnlocked( ::std::move( staged ) );
            if ( !commitResult.HasValue() ) return result::FromError( commitResult.Error() );

            LAP_HRMS_LOG_DEBUG << CollectionName( collection ) << " record " << upsertResult.id << " " << ChangeKindName( outcome.kind );

            publish( collection, outcome.kind, eventName( collection, outcome.kind ), outcome.stored );
            return result::FromValue( ::std::move( upsertResult ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Upsert on " << CollectionName( collection ) << " failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

    core::Result< void > RecordService::DeleteEmployee( core::StringView id ) noexcept
    {
        using result = core::Result< void >;

        core::LockGuard lock( m_mtxWriter );

        auto stageResult = stageUnlocked();
        if ( !stageResult.HasValue() ) return result::FromError( stageResult.Error() );

        try {
            Document staged = ::std::move( stageResult ).Value();
            if ( !staged.RemoveByIdentity( Collection::kEmployees, id ) ) {
                LAP_HRMS_LOG_DEBUG << "Employee " << core::String( id ) << " not present, nothing to delete";
                return result::FromValue();
            }

            auto commitResult = commitUnlocked( ::std::move( staged ) );
            if ( !commitResult.HasValue() ) return commitResult;

            core::String identity( id );
            publish( Collection::kEmployees, ChangeKind::kDeleted, eventName( Collection::kEmployees, ChangeKind::kDeleted ), identity );
            return result::FromValue();
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "DeleteEmployee failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

    core::Result< void > RecordService::UpdateLeaveStatus( core::StringView id, const nlohmann::json& status ) noexcept
    {
        using result = core::Result< void >;

        if ( status.is_null() ) return result::FromError( HrmsErrc::kValidationFailed );

        core::LockGuard lock( m_mtxWriter );

        auto stageResult = stageUnlocked();
        if ( !stageResult.HasValue() ) return result::FromError( stageResult.Error() );

        try {
            Document staged = ::std::move( stageResult ).Value();
            if ( staged.FindByIdentity( Collection::kLeaves, id ) == nullptr ) {
                return result::FromError( HrmsErrc::kNotFound );
            }

            Record change = {
                { LAP_HRMS_FIELD_ID, core::String( id ) },
                { LAP_HRMS_FIELD_STATUS, status }
            };
            staged.Upsert( Collection::kLeaves, change );

            auto commitResult = commitUnlocked( ::std::move( staged ) );
            if ( !commitResult.HasValue() ) return commitResult;

            publish( Collection::kLeaves, ChangeKind::kUpdated, eventName( Collection::kLeaves, ChangeKind::kUpdated ), change );
            return result::FromValue();
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "UpdateLeaveStatus failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

    // ==================== Accounts ====================

    Record RecordService::PublicUserView( const Record& user )
    {
        Record view = Record::object();
        for ( auto&& field : { LAP_HRMS_FIELD_ID, LAP_HRMS_FIELD_USERNAME, LAP_HRMS_FIELD_ROLE, LAP_HRMS_FIELD_DISPLAY_NAME } ) {
            auto&& it = user.find( field );
            view[ field ] = ( it != user.end() ) ? *it : nlohmann::json();
        }

        return view;
    }

    static const Record* findUserByName( const Document& document, core::StringView username ) noexcept
    {
        for ( auto&& user : document.GetCollection( Collection::kUsers ) ) {
            auto&& it = user.find( LAP_HRMS_FIELD_USERNAME );
            if ( it != user.end() && it->is_string() && it->get_ref< const std::string& >() == username ) {
                return &user;
            }
        }

        return nullptr;
    }

    core::Result< void > RecordService::CreateSuperAdmin( core::StringView username, core::StringView password ) noexcept
    {
        using result = core::Result< void >;

        if ( username.empty() || password.empty() ) return result::FromError( HrmsErrc::kValidationFailed );
        if ( !m_bOpen ) return result::FromError( HrmsErrc::kNotInitialized );

        // hash outside the writer lock, re-checked below
        if ( findUserByName( *Snapshot(), username ) != nullptr ) return result::FromError( HrmsErrc::kDuplicateUser );

        auto hashResult = m_credentials->Hash( password );
        if ( !hashResult.HasValue() ) return result::FromError( hashResult.Error() );

        core::LockGuard lock( m_mtxWriter );

        auto stageResult = stageUnlocked();
        if ( !stageResult.HasValue() ) return result::FromError( stageResult.Error() );

        try {
            Document staged = ::std::move( stageResult ).Value();
            if ( findUserByName( staged, username ) != nullptr ) return result::FromError( HrmsErrc::kDuplicateUser );

            core::String userId = m_identities->NewIdentity();
            if ( userId.empty() ) {
                LAP_HRMS_LOG_ERROR << "Identity source returned no identity";
                return result::FromError( HrmsErrc::kStorageError );
            }

            Record user = {
                { LAP_HRMS_FIELD_ID, userId },
                { LAP_HRMS_FIELD_USERNAME, core::String( username ) },
                { LAP_HRMS_FIELD_PASSWORD, hashResult.Value() },
                { LAP_HRMS_FIELD_ROLE, LAP_HRMS_ROLE_SUPERADMIN },
                { LAP_HRMS_FIELD_DISPLAY_NAME, core::String( username ) }
            };
            staged.Upsert( Collection::kUsers, user );

            auto commitResult = commitUnlocked( ::std::move( staged ) );
            if ( !commitResult.HasValue() ) return commitResult;

            LAP_HRMS_LOG_INFO << "Superadmin created: " << core::String( username );
            return result::FromValue();
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "CreateSuperAdmin failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

    core::Result< Record > RecordService::Login( core::StringView username, core::StringView password ) noexcept
    {
        using result = core::Result< Record >;

        if ( !m_bOpen ) return result::FromError( HrmsErrc::kNotInitialized );

        auto snapshot = Snapshot();
        const Record* user = findUserByName( *snapshot, username );
        if ( user == nullptr ) return result::FromError( HrmsErrc::kInvalidCredentials );

        auto&& encoded = user->find( LAP_HRMS_FIELD_PASSWORD );
        if ( encoded == user->end() || !encoded->is_string() ||
             !m_credentials->Verify( password, encoded->get_ref< const std::string& >() ) ) {
            return result::FromError( HrmsErrc::kInvalidCredentials );
        }

        try {
            return result::FromValue( PublicUserView( *user ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Login failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

    // ==================== Reads ====================

    core::Result< nlohmann::json > RecordService::List( Collection collection ) const noexcept
    {
        using result = core::Result< nlohmann::json >;

        if ( !m_bOpen ) return result::FromError( HrmsErrc::kNotInitialized );

        auto snapshot = Snapshot();
        try {
            if ( collection != Collection::kUsers ) return result::FromValue( snapshot->GetCollection( collection ) );

            nlohmann::json users = nlohmann::json::array();
            for ( auto&& user : snapshot->GetCollection( Collection::kUsers ) ) {
                users.push_back( PublicUserView( user ) );
            }
            return result::FromValue( ::std::move( users ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "List " << CollectionName( collection ) << " failed: " << e.what();
            return result::FromError( HrmsErrc::kStorageError );
        }
    }

} // namespace hrms
} // namespace lap
