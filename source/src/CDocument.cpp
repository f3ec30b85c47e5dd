/**
 * @file CDocument.cpp
 * @brief In-memory document of the HRMS record store
 * @version 0.1
 * @date 2025-12-02
 */

#include "CDocument.hpp"

namespace lap
{
namespace hrms
{
    core::Bool CollectionFromName( core::StringView name, Collection &collection ) noexcept
    {
        for ( auto&& it : kAllCollections ) {
            if ( name == CollectionName( it ) ) {
                collection = it;
                return true;
            }
        }

        return false;
    }

    Document::Document()
    {
        for ( auto&& it : m_collections ) {
            it = nlohmann::json::array();
        }
    }

    core::Result< Document > Document::FromJson( const nlohmann::json& root ) noexcept
    {
        using result = core::Result< Document >;

        if ( root.is_null() ) return result::FromValue( Document() );

        if ( !root.is_object() ) {
            LAP_HRMS_LOG_ERROR << "Document root is not an object";
            return result::FromError( HrmsErrc::kIntegrityCorrupted );
        }

        try {
            Document doc;
            for ( auto&& collection : kAllCollections ) {
                auto&& it = root.find( CollectionName( collection ) );
                if ( it == root.end() || it->is_null() ) continue;

                if ( !it->is_array() ) {
                    LAP_HRMS_LOG_ERROR << "Collection " << CollectionName( collection ) << " is not an array";
                    return result::FromError( HrmsErrc::kIntegrityCorrupted );
                }

                for ( auto&& record : *it ) {
                    if ( !record.is_object() ) {
                        LAP_HRMS_LOG_ERROR << "Collection " << CollectionName( collection ) << " holds a non-object record";
                        return result::FromError( HrmsErrc::kIntegrityCorrupted );
                    }
                }

                doc.collectionRef( collection ) = *it;
            }

            return result::FromValue( ::std::move( doc ) );
        } catch ( const std::exception& e ) {
            LAP_HRMS_LOG_ERROR << "Document::FromJson failed: " << e.what();
            return result::FromError( HrmsErrc::kIntegrityCorrupted );
        }
    }

    nlohmann::json Document::ToJson() const
    {
        nlohmann::json root = nlohmann::json::object();

        for ( auto&& collection : kAllCollections ) {
            root[ CollectionName( collection ) ] = GetCollection( collection );
        }

        return root;
    }

    const nlohmann::json& Document::GetCollection( Collection collection ) const noexcept
    {
        return m_collections[ static_cast< core::Size >( collection ) ];
    }

    nlohmann::json& Document::collectionRef( Collection collection ) noexcept
    {
        return m_collections[ static_cast< core::Size >( collection ) ];
    }

    core::Size Document::Count( Collection collection ) const noexcept
    {
        return GetCollection( collection ).size();
    }

    core::Bool Document::hasIdentity( const Record& record, core::StringView idValue ) noexcept
    {
        auto&& it = record.find( LAP_HRMS_FIELD_ID );
        if ( it == record.end() || !it->is_string() ) return false;

        return it->get_ref< const std::string& >() == idValue;
    }

    core::Bool Document::sameStringField( const Record& left, const Record& right, const core::Char* field ) noexcept
    {
        auto&& l = left.find( field );
        auto&& r = right.find( field );

        if ( l == left.end() || r == right.end() ) return false;

        return *l == *r;
    }

    const Record* Document::FindByIdentity( Collection collection, core::StringView idValue ) const noexcept
    {
        if ( idValue.empty() ) return nullptr;

        for ( auto&& record : GetCollection( collection ) ) {
            if ( hasIdentity( record, idValue ) ) return &record;
        }

        return nullptr;
    }

    const Record* Document::FindByCompositeKey( Collection collection, const Record& keyFields ) const noexcept
    {
        if ( collection != Collection::kAttendance || !keyFields.is_object() ) return nullptr;

        for ( auto&& record : GetCollection( collection ) ) {
            if ( sameStringField( record, keyFields, LAP_HRMS_FIELD_EMPLOYEE_ID ) &&
                 sameStringField( record, keyFields, LAP_HRMS_FIELD_DATE ) ) {
                return &record;
            }
        }

        return nullptr;
    }

    core::Int64 Document::indexOf( Collection collection, const Record& record ) const noexcept
    {
        const nlohmann::json& records = GetCollection( collection );
        const core::Bool byCompositeKey = ( collection == Collection::kAttendance );

        auto&& id = record.find( LAP_HRMS_FIELD_ID );
        if ( !byCompositeKey && ( id == record.end() || !id->is_string() ) ) return -1;

        for ( core::Size i = 0; i < records.size(); ++i ) {
            const Record& candidate = records[ i ];
            core::Bool match = byCompositeKey
                ? ( sameStringField( candidate, record, LAP_HRMS_FIELD_EMPLOYEE_ID ) &&
                    sameStringField( candidate, record, LAP_HRMS_FIELD_DATE ) )
                : hasIdentity( candidate, id->get_ref< const std::string& >() );

            if ( match ) return static_cast< core::Int64 >( i );
        }

        return -1;
    }

    UpsertOutcome Document::Upsert( Collection collection, const Record& record )
    {
        nlohmann::json& records = collectionRef( collection );
        core::Int64 index = indexOf( collection, record );

        if ( index < 0 ) {
            records.push_back( record );
            return UpsertOutcome{ ChangeKind::kCreated, records.back() };
        }

        Record& existing = records[ static_cast< core::Size >( index ) ];
        for ( auto&& it = record.begin(); it != record.end(); ++it ) {
            existing[ it.key() ] = it.value();
        }

        return UpsertOutcome{ ChangeKind::kUpdated, existing };
    }

    core::Bool Document::RemoveByIdentity( Collection collection, core::StringView idValue )
    {
        nlohmann::json& records = collectionRef( collection );
        nlohmann::json kept = nlohmann::json::array();

        for ( auto&& record : records ) {
            if ( !hasIdentity( record, idValue ) ) kept.push_back( record );
        }

        core::Bool removed = kept.size() != records.size();
        records = ::std::move( kept );

        return removed;
    }

    core::Bool Document::operator==( const Document& other ) const noexcept
    {
        return m_collections == other.m_collections;
    }

} // namespace hrms
} // namespace lap
