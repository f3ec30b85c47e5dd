/**
 * @file CChangeNotifier.cpp
 * @brief Change events, subscription registry and fan-out publisher
 * @version 0.1
 * @date 2025-12-02
 */

#include "CChangeNotifier.hpp"

namespace lap
{
namespace hrms
{
    core::String EncodeEventFrame( const ChangeEvent& event )
    {
        nlohmann::json frame{ { "event", event.name }, { "data", event.payload } };
        return frame.dump( -1, ' ', false, nlohmann::json::error_handler_t::replace );
    }

    SubscriptionRegistry::SubscriptionId SubscriptionRegistry::Connect( core::SharedHandle< ISubscriber > subscriber ) noexcept
    {
        core::LockGuard lock( m_mtxSubscribers );

        SubscriptionId id = m_nextId++;
        m_subscribers[ id ] = ::std::move( subscriber );

        LAP_HRMS_LOG_INFO << "Subscriber connected: " << id << ", total " << m_subscribers.size();
        return id;
    }

    void SubscriptionRegistry::Disconnect( SubscriptionId id ) noexcept
    {
        core::LockGuard lock( m_mtxSubscribers );

        if ( m_subscribers.erase( id ) > 0 ) {
            LAP_HRMS_LOG_INFO << "Subscriber disconnected: " << id << ", total " << m_subscribers.size();
        }
    }

    core::Size SubscriptionRegistry::Count() const noexcept
    {
        core::LockGuard lock( m_mtxSubscribers );
        return m_subscribers.size();
    }

    core::Vector< core::SharedHandle< ISubscriber > > SubscriptionRegistry::Subscribers() const noexcept
    {
        core::Vector< core::SharedHandle< ISubscriber > > subscribers;

        core::LockGuard lock( m_mtxSubscribers );
        subscribers.reserve( m_subscribers.size() );
        for ( auto&& it : m_subscribers ) {
            subscribers.emplace_back( it.second );
        }

        return subscribers;
    }

    void ChangeNotifier::Publish( const ChangeEvent& event ) noexcept
    {
        // delivered outside the registry lock
        auto subscribers = m_registry.Subscribers();

        LAP_HRMS_LOG_DEBUG << "Publishing " << event.name << " to " << subscribers.size() << " subscriber(s)";

        for ( auto&& subscriber : subscribers ) {
            subscriber->OnEvent( event );
        }
    }

} // namespace hrms
} // namespace lap
