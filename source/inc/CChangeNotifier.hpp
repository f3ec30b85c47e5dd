/**
 * @file CChangeNotifier.hpp
 * @brief Change events, subscription registry and fan-out publisher
 * @version 0.1
 * @date 2025-12-02
 * 
 * Delivery is best-effort: no acknowledgment, no retry, no replay. A
 * subscriber that connects after an event was published never sees it.
 */
#ifndef LAP_HRMS_CHANGENOTIFIER_HPP
#define LAP_HRMS_CHANGENOTIFIER_HPP

#include <nlohmann/json.hpp>
#include <lap/core/CMemory.hpp>
#include <lap/core/CSync.hpp>

#include "CDataType.hpp"

namespace lap
{
namespace hrms
{
    /**
     * @brief Description of one completed, durable mutation
     */
    struct ChangeEvent
    {
        Collection          collection;
        ChangeKind          kind;
        core::String        name;           ///< wire event name, e.g. "employee_update"
        nlohmann::json      payload;        ///< stored record, or identity string on delete
    };

    /**
     * @brief Wire form of an event: {"event": name, "data": payload}
     * @note Invalid UTF-8 in the payload is replaced, never rejected
     */
    core::String EncodeEventFrame( const ChangeEvent& event );

    /**
     * @brief A connected real-time client
     */
    class ISubscriber
    {
    public:
        virtual ~ISubscriber() noexcept = default;

        /**
         * @brief Deliver one event, must not block on the client
         */
        virtual void OnEvent( const ChangeEvent& event ) noexcept = 0;
    };

    /**
     * @brief Event channel seen by RecordService
     */
    class IEventPublisher
    {
    public:
        virtual ~IEventPublisher() noexcept = default;

        virtual void Publish( const ChangeEvent& event ) noexcept = 0;
    };

    class SubscriptionRegistry final
    {
    public:
        IMP_OPERATOR_NEW(SubscriptionRegistry)

        using SubscriptionId = core::UInt64;

        SubscriptionId                              Connect( core::SharedHandle< ISubscriber > subscriber ) noexcept;

        /**
         * @brief Remove a subscriber, no-op for an unknown id
         */
        void                                        Disconnect( SubscriptionId id ) noexcept;

        core::Size                                  Count() const noexcept;

        /**
         * @brief Subscribers connected at the time of the call
         */
        core::Vector< core::SharedHandle< ISubscriber > >   Subscribers() const noexcept;

        SubscriptionRegistry() = default;
        ~SubscriptionRegistry() = default;

    private:
        SubscriptionRegistry( const SubscriptionRegistry& ) = delete;
        SubscriptionRegistry& operator=( const SubscriptionRegistry& ) = delete;

    private:
        mutable core::Mutex                                                     m_mtxSubscribers;
        SubscriptionId                                                          m_nextId{ 1 };
        core::Map< SubscriptionId, core::SharedHandle< ISubscriber > >          m_subscribers;
    };

    /**
     * @brief Fans every published event out to the registry
     */
    class ChangeNotifier final : public IEventPublisher
    {
    public:
        IMP_OPERATOR_NEW(ChangeNotifier)

        void Publish( const ChangeEvent& event ) noexcept override;

        explicit ChangeNotifier( SubscriptionRegistry& registry ) noexcept
            : m_registry( registry )
        {
            ;
        }
        ~ChangeNotifier() noexcept override = default;

    private:
        SubscriptionRegistry&                       m_registry;
    };

} // namespace hrms
} // namespace lap

#endif // LAP_HRMS_CHANGENOTIFIER_HPP
