#ifndef CONVO_DELIVERY_ACCESS_POLICY_HPP
#define CONVO_DELIVERY_ACCESS_POLICY_HPP

/**
 * @file AccessPolicy.hpp
 * @brief Upgrade-time admission check.
 *
 * Authentication and conversation membership live outside this service.
 * The server asks an IAccessPolicy before upgrading a connection; the call
 * runs on the store worker pool and may block.
 */

#include <string>

namespace convo::delivery
{
    struct ConnectRequest
    {
        std::string conversation_id;
        std::string user_id;
        std::string client_id; ///< empty when the client did not supply one
        std::string token;     ///< opaque credential from the query string
        std::string remote_address;
    };

    enum class AccessDecision
    {
        Allow,
        Unauthenticated, ///< 401
        Forbidden        ///< 403
    };

    class IAccessPolicy
    {
    public:
        virtual ~IAccessPolicy() = default;

        virtual AccessDecision check(const ConnectRequest &request) = 0;
    };

    class AllowAllPolicy : public IAccessPolicy
    {
    public:
        AccessDecision check(const ConnectRequest &) override { return AccessDecision::Allow; }
    };

} // namespace convo::delivery

#endif // CONVO_DELIVERY_ACCESS_POLICY_HPP
