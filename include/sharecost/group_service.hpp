#pragma once

#include "types.hpp"
#include "authority.hpp"
#include "group_store.hpp"
#include "ledger.hpp"
#include "models.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sharecost
{

    struct CreateGroupRequest
    {
        std::string name;
        std::vector<std::string> member_names;
        std::optional<std::string> currency;

        static Result<CreateGroupRequest> from_json(const nlohmann::json &j);
    };

    struct GroupCreated
    {
        Group group;
        std::string token; // carries CapabilitySet::all()

        nlohmann::json to_json() const;
    };

    /**
     * The operations behind the HTTP API.
     *
     * Every operation taking a Principal works on the principal's group only and
     * checks the operation's capability (see access_for) before the store is
     * touched, so a forbidden call leaves no trace.
     */
    class GroupService
    {
    public:
        /** The authority must outlive the service */
        GroupService(std::shared_ptr<GroupStore> store, const CapabilityAuthority &authority);

        Result<GroupCreated> create_group(const CreateGroupRequest &request);

        Result<Group> get_group(const Principal &principal);
        Result<void> delete_group(const Principal &principal);

        Result<Group> add_member(const Principal &principal, const std::string &name);

        /** ValidationError while the member is referenced by any transaction */
        Result<Group> remove_member(const Principal &principal, const MemberId &member_id);

        Result<Member> update_member_payment(const Principal &principal,
                                             const MemberId &member_id,
                                             const PaymentDetails &payment);

        /** Newest expense date first, creation time breaking ties */
        Result<std::vector<Transaction>> list_transactions(const Principal &principal);

        Result<Transaction> add_transaction(const Principal &principal, const TransactionDraft &draft);
        Result<Transaction> update_transaction(const Principal &principal,
                                               const TransactionId &id,
                                               const TransactionDraft &draft);
        Result<void> delete_transaction(const Principal &principal, const TransactionId &id);

        Result<std::vector<Balance>> get_balances(const Principal &principal);
        Result<std::vector<Settlement>> get_settlements(const Principal &principal);

        /** Share link with requested rights, capped by the principal's own */
        Result<IssuedToken> create_share_link(const Principal &principal, const CapabilitySet &requested);

        /** Token with the union of the principal's rights and other_token's */
        Result<IssuedToken> merge_tokens(const Principal &principal, std::string_view other_token);

    private:
        Result<Group> load_group(const Principal &principal);
        Result<Transaction> build_transaction(const Group &group, const TransactionDraft &draft) const;

        std::shared_ptr<GroupStore> store_;
        const CapabilityAuthority &authority_;
    };

} // namespace sharecost
