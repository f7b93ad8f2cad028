#include "sharecost/operation_policy.hpp"
#include <array>

namespace sharecost
{

    namespace
    {
        struct OperationDef
        {
            Operation op;
            std::string_view name;
            bool requires_token;
            std::optional<Capability> capability;
        };

        constexpr std::array<OperationDef, 14> kOperations = {
            OperationDef{Operation::CreateGroup, "create_group", false, std::nullopt},
            OperationDef{Operation::GetGroup, "get_group", true, std::nullopt},
            OperationDef{Operation::DeleteGroup, "delete_group", true, Capability::DeleteGroup},
            OperationDef{Operation::AddMember, "add_member", true, Capability::ManageMembers},
            OperationDef{Operation::RemoveMember, "remove_member", true, Capability::ManageMembers},
            OperationDef{Operation::UpdateMemberPayment, "update_member_payment", true, Capability::UpdatePayment},
            OperationDef{Operation::ListTransactions, "list_transactions", true, std::nullopt},
            OperationDef{Operation::AddTransaction, "add_transaction", true, Capability::AddExpenses},
            OperationDef{Operation::UpdateTransaction, "update_transaction", true, Capability::EditExpenses},
            OperationDef{Operation::DeleteTransaction, "delete_transaction", true, Capability::EditExpenses},
            OperationDef{Operation::GetBalances, "get_balances", true, std::nullopt},
            OperationDef{Operation::GetSettlements, "get_settlements", true, std::nullopt},
            OperationDef{Operation::CreateShareLink, "create_share_link", true, std::nullopt},
            OperationDef{Operation::MergeTokens, "merge_tokens", true, std::nullopt},
        };

        const OperationDef &def_of(Operation op)
        {
            return kOperations[static_cast<std::size_t>(op)];
        }
    } // namespace

    std::string_view operation_name(Operation op)
    {
        return def_of(op).name;
    }

    OperationAccess access_for(Operation op)
    {
        const auto &d = def_of(op);
        return OperationAccess{d.requires_token, d.capability};
    }

    Result<void> authorize(const Principal &principal, Operation op)
    {
        auto access = access_for(op);
        if (!access.capability)
            return {};
        return CapabilityAuthority::require(principal, *access.capability);
    }

} // namespace sharecost
