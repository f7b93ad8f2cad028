#pragma once

#include "types.hpp"
#include "capability.hpp"
#include "authority.hpp"
#include <optional>
#include <string_view>

namespace sharecost
{

    /** Operations the routing layer can invoke on a group */
    enum class Operation
    {
        CreateGroup,
        GetGroup,
        DeleteGroup,
        AddMember,
        RemoveMember,
        UpdateMemberPayment,
        ListTransactions,
        AddTransaction,
        UpdateTransaction,
        DeleteTransaction,
        GetBalances,
        GetSettlements,
        CreateShareLink,
        MergeTokens
    };

    std::string_view operation_name(Operation op);

    /**
     * How an operation is guarded: whether it needs a token at all, and the single
     * capability it requires (none for reads and for token derivation, which is
     * attenuated instead).
     */
    struct OperationAccess
    {
        bool requires_token{true};
        std::optional<Capability> capability;
    };

    /** Static access table; every operation has exactly one entry */
    OperationAccess access_for(Operation op);

    /**
     * Check the table entry for op against the principal.
     * AuthForbidden when the required capability is missing.
     */
    Result<void> authorize(const Principal &principal, Operation op);

} // namespace sharecost
