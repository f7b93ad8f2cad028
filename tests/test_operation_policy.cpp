#include <catch2/catch_test_macros.hpp>
#include "sharecost/operation_policy.hpp"

using sharecost::Capability;
using sharecost::CapabilitySet;
using sharecost::ErrorCode;
using sharecost::Operation;
using sharecost::Principal;
using sharecost::access_for;
using sharecost::authorize;

TEST_CASE("Mutating operations name their capability", "[operation_policy]")
{
    REQUIRE(access_for(Operation::DeleteGroup).capability == Capability::DeleteGroup);
    REQUIRE(access_for(Operation::AddMember).capability == Capability::ManageMembers);
    REQUIRE(access_for(Operation::RemoveMember).capability == Capability::ManageMembers);
    REQUIRE(access_for(Operation::UpdateMemberPayment).capability == Capability::UpdatePayment);
    REQUIRE(access_for(Operation::AddTransaction).capability == Capability::AddExpenses);
    REQUIRE(access_for(Operation::UpdateTransaction).capability == Capability::EditExpenses);
    REQUIRE(access_for(Operation::DeleteTransaction).capability == Capability::EditExpenses);
}

TEST_CASE("Reads and token derivation need only a token", "[operation_policy]")
{
    for (auto op : {Operation::GetGroup, Operation::ListTransactions, Operation::GetBalances,
                    Operation::GetSettlements, Operation::CreateShareLink, Operation::MergeTokens})
    {
        auto access = access_for(op);
        REQUIRE(access.requires_token);
        REQUIRE_FALSE(access.capability.has_value());
    }
}

TEST_CASE("Group creation is open", "[operation_policy]")
{
    auto access = access_for(Operation::CreateGroup);
    REQUIRE_FALSE(access.requires_token);
    REQUIRE_FALSE(access.capability.has_value());
}

TEST_CASE("Operation names are stable", "[operation_policy]")
{
    REQUIRE(sharecost::operation_name(Operation::AddTransaction) == "add_transaction");
    REQUIRE(sharecost::operation_name(Operation::MergeTokens) == "merge_tokens");
}

TEST_CASE("authorize enforces the table", "[operation_policy]")
{
    Principal read_only{"0b7c6f2a-1d3e-4a5b-9c8d-7e6f5a4b3c2d", CapabilitySet::none()};
    REQUIRE(authorize(read_only, Operation::GetBalances).has_value());
    REQUIRE(authorize(read_only, Operation::CreateShareLink).has_value());

    auto denied = authorize(read_only, Operation::AddTransaction);
    REQUIRE_FALSE(denied.has_value());
    REQUIRE(denied.error().code == ErrorCode::AuthForbidden);

    Principal editor{read_only.group_id, CapabilitySet(false, false, false, true, true)};
    REQUIRE(authorize(editor, Operation::UpdateTransaction).has_value());
    REQUIRE_FALSE(authorize(editor, Operation::RemoveMember).has_value());
}
