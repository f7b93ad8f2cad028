#pragma once

#include "models.hpp"
#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

namespace sharecost
{

    /**
     * Net position of one member. Positive: the group owes them money.
     * Negative: they owe the group.
     */
    struct Balance
    {
        MemberId member_id;
        std::string member_name;
        Decimal balance{0};

        nlohmann::json to_json() const;
    };

    /** One payment of a settlement plan */
    struct Settlement
    {
        MemberId from;
        MemberId to;
        Decimal amount{0};

        nlohmann::json to_json() const;
    };

    /**
     * Compute every member's net balance from the transaction history.
     *
     * Pure and re-derived from scratch on each call. The output has one entry per
     * member, in member order. Amounts are converted into the group currency with
     * the transaction's exchange rate (taken as 1 when the currencies match).
     * Expense and income with an empty split contribute nothing; legs naming an
     * id that is not in `members` are dropped. The result does not depend on the
     * order of `transactions`.
     */
    std::vector<Balance> compute_balances(const std::vector<Member> &members,
                                          const std::vector<Transaction> &transactions,
                                          std::string_view group_currency);

    /** Sum of all balances; zero for expense-only histories */
    Decimal sum_balances(const std::vector<Balance> &balances);

    /**
     * Greedy plan that settles the balances: the largest debtor pays the largest
     * creditor until everyone is within a cent of zero.
     */
    std::vector<Settlement> suggest_settlements(const std::vector<Balance> &balances);

} // namespace sharecost
