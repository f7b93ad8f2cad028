#include <catch2/catch_test_macros.hpp>
#include "sharecost/ledger.hpp"
#include <algorithm>
#include <random>

using namespace sharecost;

namespace
{
    const MemberId A = "aaaaaaaa-0000-4000-8000-000000000001";
    const MemberId B = "bbbbbbbb-0000-4000-8000-000000000002";
    const MemberId C = "cccccccc-0000-4000-8000-000000000003";
    const MemberId Ghost = "dddddddd-0000-4000-8000-000000000004";

    std::vector<Member> members()
    {
        return {Member{A, "Alice", std::nullopt, std::nullopt},
                Member{B, "Bob", std::nullopt, std::nullopt},
                Member{C, "Carol", std::nullopt, std::nullopt}};
    }

    Transaction make_tx(const char *amount, const MemberId &payer, TransactionKind kind,
                        std::string currency = "EUR", const char *rate = "1")
    {
        Transaction tx;
        tx.id = generate_uuid();
        tx.amount = Decimal(amount);
        tx.paid_by = payer;
        tx.kind = std::move(kind);
        tx.currency = std::move(currency);
        tx.exchange_rate = Decimal(rate);
        return tx;
    }

    std::string balance_of(const std::vector<Balance> &balances, const MemberId &id)
    {
        auto it = std::find_if(balances.begin(), balances.end(), [&](const Balance &b) { return b.member_id == id; });
        REQUIRE(it != balances.end());
        return format_decimal(it->balance, 2);
    }
}

TEST_CASE("Expense splits evenly among the split", "[ledger]")
{
    auto balances = compute_balances(members(), {make_tx("30", A, ExpenseKind{{A, B, C}})}, "EUR");
    REQUIRE(balances.size() == 3);
    REQUIRE(balance_of(balances, A) == "20");
    REQUIRE(balance_of(balances, B) == "-10");
    REQUIRE(balance_of(balances, C) == "-10");
}

TEST_CASE("Transfer moves money between two members", "[ledger]")
{
    auto balances = compute_balances(members(), {make_tx("15", A, TransferKind{B})}, "EUR");
    REQUIRE(balance_of(balances, A) == "15");
    REQUIRE(balance_of(balances, B) == "-15");
    REQUIRE(balance_of(balances, C) == "0");
}

TEST_CASE("Income is owed to the split", "[ledger]")
{
    auto balances = compute_balances(members(), {make_tx("100", A, IncomeKind{{A, B}})}, "EUR");
    REQUIRE(balance_of(balances, A) == "-50");
    REQUIRE(balance_of(balances, B) == "50");
    REQUIRE(balance_of(balances, C) == "0");
}

TEST_CASE("Empty split changes nothing", "[ledger]")
{
    auto balances = compute_balances(members(),
                                     {make_tx("42", A, ExpenseKind{}), make_tx("42", B, IncomeKind{})},
                                     "EUR");
    for (const auto &b : balances)
        REQUIRE(b.balance == 0);
}

TEST_CASE("Balances follow member order", "[ledger]")
{
    auto balances = compute_balances(members(), {}, "EUR");
    REQUIRE(balances.size() == 3);
    REQUIRE(balances[0].member_id == A);
    REQUIRE(balances[0].member_name == "Alice");
    REQUIRE(balances[2].member_id == C);
}

TEST_CASE("Foreign currency is converted with the rate", "[ledger]")
{
    auto balances = compute_balances(members(), {make_tx("10", A, ExpenseKind{{A, B}}, "USD", "0.9")}, "EUR");
    REQUIRE(balance_of(balances, A) == "4.5");
    REQUIRE(balance_of(balances, B) == "-4.5");
}

TEST_CASE("Rate is ignored in the group currency", "[ledger]")
{
    auto balances = compute_balances(members(), {make_tx("10", A, TransferKind{B}, "eur", "3")}, "EUR");
    REQUIRE(balance_of(balances, A) == "10");

    auto unset = compute_balances(members(), {make_tx("10", A, TransferKind{B}, "", "3")}, "EUR");
    REQUIRE(balance_of(unset, A) == "10");
}

TEST_CASE("Legs naming unknown members are dropped", "[ledger]")
{
    auto balances = compute_balances(members(),
                                     {make_tx("30", A, ExpenseKind{{A, B, Ghost}}),
                                      make_tx("5", Ghost, TransferKind{C})},
                                     "EUR");
    REQUIRE(balance_of(balances, A) == "20");
    REQUIRE(balance_of(balances, B) == "-10");
    REQUIRE(balance_of(balances, C) == "-5");
    REQUIRE(balances.size() == 3);
}

TEST_CASE("Expense-only histories sum to zero", "[ledger]")
{
    std::vector<Transaction> history = {
        make_tx("30", A, ExpenseKind{{A, B, C}}),
        make_tx("10", B, ExpenseKind{{A, C}}),
        make_tx("7.77", C, ExpenseKind{{B}}),
        make_tx("0.01", A, ExpenseKind{{A, B, C}}),
        make_tx("20", B, ExpenseKind{{A, B, C}}, "USD", "0.93"),
    };
    auto balances = compute_balances(members(), history, "EUR");
    REQUIRE(format_decimal(sum_balances(balances), 10) == "0");
}

TEST_CASE("Transaction order does not matter", "[ledger]")
{
    std::vector<Transaction> history = {
        make_tx("30", A, ExpenseKind{{A, B, C}}),
        make_tx("15", B, TransferKind{A}),
        make_tx("100", C, IncomeKind{{A, B, C}}),
        make_tx("12.5", A, ExpenseKind{{B}}, "GBP", "1.17"),
    };
    auto expected = compute_balances(members(), history, "EUR");

    std::mt19937 rng(7);
    for (int i = 0; i < 10; ++i)
    {
        std::shuffle(history.begin(), history.end(), rng);
        auto shuffled = compute_balances(members(), history, "EUR");
        for (std::size_t m = 0; m < expected.size(); ++m)
            REQUIRE(format_decimal(shuffled[m].balance, 20) == format_decimal(expected[m].balance, 20));
    }
}

TEST_CASE("Negative amounts are applied literally", "[ledger]")
{
    auto balances = compute_balances(members(), {make_tx("-30", A, ExpenseKind{{A, B, C}})}, "EUR");
    REQUIRE(balance_of(balances, A) == "-20");
    REQUIRE(balance_of(balances, B) == "10");
}

TEST_CASE("Settlement plan clears every balance", "[ledger]")
{
    std::vector<Transaction> history = {
        make_tx("90", A, ExpenseKind{{A, B, C}}),
        make_tx("30", B, ExpenseKind{{A, B, C}}),
    };
    auto balances = compute_balances(members(), history, "EUR");
    auto plan = suggest_settlements(balances);

    REQUIRE(plan.size() == 2);
    // Carol owes the most and pays first
    REQUIRE(plan[0].from == C);
    REQUIRE(plan[0].to == A);
    REQUIRE(format_decimal(plan[0].amount, 2) == "40");
    REQUIRE(plan[1].from == B);
    REQUIRE(format_decimal(plan[1].amount, 2) == "10");

    for (const auto &s : plan)
    {
        for (auto &b : balances)
        {
            if (b.member_id == s.from)
                b.balance += s.amount;
            if (b.member_id == s.to)
                b.balance -= s.amount;
        }
    }
    for (const auto &b : balances)
        REQUIRE(format_decimal(b.balance, 2) == "0");
}

TEST_CASE("Settled group needs no payments", "[ledger]")
{
    auto balances = compute_balances(members(), {}, "EUR");
    REQUIRE(suggest_settlements(balances).empty());
}

TEST_CASE("Balance JSON uses two decimals", "[ledger]")
{
    auto balances = compute_balances(members(), {make_tx("10", A, ExpenseKind{{A, B, C}})}, "EUR");
    auto j = balances[1].to_json();
    REQUIRE(j["user_id"] == B);
    REQUIRE(j["user_name"] == "Bob");
    REQUIRE(j["balance"] == "-3.33");
}
