#include "sharecost/ledger.hpp"
#include <algorithm>
#include <cctype>
#include <type_traits>
#include <unordered_map>

namespace sharecost
{

    namespace
    {
        bool same_currency(std::string_view a, std::string_view b)
        {
            return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
                return std::toupper(static_cast<unsigned char>(x)) == std::toupper(static_cast<unsigned char>(y));
            });
        }

        Decimal normalized_amount(const Transaction &tx, std::string_view group_currency)
        {
            if (tx.currency.empty() || same_currency(tx.currency, group_currency))
                return tx.amount;
            return tx.amount * tx.exchange_rate;
        }

        class Ledger
        {
        public:
            explicit Ledger(const std::vector<Member> &members)
            {
                balances_.reserve(members.size());
                for (const auto &m : members)
                {
                    index_.emplace(m.id, balances_.size());
                    balances_.push_back(Balance{m.id, m.name, Decimal(0)});
                }
            }

            // Unknown members are skipped, never an error
            void credit(const MemberId &id, const Decimal &amount)
            {
                if (auto it = index_.find(id); it != index_.end())
                    balances_[it->second].balance += amount;
            }

            void debit(const MemberId &id, const Decimal &amount)
            {
                if (auto it = index_.find(id); it != index_.end())
                    balances_[it->second].balance -= amount;
            }

            void apply(const Transaction &tx, std::string_view group_currency)
            {
                const Decimal amount = normalized_amount(tx, group_currency);

                std::visit(
                    [&](const auto &kind) {
                        using Kind = std::decay_t<decltype(kind)>;
                        if constexpr (std::is_same_v<Kind, TransferKind>)
                        {
                            credit(tx.paid_by, amount);
                            debit(kind.target, amount);
                        }
                        else
                        {
                            if (kind.split.empty())
                                return;
                            const Decimal share = amount / static_cast<int>(kind.split.size());
                            if constexpr (std::is_same_v<Kind, ExpenseKind>)
                            {
                                credit(tx.paid_by, amount);
                                for (const auto &id : kind.split)
                                    debit(id, share);
                            }
                            else
                            {
                                debit(tx.paid_by, amount);
                                for (const auto &id : kind.split)
                                    credit(id, share);
                            }
                        }
                    },
                    tx.kind);
            }

            std::vector<Balance> take() { return std::move(balances_); }

        private:
            std::vector<Balance> balances_;
            std::unordered_map<MemberId, std::size_t> index_;
        };
    } // namespace

    nlohmann::json Balance::to_json() const
    {
        return nlohmann::json{{"user_id", member_id},
                              {"user_name", member_name},
                              {"balance", format_decimal(balance, 2)}};
    }

    nlohmann::json Settlement::to_json() const
    {
        return nlohmann::json{{"from", from}, {"to", to}, {"amount", format_decimal(amount, 2)}};
    }

    std::vector<Balance> compute_balances(const std::vector<Member> &members,
                                          const std::vector<Transaction> &transactions,
                                          std::string_view group_currency)
    {
        Ledger ledger(members);
        for (const auto &tx : transactions)
        {
            ledger.apply(tx, group_currency);
        }
        return ledger.take();
    }

    Decimal sum_balances(const std::vector<Balance> &balances)
    {
        Decimal total(0);
        for (const auto &b : balances)
            total += b.balance;
        return total;
    }

    std::vector<Settlement> suggest_settlements(const std::vector<Balance> &balances)
    {
        const Decimal epsilon("0.005");

        struct Position
        {
            MemberId id;
            Decimal amount;
        };
        std::vector<Position> creditors;
        std::vector<Position> debtors;
        for (const auto &b : balances)
        {
            if (b.balance > epsilon)
                creditors.push_back({b.member_id, b.balance});
            else if (b.balance < -epsilon)
                debtors.push_back({b.member_id, Decimal(-b.balance)});
        }

        // Stable sorts keep the member order among equal amounts
        auto larger = [](const Position &a, const Position &b) { return a.amount > b.amount; };
        std::stable_sort(creditors.begin(), creditors.end(), larger);
        std::stable_sort(debtors.begin(), debtors.end(), larger);

        std::vector<Settlement> plan;
        std::size_t c = 0;
        std::size_t d = 0;
        while (c < creditors.size() && d < debtors.size())
        {
            Decimal pay = std::min(creditors[c].amount, debtors[d].amount);
            plan.push_back(Settlement{debtors[d].id, creditors[c].id, pay});
            creditors[c].amount -= pay;
            debtors[d].amount -= pay;
            if (creditors[c].amount <= epsilon)
                ++c;
            if (debtors[d].amount <= epsilon)
                ++d;
        }
        return plan;
    }

} // namespace sharecost
