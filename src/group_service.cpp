#include "sharecost/group_service.hpp"
#include "sharecost/operation_policy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>

namespace sharecost
{
    namespace
    {
        std::string trimmed(std::string_view s)
        {
            auto first = s.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos)
                return {};
            auto last = s.find_last_not_of(" \t\r\n");
            return std::string(s.substr(first, last - first + 1));
        }

        Result<void> require_member(const Group &group, const MemberId &id, std::string_view role)
        {
            if (!group.find_member(id))
            {
                return std::unexpected(SharecostError::validation(
                    std::format("{} {} is not a member of this group", role, id)));
            }
            return {};
        }

        Result<void> check_members(const Group &group, const TransactionDraft &draft)
        {
            auto payer = require_member(group, draft.paid_by, "paid_by");
            if (!payer)
                return payer;
            if (const auto *t = std::get_if<TransferKind>(&draft.kind))
                return require_member(group, t->target, "transfer_to");

            const auto &split = std::holds_alternative<ExpenseKind>(draft.kind)
                                    ? std::get<ExpenseKind>(draft.kind).split
                                    : std::get<IncomeKind>(draft.kind).split;
            for (const auto &id : split)
            {
                auto ok = require_member(group, id, "split_between");
                if (!ok)
                    return ok;
            }
            return {};
        }

        // Stores report failures as values; only the unexpected kinds are worth an error log
        template <typename T>
        Result<T> logged(Result<T> r, std::string_view what)
        {
            if (!r && r.error().code == ErrorCode::StorageError)
                spdlog::error("{} failed: {}", what, r.error().what());
            return r;
        }
    } // namespace

    Result<CreateGroupRequest> CreateGroupRequest::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(SharecostError::validation("group body must be a JSON object"));

        CreateGroupRequest req;
        auto name = j.find("name");
        if (name == j.end() || !name->is_string())
            return std::unexpected(SharecostError::validation("missing field 'name'"));
        req.name = name->get<std::string>();

        if (auto names = j.find("member_names"); names != j.end() && !names->is_null())
        {
            if (!names->is_array())
                return std::unexpected(SharecostError::validation("field 'member_names' must be an array"));
            for (const auto &n : *names)
            {
                if (!n.is_string())
                    return std::unexpected(SharecostError::validation("field 'member_names' must hold strings"));
                req.member_names.push_back(n.get<std::string>());
            }
        }

        if (auto currency = j.find("currency"); currency != j.end() && !currency->is_null())
        {
            if (!currency->is_string())
                return std::unexpected(SharecostError::validation("field 'currency' must be a string"));
            req.currency = currency->get<std::string>();
        }
        return req;
    }

    nlohmann::json GroupCreated::to_json() const
    {
        return nlohmann::json{{"group", group.to_json()}, {"token", token}};
    }

    GroupService::GroupService(std::shared_ptr<GroupStore> store, const CapabilityAuthority &authority)
        : store_(std::move(store)), authority_(authority)
    {
    }

    Result<GroupCreated> GroupService::create_group(const CreateGroupRequest &request)
    {
        Group group;
        group.name = trimmed(request.name);
        if (group.name.empty())
            return std::unexpected(SharecostError::validation("group name must not be empty"));

        if (request.currency)
        {
            auto currency = normalize_currency(*request.currency);
            if (!currency)
                return std::unexpected(currency.error());
            group.currency = *currency;
        }

        for (const auto &raw : request.member_names)
        {
            auto name = trimmed(raw);
            if (name.empty())
                return std::unexpected(SharecostError::validation("member name must not be empty"));
            group.members.push_back(Member{generate_uuid(), name, std::nullopt, std::nullopt});
        }

        group.id = generate_uuid();
        group.created_at = now_rfc3339();

        auto token = authority_.issue_token(group.id, CapabilitySet::all());
        if (!token)
            return std::unexpected(token.error());

        auto stored = logged(store_->create_group(group), "create_group");
        if (!stored)
            return std::unexpected(stored.error());

        spdlog::info("group {} created with {} members", group.id, group.members.size());
        return GroupCreated{std::move(group), std::move(*token)};
    }

    Result<Group> GroupService::load_group(const Principal &principal)
    {
        return logged(store_->get_group(principal.group_id), "get_group");
    }

    Result<Group> GroupService::get_group(const Principal &principal)
    {
        auto ok = authorize(principal, Operation::GetGroup);
        if (!ok)
            return std::unexpected(ok.error());
        return load_group(principal);
    }

    Result<void> GroupService::delete_group(const Principal &principal)
    {
        auto ok = authorize(principal, Operation::DeleteGroup);
        if (!ok)
            return ok;
        auto deleted = logged(store_->delete_group(principal.group_id), "delete_group");
        if (deleted)
            spdlog::info("group {} deleted", principal.group_id);
        return deleted;
    }

    Result<Group> GroupService::add_member(const Principal &principal, const std::string &name)
    {
        auto ok = authorize(principal, Operation::AddMember);
        if (!ok)
            return std::unexpected(ok.error());

        auto clean = trimmed(name);
        if (clean.empty())
            return std::unexpected(SharecostError::validation("member name must not be empty"));
        return logged(store_->add_member(principal.group_id, Member{generate_uuid(), clean, std::nullopt, std::nullopt}),
                      "add_member");
    }

    Result<Group> GroupService::remove_member(const Principal &principal, const MemberId &member_id)
    {
        auto ok = authorize(principal, Operation::RemoveMember);
        if (!ok)
            return std::unexpected(ok.error());
        return logged(store_->remove_member(principal.group_id, member_id), "remove_member");
    }

    Result<Member> GroupService::update_member_payment(const Principal &principal,
                                                       const MemberId &member_id,
                                                       const PaymentDetails &payment)
    {
        auto ok = authorize(principal, Operation::UpdateMemberPayment);
        if (!ok)
            return std::unexpected(ok.error());
        return logged(store_->update_member_payment(principal.group_id, member_id, payment),
                      "update_member_payment");
    }

    Result<std::vector<Transaction>> GroupService::list_transactions(const Principal &principal)
    {
        auto ok = authorize(principal, Operation::ListTransactions);
        if (!ok)
            return std::unexpected(ok.error());

        auto txs = logged(store_->list_transactions(principal.group_id), "list_transactions");
        if (!txs)
            return txs;
        std::stable_sort(txs->begin(), txs->end(), [](const Transaction &a, const Transaction &b) {
            if (a.date != b.date)
                return a.date > b.date;
            return a.created_at > b.created_at;
        });
        return txs;
    }

    Result<Transaction> GroupService::build_transaction(const Group &group, const TransactionDraft &draft) const
    {
        auto members = check_members(group, draft);
        if (!members)
            return std::unexpected(members.error());

        Transaction tx;
        tx.group_id = group.id;
        tx.description = draft.description;
        tx.amount = draft.amount;
        tx.paid_by = draft.paid_by;
        tx.kind = draft.kind;
        tx.currency = draft.currency.value_or(group.currency);
        tx.exchange_rate = draft.exchange_rate;
        tx.date = draft.date.value_or(today_iso());
        return tx;
    }

    Result<Transaction> GroupService::add_transaction(const Principal &principal, const TransactionDraft &draft)
    {
        auto ok = authorize(principal, Operation::AddTransaction);
        if (!ok)
            return std::unexpected(ok.error());

        auto group = load_group(principal);
        if (!group)
            return std::unexpected(group.error());
        auto tx = build_transaction(*group, draft);
        if (!tx)
            return tx;
        tx->id = generate_uuid();
        tx->created_at = now_rfc3339();

        auto stored = logged(store_->put_transaction(*tx), "put_transaction");
        if (!stored)
            return std::unexpected(stored.error());
        return tx;
    }

    Result<Transaction> GroupService::update_transaction(const Principal &principal,
                                                         const TransactionId &id,
                                                         const TransactionDraft &draft)
    {
        auto ok = authorize(principal, Operation::UpdateTransaction);
        if (!ok)
            return std::unexpected(ok.error());

        auto existing = logged(store_->get_transaction(principal.group_id, id), "get_transaction");
        if (!existing)
            return existing;
        auto group = load_group(principal);
        if (!group)
            return std::unexpected(group.error());

        auto tx = build_transaction(*group, draft);
        if (!tx)
            return tx;
        tx->id = existing->id;
        tx->created_at = existing->created_at;
        if (!draft.date)
            tx->date = existing->date;

        auto stored = logged(store_->put_transaction(*tx), "put_transaction");
        if (!stored)
            return std::unexpected(stored.error());
        return tx;
    }

    Result<void> GroupService::delete_transaction(const Principal &principal, const TransactionId &id)
    {
        auto ok = authorize(principal, Operation::DeleteTransaction);
        if (!ok)
            return ok;
        return logged(store_->delete_transaction(principal.group_id, id), "delete_transaction");
    }

    Result<std::vector<Balance>> GroupService::get_balances(const Principal &principal)
    {
        auto ok = authorize(principal, Operation::GetBalances);
        if (!ok)
            return std::unexpected(ok.error());

        auto group = load_group(principal);
        if (!group)
            return std::unexpected(group.error());
        auto txs = logged(store_->list_transactions(principal.group_id), "list_transactions");
        if (!txs)
            return std::unexpected(txs.error());
        return compute_balances(group->members, *txs, group->currency);
    }

    Result<std::vector<Settlement>> GroupService::get_settlements(const Principal &principal)
    {
        auto ok = authorize(principal, Operation::GetSettlements);
        if (!ok)
            return std::unexpected(ok.error());

        auto balances = get_balances(principal);
        if (!balances)
            return std::unexpected(balances.error());
        return suggest_settlements(*balances);
    }

    Result<IssuedToken> GroupService::create_share_link(const Principal &principal, const CapabilitySet &requested)
    {
        auto ok = authorize(principal, Operation::CreateShareLink);
        if (!ok)
            return std::unexpected(ok.error());

        // Tokens of a deleted group still verify
        auto group = load_group(principal);
        if (!group)
            return std::unexpected(group.error());

        return authority_.mint_share_link(principal, requested);
    }

    Result<IssuedToken> GroupService::merge_tokens(const Principal &principal, std::string_view other_token)
    {
        auto ok = authorize(principal, Operation::MergeTokens);
        if (!ok)
            return std::unexpected(ok.error());

        return authority_.merge(principal, other_token);
    }

} // namespace sharecost
