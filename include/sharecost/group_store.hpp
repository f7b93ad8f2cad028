#pragma once

#include "types.hpp"
#include "config.hpp"
#include "models.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sharecost
{

    /**
     * Abstract interface for group storage backends.
     * Every call is scoped to one group id; lookups of a missing group, member or
     * transaction fail with NotFound. Implementations are safe to share between
     * threads.
     */
    class GroupStore
    {
    public:
        virtual ~GroupStore() = default;

        /** Persist a new group with its initial members */
        virtual Result<void> create_group(const Group &group) = 0;

        virtual Result<Group> get_group(const GroupId &group_id) = 0;

        /** Remove the group together with all of its transactions */
        virtual Result<void> delete_group(const GroupId &group_id) = 0;

        /** Append a member; returns the updated group */
        virtual Result<Group> add_member(const GroupId &group_id, const Member &member) = 0;

        /**
         * Remove a member; returns the updated group.
         * ValidationError while any transaction still references the member.
         */
        virtual Result<Group> remove_member(const GroupId &group_id, const MemberId &member_id) = 0;

        virtual Result<Member> update_member_payment(const GroupId &group_id,
                                                     const MemberId &member_id,
                                                     const PaymentDetails &payment) = 0;

        /** All transactions of the group, in no particular order */
        virtual Result<std::vector<Transaction>> list_transactions(const GroupId &group_id) = 0;

        virtual Result<Transaction> get_transaction(const GroupId &group_id, const TransactionId &id) = 0;

        /** Insert or replace, keyed by (group_id, id) */
        virtual Result<void> put_transaction(const Transaction &tx) = 0;

        virtual Result<void> delete_transaction(const GroupId &group_id, const TransactionId &id) = 0;
    };

    /** True if any leg of tx names member_id */
    bool references_member(const Transaction &tx, const MemberId &member_id);

    /**
     * Process-local store, used by tests and by `serve` with backend = "memory".
     */
    class InMemoryGroupStore : public GroupStore
    {
    public:
        Result<void> create_group(const Group &group) override;
        Result<Group> get_group(const GroupId &group_id) override;
        Result<void> delete_group(const GroupId &group_id) override;
        Result<Group> add_member(const GroupId &group_id, const Member &member) override;
        Result<Group> remove_member(const GroupId &group_id, const MemberId &member_id) override;
        Result<Member> update_member_payment(const GroupId &group_id,
                                             const MemberId &member_id,
                                             const PaymentDetails &payment) override;
        Result<std::vector<Transaction>> list_transactions(const GroupId &group_id) override;
        Result<Transaction> get_transaction(const GroupId &group_id, const TransactionId &id) override;
        Result<void> put_transaction(const Transaction &tx) override;
        Result<void> delete_transaction(const GroupId &group_id, const TransactionId &id) override;

    private:
        struct Entry
        {
            Group group;
            std::vector<Transaction> transactions; // insertion order
        };

        Entry *find(const GroupId &group_id);

        std::unordered_map<GroupId, Entry> groups_;
        std::shared_mutex mutex_;
    };

    /**
     * RocksDB-backed store. Groups live under "g/<group>" and transactions under
     * "t/<group>/<transaction>", both as JSON documents.
     */
    class RocksDbGroupStore : public GroupStore
    {
    public:
        /** Throws SharecostError (StorageError) when the database cannot be opened */
        explicit RocksDbGroupStore(const StorageConfig &cfg);
        ~RocksDbGroupStore() override;

        Result<void> create_group(const Group &group) override;
        Result<Group> get_group(const GroupId &group_id) override;
        Result<void> delete_group(const GroupId &group_id) override;
        Result<Group> add_member(const GroupId &group_id, const Member &member) override;
        Result<Group> remove_member(const GroupId &group_id, const MemberId &member_id) override;
        Result<Member> update_member_payment(const GroupId &group_id,
                                             const MemberId &member_id,
                                             const PaymentDetails &payment) override;
        Result<std::vector<Transaction>> list_transactions(const GroupId &group_id) override;
        Result<Transaction> get_transaction(const GroupId &group_id, const TransactionId &id) override;
        Result<void> put_transaction(const Transaction &tx) override;
        Result<void> delete_transaction(const GroupId &group_id, const TransactionId &id) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

    /** Open the backend named in cfg */
    Result<std::shared_ptr<GroupStore>> open_group_store(const StorageConfig &cfg);

} // namespace sharecost
