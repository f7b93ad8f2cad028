#include "sharecost/group_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <mutex>

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

namespace sharecost
{
    namespace
    {
        SharecostError group_not_found(const GroupId &group_id)
        {
            return SharecostError::not_found(std::format("group {} not found", group_id));
        }

        SharecostError member_not_found(const MemberId &member_id)
        {
            return SharecostError::not_found(std::format("member {} not found", member_id));
        }

        SharecostError transaction_not_found(const TransactionId &id)
        {
            return SharecostError::not_found(std::format("transaction {} not found", id));
        }

        Result<void> check_member_removable(const std::vector<Transaction> &transactions, const MemberId &member_id)
        {
            auto used = std::any_of(transactions.begin(), transactions.end(),
                                    [&](const Transaction &tx) { return references_member(tx, member_id); });
            if (used)
            {
                return std::unexpected(SharecostError::validation(
                    std::format("member {} is still referenced by transactions", member_id)));
            }
            return {};
        }

        Result<Member> apply_payment(Group &group, const MemberId &member_id, const PaymentDetails &payment)
        {
            auto it = std::find_if(group.members.begin(), group.members.end(),
                                   [&](const Member &m) { return m.id == member_id; });
            if (it == group.members.end())
                return std::unexpected(member_not_found(member_id));
            it->paypal_email = payment.paypal_email;
            it->iban = payment.iban;
            return *it;
        }

        Result<void> erase_member(Group &group, const MemberId &member_id)
        {
            auto it = std::find_if(group.members.begin(), group.members.end(),
                                   [&](const Member &m) { return m.id == member_id; });
            if (it == group.members.end())
                return std::unexpected(member_not_found(member_id));
            group.members.erase(it);
            return {};
        }
    } // namespace

    bool references_member(const Transaction &tx, const MemberId &member_id)
    {
        if (tx.paid_by == member_id)
            return true;
        if (auto target = tx.transfer_target(); target && *target == member_id)
            return true;
        const auto &split = tx.split();
        return std::find(split.begin(), split.end(), member_id) != split.end();
    }

    // ---------------------------------------------------------------------
    // InMemoryGroupStore

    InMemoryGroupStore::Entry *InMemoryGroupStore::find(const GroupId &group_id)
    {
        auto it = groups_.find(group_id);
        return it == groups_.end() ? nullptr : &it->second;
    }

    Result<void> InMemoryGroupStore::create_group(const Group &group)
    {
        std::unique_lock lock(mutex_);
        if (groups_.contains(group.id))
            return std::unexpected(SharecostError::validation(std::format("group {} already exists", group.id)));
        groups_.emplace(group.id, Entry{group, {}});
        return {};
    }

    Result<Group> InMemoryGroupStore::get_group(const GroupId &group_id)
    {
        std::shared_lock lock(mutex_);
        auto *entry = find(group_id);
        if (!entry)
            return std::unexpected(group_not_found(group_id));
        return entry->group;
    }

    Result<void> InMemoryGroupStore::delete_group(const GroupId &group_id)
    {
        std::unique_lock lock(mutex_);
        if (groups_.erase(group_id) == 0)
            return std::unexpected(group_not_found(group_id));
        return {};
    }

    Result<Group> InMemoryGroupStore::add_member(const GroupId &group_id, const Member &member)
    {
        std::unique_lock lock(mutex_);
        auto *entry = find(group_id);
        if (!entry)
            return std::unexpected(group_not_found(group_id));
        entry->group.members.push_back(member);
        return entry->group;
    }

    Result<Group> InMemoryGroupStore::remove_member(const GroupId &group_id, const MemberId &member_id)
    {
        std::unique_lock lock(mutex_);
        auto *entry = find(group_id);
        if (!entry)
            return std::unexpected(group_not_found(group_id));
        if (!entry->group.find_member(member_id))
            return std::unexpected(member_not_found(member_id));
        auto removable = check_member_removable(entry->transactions, member_id);
        if (!removable)
            return std::unexpected(removable.error());
        auto erased = erase_member(entry->group, member_id);
        if (!erased)
            return std::unexpected(erased.error());
        return entry->group;
    }

    Result<Member> InMemoryGroupStore::update_member_payment(const GroupId &group_id,
                                                             const MemberId &member_id,
                                                             const PaymentDetails &payment)
    {
        std::unique_lock lock(mutex_);
        auto *entry = find(group_id);
        if (!entry)
            return std::unexpected(group_not_found(group_id));
        return apply_payment(entry->group, member_id, payment);
    }

    Result<std::vector<Transaction>> InMemoryGroupStore::list_transactions(const GroupId &group_id)
    {
        std::shared_lock lock(mutex_);
        auto *entry = find(group_id);
        if (!entry)
            return std::unexpected(group_not_found(group_id));
        return entry->transactions;
    }

    Result<Transaction> InMemoryGroupStore::get_transaction(const GroupId &group_id, const TransactionId &id)
    {
        std::shared_lock lock(mutex_);
        auto *entry = find(group_id);
        if (!entry)
            return std::unexpected(group_not_found(group_id));
        auto it = std::find_if(entry->transactions.begin(), entry->transactions.end(),
                               [&](const Transaction &tx) { return tx.id == id; });
        if (it == entry->transactions.end())
            return std::unexpected(transaction_not_found(id));
        return *it;
    }

    Result<void> InMemoryGroupStore::put_transaction(const Transaction &tx)
    {
        std::unique_lock lock(mutex_);
        auto *entry = find(tx.group_id);
        if (!entry)
            return std::unexpected(group_not_found(tx.group_id));
        auto it = std::find_if(entry->transactions.begin(), entry->transactions.end(),
                               [&](const Transaction &existing) { return existing.id == tx.id; });
        if (it == entry->transactions.end())
            entry->transactions.push_back(tx);
        else
            *it = tx;
        return {};
    }

    Result<void> InMemoryGroupStore::delete_transaction(const GroupId &group_id, const TransactionId &id)
    {
        std::unique_lock lock(mutex_);
        auto *entry = find(group_id);
        if (!entry)
            return std::unexpected(group_not_found(group_id));
        auto removed = std::erase_if(entry->transactions, [&](const Transaction &tx) { return tx.id == id; });
        if (removed == 0)
            return std::unexpected(transaction_not_found(id));
        return {};
    }

    // ---------------------------------------------------------------------
    // RocksDbGroupStore

    class RocksDbGroupStore::Impl
    {
    public:
        explicit Impl(const StorageConfig &cfg)
        {
            rocksdb::Options options;
            options.create_if_missing = true;
            rocksdb::DB *raw = nullptr;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &raw);
            if (!status.ok())
            {
                throw SharecostError::storage("RocksDB open failed: " + status.ToString());
            }
            db_.reset(raw);
            spdlog::info("RocksDB group store opened at {}", cfg.rocksdb_path);
        }

        Result<void> create_group(const Group &group)
        {
            std::lock_guard lock(write_mutex_);
            auto existing = read(group_key(group.id));
            if (!existing)
                return std::unexpected(existing.error());
            if (*existing)
                return std::unexpected(SharecostError::validation(std::format("group {} already exists", group.id)));
            return write_group(group);
        }

        Result<Group> get_group(const GroupId &group_id)
        {
            auto raw = read(group_key(group_id));
            if (!raw)
                return std::unexpected(raw.error());
            if (!*raw)
                return std::unexpected(group_not_found(group_id));
            auto parsed = nlohmann::json::parse(**raw, nullptr, false);
            if (parsed.is_discarded())
                return std::unexpected(SharecostError::storage(std::format("stored group {} is not valid JSON", group_id)));
            auto group = Group::from_json(parsed);
            if (!group)
                return std::unexpected(SharecostError::storage(group.error().what()));
            return group;
        }

        Result<void> delete_group(const GroupId &group_id)
        {
            std::lock_guard lock(write_mutex_);
            auto existing = read(group_key(group_id));
            if (!existing)
                return std::unexpected(existing.error());
            if (!*existing)
                return std::unexpected(group_not_found(group_id));

            rocksdb::WriteBatch batch;
            batch.Delete(group_key(group_id));
            const auto prefix = transaction_prefix(group_id);
            std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
                batch.Delete(it->key());
            if (!it->status().ok())
                return std::unexpected(SharecostError::storage("RocksDB iteration failed: " + it->status().ToString()));

            auto status = db_->Write(rocksdb::WriteOptions(), &batch);
            if (!status.ok())
                return std::unexpected(SharecostError::storage("RocksDB Write failed: " + status.ToString()));
            return {};
        }

        Result<Group> add_member(const GroupId &group_id, const Member &member)
        {
            std::lock_guard lock(write_mutex_);
            auto group = get_group(group_id);
            if (!group)
                return std::unexpected(group.error());
            group->members.push_back(member);
            auto written = write_group(*group);
            if (!written)
                return std::unexpected(written.error());
            return *group;
        }

        Result<Group> remove_member(const GroupId &group_id, const MemberId &member_id)
        {
            std::lock_guard lock(write_mutex_);
            auto group = get_group(group_id);
            if (!group)
                return std::unexpected(group.error());
            if (!group->find_member(member_id))
                return std::unexpected(member_not_found(member_id));
            auto transactions = list_transactions(group_id);
            if (!transactions)
                return std::unexpected(transactions.error());
            auto removable = check_member_removable(*transactions, member_id);
            if (!removable)
                return std::unexpected(removable.error());
            auto erased = erase_member(*group, member_id);
            if (!erased)
                return std::unexpected(erased.error());
            auto written = write_group(*group);
            if (!written)
                return std::unexpected(written.error());
            return *group;
        }

        Result<Member> update_member_payment(const GroupId &group_id,
                                             const MemberId &member_id,
                                             const PaymentDetails &payment)
        {
            std::lock_guard lock(write_mutex_);
            auto group = get_group(group_id);
            if (!group)
                return std::unexpected(group.error());
            auto member = apply_payment(*group, member_id, payment);
            if (!member)
                return std::unexpected(member.error());
            auto written = write_group(*group);
            if (!written)
                return std::unexpected(written.error());
            return *member;
        }

        Result<std::vector<Transaction>> list_transactions(const GroupId &group_id)
        {
            auto exists = read(group_key(group_id));
            if (!exists)
                return std::unexpected(exists.error());
            if (!*exists)
                return std::unexpected(group_not_found(group_id));

            std::vector<Transaction> out;
            const auto prefix = transaction_prefix(group_id);
            std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next())
            {
                auto tx = decode_transaction(it->value().ToString(), it->key().ToString());
                if (!tx)
                    return std::unexpected(tx.error());
                out.push_back(std::move(*tx));
            }
            if (!it->status().ok())
                return std::unexpected(SharecostError::storage("RocksDB iteration failed: " + it->status().ToString()));
            return out;
        }

        Result<Transaction> get_transaction(const GroupId &group_id, const TransactionId &id)
        {
            auto exists = read(group_key(group_id));
            if (!exists)
                return std::unexpected(exists.error());
            if (!*exists)
                return std::unexpected(group_not_found(group_id));

            auto key = transaction_key(group_id, id);
            auto raw = read(key);
            if (!raw)
                return std::unexpected(raw.error());
            if (!*raw)
                return std::unexpected(transaction_not_found(id));
            return decode_transaction(**raw, key);
        }

        Result<void> put_transaction(const Transaction &tx)
        {
            std::lock_guard lock(write_mutex_);
            auto exists = read(group_key(tx.group_id));
            if (!exists)
                return std::unexpected(exists.error());
            if (!*exists)
                return std::unexpected(group_not_found(tx.group_id));

            auto status = db_->Put(rocksdb::WriteOptions(), transaction_key(tx.group_id, tx.id), tx.to_json().dump());
            if (!status.ok())
                return std::unexpected(SharecostError::storage("RocksDB Put failed: " + status.ToString()));
            return {};
        }

        Result<void> delete_transaction(const GroupId &group_id, const TransactionId &id)
        {
            std::lock_guard lock(write_mutex_);
            auto existing = get_transaction(group_id, id);
            if (!existing)
                return std::unexpected(existing.error());
            auto status = db_->Delete(rocksdb::WriteOptions(), transaction_key(group_id, id));
            if (!status.ok())
                return std::unexpected(SharecostError::storage("RocksDB Delete failed: " + status.ToString()));
            return {};
        }

    private:
        static std::string group_key(const GroupId &group_id) { return "g/" + group_id; }

        static std::string transaction_prefix(const GroupId &group_id) { return "t/" + group_id + "/"; }

        static std::string transaction_key(const GroupId &group_id, const TransactionId &id)
        {
            return transaction_prefix(group_id) + id;
        }

        Result<std::optional<std::string>> read(const std::string &key)
        {
            std::string value;
            auto status = db_->Get(rocksdb::ReadOptions(), key, &value);
            if (status.IsNotFound())
                return std::optional<std::string>{};
            if (!status.ok())
                return std::unexpected(SharecostError::storage("RocksDB Get failed: " + status.ToString()));
            return std::optional<std::string>{std::move(value)};
        }

        Result<void> write_group(const Group &group)
        {
            auto status = db_->Put(rocksdb::WriteOptions(), group_key(group.id), group.to_json().dump());
            if (!status.ok())
                return std::unexpected(SharecostError::storage("RocksDB Put failed: " + status.ToString()));
            return {};
        }

        static Result<Transaction> decode_transaction(const std::string &raw, const std::string &key)
        {
            auto parsed = nlohmann::json::parse(raw, nullptr, false);
            if (parsed.is_discarded())
                return std::unexpected(SharecostError::storage(std::format("stored value at {} is not valid JSON", key)));
            auto tx = Transaction::from_json(parsed);
            if (!tx)
                return std::unexpected(SharecostError::storage(std::format("{}: {}", key, tx.error().what())));
            return tx;
        }

        std::unique_ptr<rocksdb::DB> db_;
        // Serializes read-modify-write sequences; RocksDB itself is thread safe
        std::mutex write_mutex_;
    };

    RocksDbGroupStore::RocksDbGroupStore(const StorageConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    RocksDbGroupStore::~RocksDbGroupStore() = default;

    Result<void> RocksDbGroupStore::create_group(const Group &group)
    {
        return impl_->create_group(group);
    }

    Result<Group> RocksDbGroupStore::get_group(const GroupId &group_id)
    {
        return impl_->get_group(group_id);
    }

    Result<void> RocksDbGroupStore::delete_group(const GroupId &group_id)
    {
        return impl_->delete_group(group_id);
    }

    Result<Group> RocksDbGroupStore::add_member(const GroupId &group_id, const Member &member)
    {
        return impl_->add_member(group_id, member);
    }

    Result<Group> RocksDbGroupStore::remove_member(const GroupId &group_id, const MemberId &member_id)
    {
        return impl_->remove_member(group_id, member_id);
    }

    Result<Member> RocksDbGroupStore::update_member_payment(const GroupId &group_id,
                                                            const MemberId &member_id,
                                                            const PaymentDetails &payment)
    {
        return impl_->update_member_payment(group_id, member_id, payment);
    }

    Result<std::vector<Transaction>> RocksDbGroupStore::list_transactions(const GroupId &group_id)
    {
        return impl_->list_transactions(group_id);
    }

    Result<Transaction> RocksDbGroupStore::get_transaction(const GroupId &group_id, const TransactionId &id)
    {
        return impl_->get_transaction(group_id, id);
    }

    Result<void> RocksDbGroupStore::put_transaction(const Transaction &tx)
    {
        return impl_->put_transaction(tx);
    }

    Result<void> RocksDbGroupStore::delete_transaction(const GroupId &group_id, const TransactionId &id)
    {
        return impl_->delete_transaction(group_id, id);
    }

    Result<std::shared_ptr<GroupStore>> open_group_store(const StorageConfig &cfg)
    {
        switch (cfg.backend)
        {
        case StorageBackend::Memory:
            return std::make_shared<InMemoryGroupStore>();
        case StorageBackend::RocksDb:
            try
            {
                return std::make_shared<RocksDbGroupStore>(cfg);
            }
            catch (const SharecostError &e)
            {
                return std::unexpected(e);
            }
        }
        return std::unexpected(SharecostError::config("unknown storage backend"));
    }

} // namespace sharecost
