#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "sharecost/group_store.hpp"
#include <filesystem>

using namespace sharecost;

namespace
{
    // Owns a throwaway RocksDB directory for the lifetime of one test
    struct TempDir
    {
        std::filesystem::path path;

        TempDir()
            : path(std::filesystem::temp_directory_path() / ("sharecost-store-" + generate_uuid()))
        {
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    };

    std::shared_ptr<GroupStore> open(StorageBackend backend, const TempDir &dir)
    {
        StorageConfig cfg;
        cfg.backend = backend;
        cfg.rocksdb_path = dir.path.string();
        auto store = open_group_store(cfg);
        REQUIRE(store.has_value());
        return *store;
    }

    Group sample_group()
    {
        Group g;
        g.id = generate_uuid();
        g.name = "Trip";
        g.currency = "EUR";
        g.created_at = "2024-06-01T12:00:00Z";
        g.members = {Member{generate_uuid(), "Alice", std::nullopt, std::nullopt},
                     Member{generate_uuid(), "Bob", std::nullopt, std::nullopt}};
        return g;
    }

    Transaction expense(const Group &g, const char *amount)
    {
        Transaction tx;
        tx.id = generate_uuid();
        tx.group_id = g.id;
        tx.description = "Lunch";
        tx.amount = Decimal(amount);
        tx.paid_by = g.members[0].id;
        tx.kind = ExpenseKind{{g.members[0].id, g.members[1].id}};
        tx.date = "2024-06-02";
        tx.created_at = "2024-06-02T13:00:00Z";
        return tx;
    }
}

TEST_CASE("Group lifecycle", "[group_store]")
{
    auto backend = GENERATE(StorageBackend::Memory, StorageBackend::RocksDb);
    TempDir dir;
    auto store = open(backend, dir);

    auto group = sample_group();
    REQUIRE(store->create_group(group).has_value());

    auto loaded = store->get_group(group.id);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->name == "Trip");
    REQUIRE(loaded->members.size() == 2);
    REQUIRE(loaded->members[0].name == "Alice");

    auto duplicate = store->create_group(group);
    REQUIRE_FALSE(duplicate.has_value());
    REQUIRE(duplicate.error().code == ErrorCode::ValidationError);

    REQUIRE(store->put_transaction(expense(group, "10")).has_value());
    REQUIRE(store->delete_group(group.id).has_value());

    auto gone = store->get_group(group.id);
    REQUIRE_FALSE(gone.has_value());
    REQUIRE(gone.error().code == ErrorCode::NotFound);
    REQUIRE(store->list_transactions(group.id).error().code == ErrorCode::NotFound);
    REQUIRE(store->delete_group(group.id).error().code == ErrorCode::NotFound);
}

TEST_CASE("Members are appended, updated and removed", "[group_store]")
{
    auto backend = GENERATE(StorageBackend::Memory, StorageBackend::RocksDb);
    TempDir dir;
    auto store = open(backend, dir);
    auto group = sample_group();
    REQUIRE(store->create_group(group).has_value());

    Member carol{generate_uuid(), "Carol", std::nullopt, std::nullopt};
    auto added = store->add_member(group.id, carol);
    REQUIRE(added.has_value());
    REQUIRE(added->members.size() == 3);
    REQUIRE(added->members.back().name == "Carol");

    auto paid = store->update_member_payment(group.id, carol.id, PaymentDetails{"carol@example.com", std::nullopt});
    REQUIRE(paid.has_value());
    REQUIRE(*paid->paypal_email == "carol@example.com");
    REQUIRE(store->get_group(group.id)->find_member(carol.id)->paypal_email == "carol@example.com");

    auto removed = store->remove_member(group.id, carol.id);
    REQUIRE(removed.has_value());
    REQUIRE(removed->members.size() == 2);
    REQUIRE(store->remove_member(group.id, carol.id).error().code == ErrorCode::NotFound);
    REQUIRE(store->update_member_payment(group.id, carol.id, PaymentDetails{}).error().code == ErrorCode::NotFound);
}

TEST_CASE("Referenced members cannot be removed", "[group_store]")
{
    auto backend = GENERATE(StorageBackend::Memory, StorageBackend::RocksDb);
    TempDir dir;
    auto store = open(backend, dir);
    auto group = sample_group();
    REQUIRE(store->create_group(group).has_value());
    REQUIRE(store->put_transaction(expense(group, "20")).has_value());

    auto blocked = store->remove_member(group.id, group.members[1].id);
    REQUIRE_FALSE(blocked.has_value());
    REQUIRE(blocked.error().code == ErrorCode::ValidationError);
    REQUIRE(store->get_group(group.id)->members.size() == 2);
}

TEST_CASE("Transactions are scoped to their group", "[group_store]")
{
    auto backend = GENERATE(StorageBackend::Memory, StorageBackend::RocksDb);
    TempDir dir;
    auto store = open(backend, dir);
    auto first = sample_group();
    auto second = sample_group();
    REQUIRE(store->create_group(first).has_value());
    REQUIRE(store->create_group(second).has_value());

    auto tx = expense(first, "12.5");
    REQUIRE(store->put_transaction(tx).has_value());
    REQUIRE(store->put_transaction(expense(second, "3")).has_value());

    auto listed = store->list_transactions(first.id);
    REQUIRE(listed.has_value());
    REQUIRE(listed->size() == 1);
    REQUIRE(listed->front().id == tx.id);
    REQUIRE(format_decimal(listed->front().amount) == "12.5");

    REQUIRE(store->get_transaction(second.id, tx.id).error().code == ErrorCode::NotFound);
    REQUIRE(store->delete_transaction(second.id, tx.id).error().code == ErrorCode::NotFound);

    tx.description = "Dinner";
    REQUIRE(store->put_transaction(tx).has_value());
    REQUIRE(store->get_transaction(first.id, tx.id)->description == "Dinner");
    REQUIRE(store->list_transactions(first.id)->size() == 1);

    REQUIRE(store->delete_transaction(first.id, tx.id).has_value());
    REQUIRE(store->list_transactions(first.id)->empty());
    REQUIRE(store->list_transactions(second.id)->size() == 1);
}

TEST_CASE("Transactions need an existing group", "[group_store]")
{
    auto backend = GENERATE(StorageBackend::Memory, StorageBackend::RocksDb);
    TempDir dir;
    auto store = open(backend, dir);
    auto orphan = expense(sample_group(), "1");
    REQUIRE(store->put_transaction(orphan).error().code == ErrorCode::NotFound);
}

TEST_CASE("RocksDB store persists across reopen", "[group_store]")
{
    TempDir dir;
    auto group = sample_group();
    auto tx = expense(group, "7.25");
    {
        auto store = open(StorageBackend::RocksDb, dir);
        REQUIRE(store->create_group(group).has_value());
        REQUIRE(store->put_transaction(tx).has_value());
    }

    auto reopened = open(StorageBackend::RocksDb, dir);
    auto loaded = reopened->get_group(group.id);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->members.size() == 2);
    auto stored = reopened->get_transaction(group.id, tx.id);
    REQUIRE(stored.has_value());
    REQUIRE(format_decimal(stored->amount) == "7.25");
    REQUIRE(stored->split() == tx.split());
}

TEST_CASE("references_member covers every leg", "[group_store]")
{
    auto group = sample_group();
    auto tx = expense(group, "5");
    REQUIRE(references_member(tx, group.members[0].id));
    REQUIRE(references_member(tx, group.members[1].id));

    tx.kind = TransferKind{group.members[1].id};
    tx.paid_by = group.members[0].id;
    REQUIRE(references_member(tx, group.members[1].id));
    REQUIRE_FALSE(references_member(tx, generate_uuid()));
}
