#include <catch2/catch_test_macros.hpp>
#include "sharecost/capability.hpp"
#include <vector>

using sharecost::Capability;
using sharecost::CapabilitySet;
using sharecost::ErrorCode;
using sharecost::kAllCapabilities;

namespace
{
    // A spread of sets: unset, mixed, explicit grants and denials
    std::vector<CapabilitySet> samples()
    {
        return {
            CapabilitySet{},
            CapabilitySet::all(),
            CapabilitySet::none(),
            CapabilitySet(std::nullopt, false, true, std::nullopt, false),
            CapabilitySet(false, std::nullopt, std::nullopt, true, true),
            CapabilitySet(true, false, false, false, std::nullopt),
        };
    }
}

TEST_CASE("Unset flags resolve to granted", "[capability]")
{
    CapabilitySet legacy;
    REQUIRE(legacy.has_all());
    REQUIRE(legacy.has_delete_group());
    REQUIRE(legacy.has_edit_expenses());
    REQUIRE(legacy == CapabilitySet::all());

    CapabilitySet partial(std::nullopt, false, std::nullopt, std::nullopt, std::nullopt);
    REQUIRE_FALSE(partial.has_manage_members());
    REQUIRE(partial.has_update_payment());
    REQUIRE_FALSE(partial.has_all());
}

TEST_CASE("none denies every capability", "[capability]")
{
    auto none = CapabilitySet::none();
    for (auto cap : kAllCapabilities)
        REQUIRE_FALSE(none.has(cap));
}

TEST_CASE("cap_by never exceeds the caller", "[capability]")
{
    for (const auto &a : samples())
    {
        for (const auto &caller : samples())
        {
            auto capped = a.cap_by(caller);
            for (auto cap : kAllCapabilities)
            {
                if (!caller.has(cap))
                    REQUIRE_FALSE(capped.has(cap));
                REQUIRE(capped.has(cap) == (a.has(cap) && caller.has(cap)));
            }
            REQUIRE(capped == caller.cap_by(a));
        }
    }
}

TEST_CASE("union_with never falls below either operand", "[capability]")
{
    for (const auto &a : samples())
    {
        for (const auto &b : samples())
        {
            auto merged = a.union_with(b);
            for (auto cap : kAllCapabilities)
            {
                if (a.has(cap) || b.has(cap))
                    REQUIRE(merged.has(cap));
            }
            REQUIRE(merged == b.union_with(a));
        }
    }
}

TEST_CASE("Identities with all()", "[capability]")
{
    for (const auto &a : samples())
    {
        REQUIRE(a.cap_by(CapabilitySet::all()) == a);
        REQUIRE(a.union_with(CapabilitySet::all()) == CapabilitySet::all());
        REQUIRE(a.union_with(CapabilitySet::none()) == a);
    }
}

TEST_CASE("Derived sets carry explicit flags", "[capability]")
{
    auto capped = CapabilitySet{}.cap_by(CapabilitySet{});
    for (auto cap : kAllCapabilities)
        REQUIRE(capped.raw(cap).has_value());
}

TEST_CASE("Share link request is attenuated by the caller", "[capability]")
{
    CapabilitySet requested(std::nullopt, true, std::nullopt, std::nullopt, std::nullopt);
    CapabilitySet caller(true, false, true, true, true);
    auto issued = requested.cap_by(caller);
    REQUIRE_FALSE(issued.has_manage_members());
    REQUIRE(issued.has_add_expenses());
}

TEST_CASE("Merging complementary sets grants both", "[capability]")
{
    CapabilitySet x(std::nullopt, std::nullopt, std::nullopt, true, false);
    CapabilitySet y(std::nullopt, std::nullopt, std::nullopt, false, true);
    auto merged = x.union_with(y);
    REQUIRE(merged.has_add_expenses());
    REQUIRE(merged.has_edit_expenses());
}

TEST_CASE("Compact JSON omits unset flags", "[capability]")
{
    CapabilitySet caps(false, std::nullopt, true, std::nullopt, std::nullopt);
    auto j = caps.to_json();
    REQUIRE(j.size() == 2);
    REQUIRE(j["dg"] == false);
    REQUIRE(j["up"] == true);

    auto resolved = caps.to_resolved_json();
    REQUIRE(resolved["delete_group"] == false);
    REQUIRE(resolved["manage_members"] == true);
}

TEST_CASE("Decoding accepts compact, legacy and long names", "[capability]")
{
    auto compact = CapabilitySet::from_json(nlohmann::json{{"mm", false}, {"ae", true}});
    REQUIRE(compact.has_value());
    REQUIRE_FALSE(compact->has_manage_members());
    REQUIRE(compact->raw(Capability::AddExpenses) == true);
    REQUIRE_FALSE(compact->raw(Capability::DeleteGroup).has_value());

    auto legacy = CapabilitySet::from_json(nlohmann::json{{"can_delete_group", false}, {"can_edit_expenses", false}});
    REQUIRE(legacy.has_value());
    REQUIRE_FALSE(legacy->has_delete_group());
    REQUIRE_FALSE(legacy->has_edit_expenses());
    REQUIRE(legacy->has_update_payment());

    auto long_names = CapabilitySet::from_json(nlohmann::json{{"update_payment", false}, {"manage_members", nullptr}});
    REQUIRE(long_names.has_value());
    REQUIRE_FALSE(long_names->has_update_payment());
    REQUIRE_FALSE(long_names->raw(Capability::ManageMembers).has_value());
}

TEST_CASE("Non-boolean flags are malformed", "[capability]")
{
    auto bad = CapabilitySet::from_json(nlohmann::json{{"dg", "yes"}});
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == ErrorCode::TokenMalformed);

    auto not_object = CapabilitySet::from_json(nlohmann::json::array());
    REQUIRE_FALSE(not_object.has_value());
    REQUIRE(not_object.error().code == ErrorCode::TokenMalformed);
}

TEST_CASE("Capability names round-trip through every spelling", "[capability]")
{
    REQUIRE(sharecost::capability_name(Capability::AddExpenses) == "add_expenses");
    REQUIRE(sharecost::capability_from_string("ae") == Capability::AddExpenses);
    REQUIRE(sharecost::capability_from_string("can_manage_members") == Capability::ManageMembers);
    REQUIRE(sharecost::capability_from_string("delete_group") == Capability::DeleteGroup);
    REQUIRE_FALSE(sharecost::capability_from_string("admin").has_value());
}
