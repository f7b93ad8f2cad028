#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace sharecost
{

    /**
     * The five independent permissions a bearer token may carry within one group.
     */
    enum class Capability
    {
        DeleteGroup,
        ManageMembers,
        UpdatePayment,
        AddExpenses,
        EditExpenses
    };

    inline constexpr std::array<Capability, 5> kAllCapabilities = {
        Capability::DeleteGroup,
        Capability::ManageMembers,
        Capability::UpdatePayment,
        Capability::AddExpenses,
        Capability::EditExpenses,
    };

    /** Long name of a capability (e.g. "add_expenses") */
    std::string_view capability_name(Capability cap);

    /** Parse a long, compact ("ae") or legacy ("can_add_expenses") name */
    std::optional<Capability> capability_from_string(std::string_view name);

    /**
     * Immutable set of capabilities. Each field is a nullable boolean where an
     * unset field means "granted": tokens issued before granular permissions
     * existed carry no fields and keep full access.
     *
     * Every read goes through resolve(); no other code interprets a raw field.
     */
    class CapabilitySet
    {
    public:
        /** Empty set: every field unset, which resolves to full access */
        CapabilitySet() = default;

        CapabilitySet(std::optional<bool> delete_group,
                      std::optional<bool> manage_members,
                      std::optional<bool> update_payment,
                      std::optional<bool> add_expenses,
                      std::optional<bool> edit_expenses);

        /** Every capability explicitly granted (group creator) */
        static CapabilitySet all();

        /** Every capability explicitly denied (read-only link) */
        static CapabilitySet none();

        /** The single defaulting rule: unset resolves to granted */
        static bool resolve(const std::optional<bool> &flag) { return flag.value_or(true); }

        bool has_delete_group() const { return resolve(delete_group_); }
        bool has_manage_members() const { return resolve(manage_members_); }
        bool has_update_payment() const { return resolve(update_payment_); }
        bool has_add_expenses() const { return resolve(add_expenses_); }
        bool has_edit_expenses() const { return resolve(edit_expenses_); }

        bool has(Capability cap) const;

        /** Conjunction of all five */
        bool has_all() const;

        /** Raw field, for the wire encoder */
        const std::optional<bool> &raw(Capability cap) const;

        /**
         * Attenuate by the caller's rights: per-field AND of the resolved values.
         * The result never exceeds caller, however often it is applied.
         */
        CapabilitySet cap_by(const CapabilitySet &caller) const;

        /**
         * Combine two tokens of the same group: per-field OR of the resolved values.
         * The result never falls below either operand.
         */
        CapabilitySet union_with(const CapabilitySet &other) const;

        /** Compares resolved values; an unset field equals an explicit true */
        bool operator==(const CapabilitySet &other) const;

        /** Compact wire form; unset fields are omitted */
        nlohmann::json to_json() const;

        /** Fully resolved form with long names, for API responses */
        nlohmann::json to_resolved_json() const;

        /**
         * Decode from either the compact keys (dg, mm, up, ae, ee), the legacy
         * verbose keys (can_delete_group, ...) or the plain long names.
         * A present flag that is not a boolean (or null) is malformed.
         */
        static Result<CapabilitySet> from_json(const nlohmann::json &j);

    private:
        std::optional<bool> &field(Capability cap);

        std::optional<bool> delete_group_;
        std::optional<bool> manage_members_;
        std::optional<bool> update_payment_;
        std::optional<bool> add_expenses_;
        std::optional<bool> edit_expenses_;
    };

} // namespace sharecost
