#include "sharecost/capability.hpp"
#include <format>

namespace sharecost
{

    namespace
    {
        struct FieldNames
        {
            Capability cap;
            std::string_view compact;
            std::string_view name;
            std::string_view legacy;
        };

        constexpr std::array<FieldNames, 5> kFieldNames = {
            FieldNames{Capability::DeleteGroup, "dg", "delete_group", "can_delete_group"},
            FieldNames{Capability::ManageMembers, "mm", "manage_members", "can_manage_members"},
            FieldNames{Capability::UpdatePayment, "up", "update_payment", "can_update_payment"},
            FieldNames{Capability::AddExpenses, "ae", "add_expenses", "can_add_expenses"},
            FieldNames{Capability::EditExpenses, "ee", "edit_expenses", "can_edit_expenses"},
        };

        const FieldNames &names_of(Capability cap)
        {
            return kFieldNames[static_cast<std::size_t>(cap)];
        }
    } // namespace

    std::string_view capability_name(Capability cap)
    {
        return names_of(cap).name;
    }

    std::optional<Capability> capability_from_string(std::string_view name)
    {
        for (const auto &f : kFieldNames)
        {
            if (name == f.name || name == f.compact || name == f.legacy)
                return f.cap;
        }
        return std::nullopt;
    }

    CapabilitySet::CapabilitySet(std::optional<bool> delete_group,
                                 std::optional<bool> manage_members,
                                 std::optional<bool> update_payment,
                                 std::optional<bool> add_expenses,
                                 std::optional<bool> edit_expenses)
        : delete_group_(delete_group),
          manage_members_(manage_members),
          update_payment_(update_payment),
          add_expenses_(add_expenses),
          edit_expenses_(edit_expenses)
    {
    }

    CapabilitySet CapabilitySet::all()
    {
        return CapabilitySet(true, true, true, true, true);
    }

    CapabilitySet CapabilitySet::none()
    {
        return CapabilitySet(false, false, false, false, false);
    }

    const std::optional<bool> &CapabilitySet::raw(Capability cap) const
    {
        switch (cap)
        {
        case Capability::DeleteGroup:
            return delete_group_;
        case Capability::ManageMembers:
            return manage_members_;
        case Capability::UpdatePayment:
            return update_payment_;
        case Capability::AddExpenses:
            return add_expenses_;
        case Capability::EditExpenses:
            return edit_expenses_;
        }
        return edit_expenses_;
    }

    std::optional<bool> &CapabilitySet::field(Capability cap)
    {
        switch (cap)
        {
        case Capability::DeleteGroup:
            return delete_group_;
        case Capability::ManageMembers:
            return manage_members_;
        case Capability::UpdatePayment:
            return update_payment_;
        case Capability::AddExpenses:
            return add_expenses_;
        case Capability::EditExpenses:
            return edit_expenses_;
        }
        return edit_expenses_;
    }

    bool CapabilitySet::has(Capability cap) const
    {
        return resolve(raw(cap));
    }

    bool CapabilitySet::has_all() const
    {
        return has_delete_group() && has_manage_members() && has_update_payment() &&
               has_add_expenses() && has_edit_expenses();
    }

    CapabilitySet CapabilitySet::cap_by(const CapabilitySet &caller) const
    {
        CapabilitySet out;
        for (auto cap : kAllCapabilities)
        {
            out.field(cap) = has(cap) && caller.has(cap);
        }
        return out;
    }

    CapabilitySet CapabilitySet::union_with(const CapabilitySet &other) const
    {
        CapabilitySet out;
        for (auto cap : kAllCapabilities)
        {
            out.field(cap) = has(cap) || other.has(cap);
        }
        return out;
    }

    bool CapabilitySet::operator==(const CapabilitySet &other) const
    {
        for (auto cap : kAllCapabilities)
        {
            if (has(cap) != other.has(cap))
                return false;
        }
        return true;
    }

    nlohmann::json CapabilitySet::to_json() const
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &f : kFieldNames)
        {
            if (const auto &flag = raw(f.cap))
                j[std::string(f.compact)] = *flag;
        }
        return j;
    }

    nlohmann::json CapabilitySet::to_resolved_json() const
    {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &f : kFieldNames)
        {
            j[std::string(f.name)] = has(f.cap);
        }
        return j;
    }

    Result<CapabilitySet> CapabilitySet::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
        {
            return std::unexpected(SharecostError::token_malformed("capability set must be a JSON object"));
        }

        CapabilitySet out;
        for (const auto &f : kFieldNames)
        {
            // Compact name wins when a payload carries several spellings
            for (auto key : {f.compact, f.legacy, f.name})
            {
                auto it = j.find(std::string(key));
                if (it == j.end() || it->is_null())
                    continue;
                if (!it->is_boolean())
                {
                    return std::unexpected(SharecostError::token_malformed(
                        std::format("capability flag '{}' is not a boolean", key)));
                }
                out.field(f.cap) = it->get<bool>();
                break;
            }
        }
        return out;
    }

} // namespace sharecost
