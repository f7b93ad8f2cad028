#include "sharecost/models.hpp"
#include "sharecost/crypto.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <ios>

namespace sharecost
{

    namespace
    {
        std::tm utc_now()
        {
            auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm_buf;
            gmtime_r(&t, &tm_buf);
            return tm_buf;
        }

        bool is_hex(char c)
        {
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
        }

        bool is_digit(char c)
        {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        // [+-]? digits [. digits]? ([eE] [+-]? digits)?
        bool looks_like_decimal(std::string_view s)
        {
            std::size_t i = 0;
            if (i < s.size() && (s[i] == '+' || s[i] == '-'))
                ++i;
            std::size_t int_digits = 0;
            while (i < s.size() && is_digit(s[i]))
            {
                ++i;
                ++int_digits;
            }
            std::size_t frac_digits = 0;
            if (i < s.size() && s[i] == '.')
            {
                ++i;
                while (i < s.size() && is_digit(s[i]))
                {
                    ++i;
                    ++frac_digits;
                }
            }
            if (int_digits + frac_digits == 0)
                return false;
            if (i < s.size() && (s[i] == 'e' || s[i] == 'E'))
            {
                ++i;
                if (i < s.size() && (s[i] == '+' || s[i] == '-'))
                    ++i;
                std::size_t exp_digits = 0;
                while (i < s.size() && is_digit(s[i]))
                {
                    ++i;
                    ++exp_digits;
                }
                if (exp_digits == 0 || exp_digits > 4)
                    return false;
            }
            return i == s.size();
        }

        Result<Decimal> decimal_field(const nlohmann::json &j, const char *key, std::optional<Decimal> fallback)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
            {
                if (fallback)
                    return *fallback;
                return std::unexpected(SharecostError::validation(std::format("missing field '{}'", key)));
            }
            if (it->is_number())
                return parse_decimal(it->dump());
            if (it->is_string())
                return parse_decimal(it->get<std::string>());
            return std::unexpected(SharecostError::validation(std::format("field '{}' must be a number", key)));
        }

        std::optional<std::string> optional_string(const nlohmann::json &j, const char *key)
        {
            auto it = j.find(key);
            if (it == j.end() || !it->is_string())
                return std::nullopt;
            auto v = it->get<std::string>();
            if (v.empty())
                return std::nullopt;
            return v;
        }

        Result<std::vector<MemberId>> member_list(const nlohmann::json &j, const char *key)
        {
            std::vector<MemberId> out;
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return out;
            if (!it->is_array())
                return std::unexpected(SharecostError::validation(std::format("field '{}' must be an array", key)));
            for (const auto &elem : *it)
            {
                if (!elem.is_string())
                    return std::unexpected(SharecostError::validation(std::format("field '{}' must hold member ids", key)));
                auto id = parse_uuid(elem.get<std::string>(), key);
                if (!id)
                    return std::unexpected(id.error());
                // A member appears in a split at most once
                if (std::find(out.begin(), out.end(), *id) == out.end())
                    out.push_back(*id);
            }
            return out;
        }

        Result<std::string> validate_date(std::string_view s)
        {
            if (s.size() != 10 || s[4] != '-' || s[7] != '-')
                return std::unexpected(SharecostError::validation(std::format("invalid date '{}'", s)));
            for (std::size_t i : {0, 1, 2, 3, 5, 6, 8, 9})
            {
                if (!is_digit(s[i]))
                    return std::unexpected(SharecostError::validation(std::format("invalid date '{}'", s)));
            }
            int y = std::stoi(std::string(s.substr(0, 4)));
            unsigned m = static_cast<unsigned>(std::stoi(std::string(s.substr(5, 2))));
            unsigned d = static_cast<unsigned>(std::stoi(std::string(s.substr(8, 2))));
            std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
            if (!ymd.ok())
                return std::unexpected(SharecostError::validation(std::format("invalid date '{}'", s)));
            return std::string(s);
        }

        nlohmann::json optional_to_json(const std::optional<std::string> &v)
        {
            if (v)
                return *v;
            return nullptr;
        }
    } // namespace

    std::string generate_uuid()
    {
        auto b = crypto::SecureRandom::generate_bytes(16);
        b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40);
        b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80);

        std::string out;
        out.reserve(36);
        for (std::size_t i = 0; i < b.size(); ++i)
        {
            if (i == 4 || i == 6 || i == 8 || i == 10)
                out += '-';
            out += std::format("{:02x}", b[i]);
        }
        return out;
    }

    bool is_uuid(std::string_view s)
    {
        if (s.size() != 36)
            return false;
        for (std::size_t i = 0; i < s.size(); ++i)
        {
            if (i == 8 || i == 13 || i == 18 || i == 23)
            {
                if (s[i] != '-')
                    return false;
            }
            else if (!is_hex(s[i]))
            {
                return false;
            }
        }
        return true;
    }

    Result<std::string> parse_uuid(std::string_view s, std::string_view what)
    {
        if (!is_uuid(s))
            return std::unexpected(SharecostError::validation(std::format("invalid {} id", what)));
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string now_rfc3339()
    {
        auto tm_buf = utc_now();
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                           tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                           tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
    }

    std::string today_iso()
    {
        auto tm_buf = utc_now();
        return std::format("{:04d}-{:02d}-{:02d}", tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday);
    }

    Result<Decimal> parse_decimal(std::string_view text)
    {
        if (!looks_like_decimal(text))
            return std::unexpected(SharecostError::validation(std::format("invalid decimal '{}'", text)));
        try
        {
            return Decimal(std::string(text).c_str());
        }
        catch (const std::exception &e)
        {
            return std::unexpected(SharecostError::validation(std::format("invalid decimal '{}': {}", text, e.what())));
        }
    }

    std::string format_decimal(const Decimal &value, int digits)
    {
        std::string s = value.str(digits, std::ios_base::fixed);
        if (auto dot = s.find('.'); dot != std::string::npos)
        {
            while (!s.empty() && s.back() == '0')
                s.pop_back();
            if (!s.empty() && s.back() == '.')
                s.pop_back();
        }
        if (s == "-0")
            return "0";
        return s;
    }

    Result<std::string> normalize_currency(std::string_view code)
    {
        if (code.size() != 3 || !std::all_of(code.begin(), code.end(), [](char c) {
                return std::isalpha(static_cast<unsigned char>(c)) != 0;
            }))
        {
            return std::unexpected(SharecostError::validation(std::format("invalid currency code '{}'", code)));
        }
        std::string out(code);
        std::transform(out.begin(), out.end(), out.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return out;
    }

    nlohmann::json Member::to_json() const
    {
        return nlohmann::json{{"id", id},
                              {"name", name},
                              {"paypal_email", optional_to_json(paypal_email)},
                              {"iban", optional_to_json(iban)}};
    }

    const Member *Group::find_member(std::string_view member_id) const
    {
        auto it = std::find_if(members.begin(), members.end(),
                               [&](const Member &m) { return m.id == member_id; });
        return it == members.end() ? nullptr : &*it;
    }

    nlohmann::json Group::to_json() const
    {
        nlohmann::json j_members = nlohmann::json::array();
        for (const auto &m : members)
            j_members.push_back(m.to_json());
        return nlohmann::json{{"id", id},
                              {"name", name},
                              {"currency", currency},
                              {"members", j_members},
                              {"created_at", created_at}};
    }

    Result<Group> Group::from_json(const nlohmann::json &j)
    {
        try
        {
            Group g;
            auto id = parse_uuid(j.at("id").get<std::string>(), "group");
            if (!id)
                return std::unexpected(SharecostError::parsing(std::format("stored group is corrupt: {}", id.error().what())));
            g.id = *id;
            g.name = j.at("name").get<std::string>();
            g.currency = j.value("currency", std::string(kDefaultCurrency));
            g.created_at = j.value("created_at", std::string());
            // Lower-case ids, matching transaction legs
            for (const auto &m : j.at("members"))
            {
                auto member_id = parse_uuid(m.at("id").get<std::string>(), "member");
                if (!member_id)
                    return std::unexpected(SharecostError::parsing(
                        std::format("stored group is corrupt: {}", member_id.error().what())));
                g.members.push_back(Member{*member_id,
                                           m.at("name").get<std::string>(),
                                           optional_string(m, "paypal_email"),
                                           optional_string(m, "iban")});
            }
            return g;
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(SharecostError::parsing(std::format("stored group is corrupt: {}", e.what())));
        }
    }

    std::string_view kind_name(const TransactionKind &kind)
    {
        struct Visitor
        {
            std::string_view operator()(const ExpenseKind &) const { return "expense"; }
            std::string_view operator()(const TransferKind &) const { return "transfer"; }
            std::string_view operator()(const IncomeKind &) const { return "income"; }
        };
        return std::visit(Visitor{}, kind);
    }

    const std::vector<MemberId> &Transaction::split() const
    {
        static const std::vector<MemberId> empty;
        if (const auto *e = std::get_if<ExpenseKind>(&kind))
            return e->split;
        if (const auto *i = std::get_if<IncomeKind>(&kind))
            return i->split;
        return empty;
    }

    std::optional<MemberId> Transaction::transfer_target() const
    {
        if (const auto *t = std::get_if<TransferKind>(&kind))
            return t->target;
        return std::nullopt;
    }

    nlohmann::json Transaction::to_json() const
    {
        auto target = transfer_target();
        return nlohmann::json{{"id", id},
                              {"group_id", group_id},
                              {"description", description},
                              {"amount", format_decimal(amount)},
                              {"paid_by", paid_by},
                              {"expense_type", std::string(kind_name(kind))},
                              {"split_between", split()},
                              {"transfer_to", optional_to_json(target)},
                              {"currency", currency},
                              {"exchange_rate", format_decimal(exchange_rate)},
                              {"expense_date", date},
                              {"created_at", created_at}};
    }

    Result<Transaction> Transaction::from_json(const nlohmann::json &j)
    {
        auto draft = TransactionDraft::from_json(j);
        if (!draft)
            return std::unexpected(SharecostError::parsing(std::format("stored transaction is corrupt: {}", draft.error().what())));

        auto id = optional_string(j, "id");
        auto group_id = optional_string(j, "group_id");
        if (!id || !group_id)
            return std::unexpected(SharecostError::parsing("stored transaction lacks its ids"));

        Transaction tx;
        tx.id = *id;
        tx.group_id = *group_id;
        tx.description = std::move(draft->description);
        tx.amount = draft->amount;
        tx.paid_by = std::move(draft->paid_by);
        tx.kind = std::move(draft->kind);
        tx.currency = draft->currency.value_or(std::string(kDefaultCurrency));
        tx.exchange_rate = draft->exchange_rate;
        tx.date = draft->date.value_or(std::string());
        tx.created_at = optional_string(j, "created_at").value_or(std::string());
        return tx;
    }

    Result<TransactionDraft> TransactionDraft::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(SharecostError::validation("transaction body must be a JSON object"));

        TransactionDraft d;

        auto desc = j.find("description");
        if (desc == j.end() || !desc->is_string())
            return std::unexpected(SharecostError::validation("missing field 'description'"));
        d.description = desc->get<std::string>();

        auto amount = decimal_field(j, "amount", std::nullopt);
        if (!amount)
            return std::unexpected(amount.error());
        d.amount = *amount;

        auto rate = decimal_field(j, "exchange_rate", Decimal(1));
        if (!rate)
            return std::unexpected(rate.error());
        if (*rate <= 0)
            return std::unexpected(SharecostError::validation("exchange_rate must be positive"));
        d.exchange_rate = *rate;

        auto payer_it = j.find("paid_by");
        if (payer_it == j.end() || !payer_it->is_string())
            return std::unexpected(SharecostError::validation("missing field 'paid_by'"));
        auto payer = parse_uuid(payer_it->get<std::string>(), "paid_by");
        if (!payer)
            return std::unexpected(payer.error());
        d.paid_by = *payer;

        std::string type = optional_string(j, "expense_type").value_or("expense");
        if (type == "transfer")
        {
            auto to = optional_string(j, "transfer_to");
            if (!to)
                return std::unexpected(SharecostError::validation("transfer requires 'transfer_to'"));
            auto target = parse_uuid(*to, "transfer_to");
            if (!target)
                return std::unexpected(target.error());
            d.kind = TransferKind{*target};
        }
        else if (type == "expense" || type == "income")
        {
            auto split = member_list(j, "split_between");
            if (!split)
                return std::unexpected(split.error());
            if (type == "expense")
                d.kind = ExpenseKind{std::move(*split)};
            else
                d.kind = IncomeKind{std::move(*split)};
        }
        else
        {
            return std::unexpected(SharecostError::validation(std::format("unknown expense_type '{}'", type)));
        }

        if (auto cur = optional_string(j, "currency"))
        {
            auto norm = normalize_currency(*cur);
            if (!norm)
                return std::unexpected(norm.error());
            d.currency = *norm;
        }

        if (auto date = optional_string(j, "expense_date"))
        {
            auto valid = validate_date(*date);
            if (!valid)
                return std::unexpected(valid.error());
            d.date = *valid;
        }

        return d;
    }

    Result<PaymentDetails> PaymentDetails::from_json(const nlohmann::json &j)
    {
        if (!j.is_object())
            return std::unexpected(SharecostError::validation("payment body must be a JSON object"));
        for (const char *key : {"paypal_email", "iban"})
        {
            if (auto it = j.find(key); it != j.end() && !it->is_null() && !it->is_string())
                return std::unexpected(SharecostError::validation(std::format("field '{}' must be a string", key)));
        }
        return PaymentDetails{optional_string(j, "paypal_email"), optional_string(j, "iban")};
    }

} // namespace sharecost
