#pragma once

#include "types.hpp"
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sharecost
{

    /** Arbitrary-precision decimal used for all money arithmetic (50 significant digits) */
    using Decimal = boost::multiprecision::cpp_dec_float_50;

    using MemberId = std::string;
    using GroupId = std::string;
    using TransactionId = std::string;

    inline constexpr std::string_view kDefaultCurrency = "EUR";

    /** Random (version 4) UUID in canonical lowercase form */
    std::string generate_uuid();

    /** True for 8-4-4-4-12 hex UUID strings (any case) */
    bool is_uuid(std::string_view s);

    /**
     * Validate a caller-supplied identifier and return it lower-cased.
     * ValidationError otherwise; the message never repeats the input.
     */
    Result<std::string> parse_uuid(std::string_view s, std::string_view what);

    /** Current UTC time as RFC 3339 with second precision */
    std::string now_rfc3339();

    /** Current UTC day as YYYY-MM-DD */
    std::string today_iso();

    /** Parse "12.50", "-3", "1e2" into a Decimal, ValidationError otherwise */
    Result<Decimal> parse_decimal(std::string_view text);

    /** Plain decimal string with at most `digits` fractional digits, trailing zeros trimmed */
    std::string format_decimal(const Decimal &value, int digits = 6);

    struct Member
    {
        MemberId id;
        std::string name;
        std::optional<std::string> paypal_email;
        std::optional<std::string> iban;

        nlohmann::json to_json() const;
    };

    struct Group
    {
        GroupId id;
        std::string name;
        std::string currency{kDefaultCurrency};
        std::vector<Member> members; // creation order
        std::string created_at;

        const Member *find_member(std::string_view member_id) const;

        nlohmann::json to_json() const;

        /** Decode the stored form written by to_json() */
        static Result<Group> from_json(const nlohmann::json &j);
    };

    /** Expense: the payer fronted money shared among the split */
    struct ExpenseKind
    {
        std::vector<MemberId> split;
    };

    /** Transfer: the payer paid the target directly */
    struct TransferKind
    {
        MemberId target;
    };

    /** Income: the payer received money owed to the split */
    struct IncomeKind
    {
        std::vector<MemberId> split;
    };

    using TransactionKind = std::variant<ExpenseKind, TransferKind, IncomeKind>;

    /** Wire name of the kind: "expense", "transfer" or "income" */
    std::string_view kind_name(const TransactionKind &kind);

    struct Transaction
    {
        TransactionId id;
        GroupId group_id;
        std::string description;
        Decimal amount{0};
        MemberId paid_by;
        TransactionKind kind{ExpenseKind{}};
        std::string currency{kDefaultCurrency};
        Decimal exchange_rate{1};
        std::string date; // YYYY-MM-DD
        std::string created_at;

        /** Split members for expense/income, empty for transfers */
        const std::vector<MemberId> &split() const;

        /** Transfer target, if this is a transfer */
        std::optional<MemberId> transfer_target() const;

        nlohmann::json to_json() const;

        /** Decode the stored form written by to_json() */
        static Result<Transaction> from_json(const nlohmann::json &j);
    };

    /**
     * Body of a create/update transaction request, as the routing layer receives it.
     * Currency and date are optional; the service fills in group defaults.
     */
    struct TransactionDraft
    {
        std::string description;
        Decimal amount{0};
        MemberId paid_by;
        TransactionKind kind{ExpenseKind{}};
        std::optional<std::string> currency;
        Decimal exchange_rate{1};
        std::optional<std::string> date;

        /**
         * Parse the wire form. expense_type defaults to "expense"; a transfer needs
         * transfer_to and drops split_between; unknown types are rejected.
         */
        static Result<TransactionDraft> from_json(const nlohmann::json &j);
    };

    /** Member update of payment identifiers; absent fields are cleared */
    struct PaymentDetails
    {
        std::optional<std::string> paypal_email;
        std::optional<std::string> iban;

        static Result<PaymentDetails> from_json(const nlohmann::json &j);
    };

    /** Validate an ISO-4217 style code (three ASCII letters), returned upper-cased */
    Result<std::string> normalize_currency(std::string_view code);

} // namespace sharecost
