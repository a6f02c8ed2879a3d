/**
 * @file entity_type.hpp
 * @brief Closed enumeration of the PII categories piiguard recognises
 *
 * Each entity type carries three stable strings:
 * - a key used in APIs and configuration ("PERSON_NAME")
 * - a human-readable label used by replace mode and previews ("Person Name")
 * - a pseudonym prefix used to build labels such as "name_1"
 *
 * Prefixes are unique, so a pseudonym label identifies its entity type.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace piiguard::core {

/**
 * @brief PII categories produced by the detectors
 */
enum class entity_type : std::uint8_t {
    person_name = 0,
    email,
    phone,
    address,
    location,
    organization,
    date_time,
    credit_card,
    ssn,
    bank_account,
    account_number,
    account_id,
    employee_id,
    application_number,
    zip_code,
    medical_id,
    financial_amount,
    ip_address,
    url,
    passport,
    driver_license,
    facility,
    nationality_group,
    event,
    legal_document,
    /// Fallback for sensitive data without a dedicated category
    generic
};

/**
 * @struct entity_type_info
 * @brief Static strings attached to an entity type
 */
struct entity_type_info {
    entity_type type;
    std::string_view key;
    std::string_view human_label;
    std::string_view label_prefix;
};

/// Number of entity types
inline constexpr std::size_t entity_type_count =
    static_cast<std::size_t>(entity_type::generic) + 1;

/// Entity type table, indexed by the enum value
inline constexpr std::array<entity_type_info, entity_type_count> entity_type_table{{
    {entity_type::person_name, "PERSON_NAME", "Person Name", "name"},
    {entity_type::email, "EMAIL", "Email Address", "email"},
    {entity_type::phone, "PHONE", "Phone Number", "mobNo"},
    {entity_type::address, "ADDRESS", "Physical Address", "physical_address"},
    {entity_type::location, "LOCATION", "Location", "location"},
    {entity_type::organization, "ORGANIZATION", "Organization", "company"},
    {entity_type::date_time, "DATE_TIME", "Date/Time", "date"},
    {entity_type::credit_card, "CREDIT_CARD", "Credit Card", "credit_card"},
    {entity_type::ssn, "SSN", "Social Security Number", "ssn"},
    {entity_type::bank_account, "BANK_ACCOUNT", "Bank Account", "bank_account"},
    {entity_type::account_number, "ACCOUNT_NUMBER", "Account Number", "account_number"},
    {entity_type::account_id, "ACCOUNT_ID", "Account ID", "account_id"},
    {entity_type::employee_id, "EMPLOYEE_ID", "Employee ID", "employee_id"},
    {entity_type::application_number, "APPLICATION_NUMBER", "Application Number",
     "application_number"},
    {entity_type::zip_code, "ZIP_CODE", "ZIP Code", "zipcode"},
    {entity_type::medical_id, "MEDICAL_ID", "Medical ID", "medical_id"},
    {entity_type::financial_amount, "FINANCIAL_AMOUNT", "Financial Amount", "amount"},
    {entity_type::ip_address, "IP_ADDRESS", "IP Address", "ip_address"},
    {entity_type::url, "URL", "Website URL", "url"},
    {entity_type::passport, "PASSPORT", "Passport Number", "passport"},
    {entity_type::driver_license, "DRIVER_LICENSE", "Driver License", "driver_license"},
    {entity_type::facility, "FACILITY_NAME", "Facility", "facility"},
    {entity_type::nationality_group, "NATIONALITY_GROUP", "Nationality/Group", "group"},
    {entity_type::event, "EVENT_NAME", "Event", "event"},
    {entity_type::legal_document, "LEGAL_DOCUMENT", "Legal Document", "document"},
    {entity_type::generic, "GENERIC", "Sensitive Data", "entity"},
}};

/**
 * @brief Look up the static strings for an entity type
 */
[[nodiscard]] constexpr auto info(entity_type type) noexcept -> const entity_type_info& {
    return entity_type_table[static_cast<std::size_t>(type)];
}

/**
 * @brief Convert entity type to its stable key ("PERSON_NAME")
 */
[[nodiscard]] constexpr auto to_string(entity_type type) noexcept -> std::string_view {
    return info(type).key;
}

/**
 * @brief Human-readable label ("Person Name")
 */
[[nodiscard]] constexpr auto human_label(entity_type type) noexcept -> std::string_view {
    return info(type).human_label;
}

/**
 * @brief Pseudonym prefix ("name")
 */
[[nodiscard]] constexpr auto label_prefix(entity_type type) noexcept -> std::string_view {
    return info(type).label_prefix;
}

/**
 * @brief Parse an entity type from its key
 * @param key Stable key such as "EMAIL"
 * @return Optional containing the type, or nullopt if unknown
 */
[[nodiscard]] constexpr auto entity_type_from_string(std::string_view key) noexcept
    -> std::optional<entity_type> {
    for (const auto& entry : entity_type_table) {
        if (entry.key == key) return entry.type;
    }
    return std::nullopt;
}

/**
 * @brief Resolve the entity type owning a pseudonym prefix
 * @param prefix Label prefix such as "mobNo"
 * @return Optional containing the type, or nullopt if unknown
 */
[[nodiscard]] constexpr auto entity_type_from_prefix(std::string_view prefix) noexcept
    -> std::optional<entity_type> {
    for (const auto& entry : entity_type_table) {
        if (entry.label_prefix == prefix) return entry.type;
    }
    return std::nullopt;
}

} // namespace piiguard::core
