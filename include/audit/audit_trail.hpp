#pragma once

#include "audit/audit_event.hpp"
#include "fundamentals/time_utils.hpp"
#include "storage/database.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace audit
{

// Serialized `extra` payloads above this size are dropped.
constexpr size_t max_extra_bytes = 64 * 1024;

/**
 * Append-only security event sink over the `audit_logs` table.
 *
 * Every event goes to two independent places: a row in the database and a
 * line in the operational log. A failure of one never prevents the other,
 * and neither is reported to the caller as an error; auditing must not
 * block the operation it observes.
 */
class AuditTrail
{
public:
    explicit AuditTrail(storage::Database& db,
                        const time_utils::Clock& clock = time_utils::SystemClock::instance());

    // Stamps the event with the current time. Returns the row id, or
    // nullopt when the durable write failed.
    std::optional<int64_t> log(AuditEvent event);

    // Newest first.
    [[nodiscard]] std::vector<StoredEvent> recent(size_t limit);
    [[nodiscard]] std::vector<StoredEvent> for_user(std::string_view username, size_t limit);

private:
    void mirror(const AuditEvent& event);

    std::reference_wrapper<storage::Database> db;
    std::reference_wrapper<const time_utils::Clock> clock;
};

} // namespace audit
