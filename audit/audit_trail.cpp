#include "audit/audit_trail.hpp"
#include "logger.hpp"

#include <exception>
#include <format>
#include <string>

namespace audit
{

namespace
{

constexpr std::string_view select_cols =
    "SELECT id, timestamp, event_type, severity, user_id, username, user_type, ip_address, "
    "endpoint, description, additional_data, success FROM audit_logs ";

std::optional<std::string> serialize_extra(const boost::json::value& extra)
{
    if (extra.is_null())
    {
        return std::nullopt;
    }
    try
    {
        std::string text = boost::json::serialize(extra);
        if (text.size() > max_extra_bytes)
        {
            LOG_WARN("Audit payload of {} bytes exceeds limit, stored empty", text.size());
            return std::nullopt;
        }
        return text;
    }
    catch (const std::exception& e)
    {
        LOG_WARN("Audit payload serialization failed, stored empty: {}", e.what());
        return std::nullopt;
    }
}

boost::json::value parse_extra(const std::optional<std::string>& text)
{
    if (!text || text->empty())
    {
        return nullptr;
    }
    boost::system::error_code ec;
    auto jv = boost::json::parse(*text, ec);
    if (ec)
    {
        return nullptr;
    }
    return jv;
}

StoredEvent read_event(const storage::Statement& stmt)
{
    StoredEvent row;
    row.id = stmt.column_int(0);
    AuditEvent& e = row.event;
    e.timestamp = stmt.column_time(1).value_or(time_utils::TimePoint{});
    e.type = parse_event_type(stmt.column_text(2)).value_or(EventType::AdminAction);
    e.severity = parse_severity(stmt.column_text(3)).value_or(Severity::Info);
    e.actor_user_id = stmt.column_opt_int(4);
    e.actor_username = stmt.column_opt_text(5);
    e.actor_role = stmt.column_opt_text(6);
    e.source_address = stmt.column_opt_text(7);
    e.target_endpoint = stmt.column_opt_text(8);
    e.description = stmt.column_text(9);
    e.extra = parse_extra(stmt.column_opt_text(10));
    e.success = stmt.column_int(11) != 0;
    return row;
}

Logger::Level mirror_level(Severity s)
{
    switch (s)
    {
        case Severity::Warning: return Logger::Level::Warn;
        case Severity::Critical: return Logger::Level::Error;
        default: return Logger::Level::Info;
    }
}

} // namespace

AuditTrail::AuditTrail(storage::Database& database, const time_utils::Clock& clk)
    : db(database), clock(clk)
{
}

std::optional<int64_t> AuditTrail::log(AuditEvent event)
{
    event.timestamp = clock.get().now();

    std::optional<int64_t> id;
    auto stmt = db.get().prepare(
        "INSERT INTO audit_logs (timestamp, event_type, severity, user_id, username, user_type, "
        "ip_address, endpoint, description, additional_data, success) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id;");
    if (stmt.valid())
    {
        stmt.bind_time(1, event.timestamp)
            .bind(2, to_string(event.type))
            .bind(3, to_string(event.severity))
            .bind(4, event.actor_user_id)
            .bind(5, event.actor_username)
            .bind(6, event.actor_role)
            .bind(7, event.source_address)
            .bind(8, event.target_endpoint)
            .bind(9, event.description)
            .bind(10, serialize_extra(event.extra))
            .bind(11, int64_t{event.success ? 1 : 0});

        if (stmt.step() == SQLITE_ROW)
        {
            id = stmt.column_int(0);
        }
    }
    if (!id)
    {
        LOG_ERROR("Failed to persist audit event {}: {}", to_string(event.type), db.get().last_error());
    }

    mirror(event);
    return id;
}

void AuditTrail::mirror(const AuditEvent& event)
{
    Logger::write(mirror_level(event.severity),
                  std::format("AUDIT[{}]: {} | User: {} | IP: {}",
                              to_string(event.type),
                              event.description,
                              event.actor_username.value_or("N/A"),
                              event.source_address.value_or("N/A")));
}

std::vector<StoredEvent> AuditTrail::recent(size_t limit)
{
    std::vector<StoredEvent> rows;
    auto stmt = db.get().prepare(std::format("{}ORDER BY id DESC LIMIT ?;", select_cols));
    if (!stmt.valid())
    {
        return rows;
    }
    stmt.bind(1, static_cast<int64_t>(limit));
    while (stmt.step() == SQLITE_ROW)
    {
        rows.push_back(read_event(stmt));
    }
    return rows;
}

std::vector<StoredEvent> AuditTrail::for_user(std::string_view username, size_t limit)
{
    std::vector<StoredEvent> rows;
    auto stmt = db.get().prepare(std::format("{}WHERE username = ? ORDER BY id DESC LIMIT ?;", select_cols));
    if (!stmt.valid())
    {
        return rows;
    }
    stmt.bind(1, username).bind(2, static_cast<int64_t>(limit));
    while (stmt.step() == SQLITE_ROW)
    {
        rows.push_back(read_event(stmt));
    }
    return rows;
}

} // namespace audit
