#include "rowpager/session/session.hpp"

#include "rowpager/session/session_errors.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace rowpager::session {

namespace {

[[nodiscard]] bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept
{
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
           });
}

[[nodiscard]] std::optional<std::string> as_filter(const std::string& value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string_view session_state_to_string(SessionState state) noexcept
{
    switch (state) {
    case SessionState::Idle:
        return "idle";
    case SessionState::ActiveQuery:
        return "active_query";
    case SessionState::Closed:
    default:
        return "closed";
    }
}

Session::Session(std::unique_ptr<driver::Connection> connection, ShutdownSignal& shutdown)
    : connection_{std::move(connection)}
    , shutdown_{shutdown}
{
    if (!connection_) {
        throw std::invalid_argument("Session requires a connection");
    }
}

Session::~Session() = default;

void Session::ensure_connected() const
{
    if (closed_) {
        throw std::system_error(make_error_code(SessionErrc::ConnectionClosed));
    }
}

PagingContext& Session::active_context()
{
    ensure_connected();
    if (!context_) {
        throw std::system_error(make_error_code(SessionErrc::NoActiveQuery));
    }
    return *context_;
}

std::vector<TableInfo> Session::table_like(std::string_view kind)
{
    std::lock_guard guard(mutex_);
    ensure_connected();

    auto cursor = connection_->cursor();
    const auto rows = cursor->tables();
    cursor->close();

    std::vector<TableInfo> tables;
    for (const auto& row : rows) {
        if (!equals_ignore_case(row.kind, kind)) {
            continue;
        }
        tables.push_back({row.catalog.value_or(""), row.schema.value_or(""), row.table});
    }
    return tables;
}

std::vector<TableInfo> Session::tables()
{
    return table_like("table");
}

std::vector<TableInfo> Session::views()
{
    return table_like("view");
}

std::vector<ColumnInfo> Session::columns(const std::string& catalog, const std::string& schema, const std::string& table)
{
    std::lock_guard guard(mutex_);
    ensure_connected();

    auto cursor = connection_->cursor();
    const auto rows = cursor->columns(as_filter(catalog), as_filter(schema), as_filter(table));
    cursor->close();

    std::vector<ColumnInfo> columns;
    columns.reserve(rows.size());
    for (const auto& row : rows) {
        columns.push_back({row.catalog.value_or(""), row.schema.value_or(""), row.table, row.column, row.type_name});
    }
    return columns;
}

void Session::execute(const std::string& sql)
{
    std::lock_guard guard(mutex_);
    ensure_connected();
    if (context_) {
        throw std::system_error(make_error_code(SessionErrc::ExecuteWhileActive));
    }

    auto cursor = connection_->cursor();
    try {
        cursor->execute(sql);
    } catch (const std::system_error&) {
        try {
            cursor->close();
        } catch (const std::system_error&) {
            // report the execute failure
        }
        throw;
    }
    context_ = std::make_unique<PagingContext>(std::move(cursor));
}

std::vector<driver::ColumnDescriptor> Session::metadata()
{
    std::lock_guard guard(mutex_);
    return active_context().metadata();
}

std::int64_t Session::count()
{
    std::lock_guard guard(mutex_);
    return active_context().count();
}

std::vector<PageRow> Session::page(std::int64_t max_rows)
{
    std::lock_guard guard(mutex_);
    return active_context().page(max_rows);
}

void Session::finish()
{
    std::lock_guard guard(mutex_);
    auto& context = active_context();
    auto released = std::move(context_);
    context.finish();
}

void Session::quit()
{
    std::lock_guard guard(mutex_);
    ensure_connected();
    if (context_) {
        throw std::system_error(make_error_code(SessionErrc::QuitWhileActive));
    }

    connection_->close();
    closed_ = true;
    shutdown_.request();
}

SessionState Session::state() const
{
    std::lock_guard guard(mutex_);
    if (closed_) {
        return SessionState::Closed;
    }
    return context_ ? SessionState::ActiveQuery : SessionState::Idle;
}

}  // namespace rowpager::session
