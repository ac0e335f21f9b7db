#include "rowpager/driver/sqlite_driver.hpp"

#include "rowpager/driver/driver_errors.hpp"

#include <sqlite3.h>

#include <cctype>
#include <functional>
#include <system_error>
#include <utility>

namespace rowpager::driver {

namespace detail {

struct SqliteHandle final {
    ~SqliteHandle()
    {
        close();
    }

    void close() noexcept
    {
        if (db != nullptr) {
            (void)sqlite3_close_v2(db);
            db = nullptr;
        }
    }

    sqlite3* db = nullptr;
};

}  // namespace detail

namespace {

struct StatementDeleter final {
    void operator()(sqlite3_stmt* statement) const noexcept
    {
        (void)sqlite3_finalize(statement);
    }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

[[noreturn]] void throw_driver_error(DriverErrc code, sqlite3* db)
{
    const char* message = (db != nullptr) ? sqlite3_errmsg(db) : nullptr;
    throw std::system_error(make_error_code(code), message != nullptr ? message : "unknown sqlite error");
}

[[nodiscard]] std::string_view skip_whitespace_and_comments(std::string_view text)
{
    std::string_view view = text;
    while (!view.empty()) {
        std::size_t offset = 0U;
        while (offset < view.size() && std::isspace(static_cast<unsigned char>(view[offset])) != 0) {
            ++offset;
        }
        view = view.substr(offset);

        if (view.size() >= 2U && view[0] == '-' && view[1] == '-') {
            const auto newline = view.find('\n');
            view = (newline == std::string_view::npos) ? std::string_view{} : view.substr(newline + 1U);
            continue;
        }
        if (view.size() >= 2U && view[0] == '/' && view[1] == '*') {
            const auto terminator = view.find("*/", 2U);
            view = (terminator == std::string_view::npos) ? std::string_view{} : view.substr(terminator + 2U);
            continue;
        }
        if (!view.empty() && view.front() == ';') {
            view.remove_prefix(1U);
            continue;
        }
        break;
    }
    return view;
}

[[nodiscard]] std::string quote_identifier(std::string_view identifier)
{
    std::string quoted;
    quoted.reserve(identifier.size() + 2U);
    quoted.push_back('"');
    for (const char ch : identifier) {
        if (ch == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

[[nodiscard]] std::string column_text(sqlite3_stmt* statement, int index)
{
    const auto* text = sqlite3_column_text(statement, index);
    if (text == nullptr) {
        return {};
    }
    const auto size = sqlite3_column_bytes(statement, index);
    return std::string{reinterpret_cast<const char*>(text), static_cast<std::size_t>(size)};
}

[[nodiscard]] std::string storage_class_name(int type)
{
    switch (type) {
    case SQLITE_INTEGER:
        return "INTEGER";
    case SQLITE_FLOAT:
        return "REAL";
    case SQLITE_TEXT:
        return "TEXT";
    case SQLITE_BLOB:
        return "BLOB";
    case SQLITE_NULL:
    default:
        return "NULL";
    }
}

StatementPtr prepare(sqlite3* db, const std::string& sql)
{
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        (void)sqlite3_finalize(raw);
        throw_driver_error(DriverErrc::PrepareFailed, db);
    }
    return StatementPtr{raw};
}

void for_each_row(sqlite3* db, sqlite3_stmt* statement, const std::function<void(sqlite3_stmt*)>& visitor)
{
    while (true) {
        const int rc = sqlite3_step(statement);
        if (rc == SQLITE_DONE) {
            return;
        }
        if (rc != SQLITE_ROW) {
            throw_driver_error(DriverErrc::StepFailed, db);
        }
        visitor(statement);
    }
}

[[nodiscard]] std::vector<std::string> list_schemas(sqlite3* db)
{
    std::vector<std::string> schemas;
    auto statement = prepare(db, "PRAGMA database_list");
    for_each_row(db, statement.get(), [&](sqlite3_stmt* row) {
        schemas.push_back(column_text(row, 1));
    });
    return schemas;
}

[[nodiscard]] std::string relation_kind(std::string_view name, std::string_view type)
{
    if (type == "view") {
        return "VIEW";
    }
    if (name.rfind("sqlite_", 0U) == 0U) {
        return "SYSTEM TABLE";
    }
    return "TABLE";
}

}  // namespace

SqliteCursor::SqliteCursor(std::shared_ptr<detail::SqliteHandle> handle)
    : handle_{std::move(handle)}
{
}

SqliteCursor::~SqliteCursor()
{
    finalize_statement();
}

void SqliteCursor::ensure_open() const
{
    if (closed_) {
        throw std::system_error(make_error_code(DriverErrc::CursorClosed));
    }
    if (!handle_ || handle_->db == nullptr) {
        throw std::system_error(make_error_code(DriverErrc::ConnectionClosed));
    }
}

void SqliteCursor::finalize_statement() noexcept
{
    if (statement_ != nullptr) {
        (void)sqlite3_finalize(statement_);
        statement_ = nullptr;
    }
    row_pending_ = false;
}

void SqliteCursor::execute(std::string_view sql)
{
    ensure_open();
    finalize_statement();
    description_.clear();
    row_count_ = -1;

    if (skip_whitespace_and_comments(sql).empty()) {
        throw std::system_error(make_error_code(DriverErrc::NoStatement));
    }

    sqlite3* db = handle_->db;
    const char* tail = nullptr;
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, &tail) != SQLITE_OK) {
        (void)sqlite3_finalize(raw);
        throw_driver_error(DriverErrc::PrepareFailed, db);
    }
    StatementPtr statement{raw};
    if (!statement) {
        throw std::system_error(make_error_code(DriverErrc::NoStatement));
    }

    if (tail != nullptr) {
        const auto consumed = static_cast<std::size_t>(tail - sql.data());
        if (!skip_whitespace_and_comments(sql.substr(consumed)).empty()) {
            throw std::system_error(make_error_code(DriverErrc::MultipleStatements));
        }
    }

    const int changes_before = sqlite3_total_changes(db);
    const int rc = sqlite3_step(statement.get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        throw_driver_error(DriverErrc::StepFailed, db);
    }

    statement_ = statement.release();
    row_pending_ = (rc == SQLITE_ROW);
    if (sqlite3_stmt_readonly(statement_) != 0) {
        row_count_ = -1;
    } else {
        row_count_ = (sqlite3_total_changes(db) == changes_before) ? 0 : sqlite3_changes(db);
    }
    description_ = read_description();
}

std::vector<ColumnDescriptor> SqliteCursor::read_description() const
{
    std::vector<ColumnDescriptor> description;
    if (statement_ == nullptr) {
        return description;
    }

    const int count = sqlite3_column_count(statement_);
    description.reserve(static_cast<std::size_t>(count));
    for (int index = 0; index < count; ++index) {
        ColumnDescriptor column{};
        const char* name = sqlite3_column_name(statement_, index);
        column.name = (name != nullptr) ? name : "";

        const char* declared = sqlite3_column_decltype(statement_, index);
        if (declared != nullptr) {
            column.type_name = declared;
        } else if (row_pending_) {
            column.type_name = storage_class_name(sqlite3_column_type(statement_, index));
        }
        description.push_back(std::move(column));
    }
    return description;
}

std::vector<ColumnDescriptor> SqliteCursor::description() const
{
    ensure_open();
    return description_;
}

Row SqliteCursor::read_current_row() const
{
    const int count = sqlite3_column_count(statement_);
    Row row;
    row.reserve(static_cast<std::size_t>(count));
    for (int index = 0; index < count; ++index) {
        switch (sqlite3_column_type(statement_, index)) {
        case SQLITE_INTEGER:
            row.emplace_back(static_cast<std::int64_t>(sqlite3_column_int64(statement_, index)));
            break;
        case SQLITE_FLOAT:
            row.emplace_back(sqlite3_column_double(statement_, index));
            break;
        case SQLITE_TEXT:
            row.emplace_back(column_text(statement_, index));
            break;
        case SQLITE_BLOB: {
            Blob blob{};
            const auto* data = static_cast<const std::byte*>(sqlite3_column_blob(statement_, index));
            const auto size = static_cast<std::size_t>(sqlite3_column_bytes(statement_, index));
            if (data != nullptr) {
                blob.bytes.assign(data, data + size);
            }
            row.emplace_back(std::move(blob));
            break;
        }
        case SQLITE_NULL:
        default:
            row.emplace_back(std::monostate{});
            break;
        }
    }
    return row;
}

void SqliteCursor::advance()
{
    const int rc = sqlite3_step(statement_);
    if (rc == SQLITE_ROW) {
        row_pending_ = true;
        return;
    }
    row_pending_ = false;
    if (rc != SQLITE_DONE) {
        throw_driver_error(DriverErrc::StepFailed, handle_->db);
    }
}

std::optional<Row> SqliteCursor::fetch_row()
{
    ensure_open();
    if (statement_ == nullptr || !row_pending_) {
        return std::nullopt;
    }

    auto row = read_current_row();
    advance();
    return row;
}

std::int64_t SqliteCursor::row_count() const
{
    ensure_open();
    return row_count_;
}

std::vector<CatalogTableRow> SqliteCursor::tables()
{
    ensure_open();
    sqlite3* db = handle_->db;

    std::vector<CatalogTableRow> rows;
    for (const auto& schema : list_schemas(db)) {
        auto statement = prepare(db,
                                 "SELECT name, type FROM " + quote_identifier(schema) +
                                     ".sqlite_master WHERE type IN ('table', 'view') ORDER BY name");
        for_each_row(db, statement.get(), [&](sqlite3_stmt* row) {
            CatalogTableRow entry{};
            entry.schema = schema;
            entry.table = column_text(row, 0);
            entry.kind = relation_kind(entry.table, column_text(row, 1));
            rows.push_back(std::move(entry));
        });
    }
    return rows;
}

std::vector<CatalogColumnRow> SqliteCursor::columns(const std::optional<std::string>& catalog,
                                                    const std::optional<std::string>& schema,
                                                    const std::optional<std::string>& table)
{
    ensure_open();
    sqlite3* db = handle_->db;

    std::vector<CatalogColumnRow> rows;
    if (catalog.has_value()) {
        // SQLite exposes no catalogs, so a catalog filter never matches.
        return rows;
    }

    for (const auto& schema_name : list_schemas(db)) {
        if (schema.has_value() && *schema != schema_name) {
            continue;
        }

        std::string relations_sql = "SELECT name FROM " + quote_identifier(schema_name) +
                                    ".sqlite_master WHERE type IN ('table', 'view')";
        if (table.has_value()) {
            relations_sql += " AND name = ?1 COLLATE NOCASE";
        }
        relations_sql += " ORDER BY name";

        auto relations = prepare(db, relations_sql);
        if (table.has_value()) {
            (void)sqlite3_bind_text(relations.get(), 1, table->c_str(), static_cast<int>(table->size()), SQLITE_TRANSIENT);
        }

        std::vector<std::string> relation_names;
        for_each_row(db, relations.get(), [&](sqlite3_stmt* row) {
            relation_names.push_back(column_text(row, 0));
        });

        for (const auto& relation : relation_names) {
            auto info = prepare(db, "PRAGMA " + quote_identifier(schema_name) + ".table_info(" + quote_identifier(relation) + ")");
            for_each_row(db, info.get(), [&](sqlite3_stmt* row) {
                CatalogColumnRow entry{};
                entry.schema = schema_name;
                entry.table = relation;
                entry.column = column_text(row, 1);
                entry.type_name = column_text(row, 2);
                rows.push_back(std::move(entry));
            });
        }
    }
    return rows;
}

void SqliteCursor::close()
{
    if (closed_) {
        throw std::system_error(make_error_code(DriverErrc::CursorClosed));
    }
    finalize_statement();
    description_.clear();
    closed_ = true;
}

SqliteConnection::SqliteConnection(const std::string& connection_string)
    : handle_{std::make_shared<detail::SqliteHandle>()}
{
    constexpr int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI | SQLITE_OPEN_FULLMUTEX;
    const int rc = sqlite3_open_v2(connection_string.c_str(), &handle_->db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = (handle_->db != nullptr) ? sqlite3_errmsg(handle_->db) : sqlite3_errstr(rc);
        handle_->close();
        throw std::system_error(make_error_code(DriverErrc::OpenFailed), message);
    }

    (void)sqlite3_busy_timeout(handle_->db, 5000);
}

SqliteConnection::~SqliteConnection() = default;

std::unique_ptr<Cursor> SqliteConnection::cursor()
{
    if (!is_open()) {
        throw std::system_error(make_error_code(DriverErrc::ConnectionClosed));
    }
    return std::make_unique<SqliteCursor>(handle_);
}

void SqliteConnection::close()
{
    if (!is_open()) {
        throw std::system_error(make_error_code(DriverErrc::ConnectionClosed));
    }
    handle_->close();
}

bool SqliteConnection::is_open() const noexcept
{
    return handle_ && handle_->db != nullptr;
}

}  // namespace rowpager::driver
