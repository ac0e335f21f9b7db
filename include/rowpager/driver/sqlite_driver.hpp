#pragma once

#include "rowpager/driver/driver.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3_stmt;

namespace rowpager::driver {

namespace detail {
struct SqliteHandle;
}  // namespace detail

class SqliteCursor final : public Cursor {
public:
    explicit SqliteCursor(std::shared_ptr<detail::SqliteHandle> handle);
    ~SqliteCursor() override;

    SqliteCursor(const SqliteCursor&) = delete;
    SqliteCursor& operator=(const SqliteCursor&) = delete;
    SqliteCursor(SqliteCursor&&) = delete;
    SqliteCursor& operator=(SqliteCursor&&) = delete;

    void execute(std::string_view sql) override;
    [[nodiscard]] std::vector<ColumnDescriptor> description() const override;
    [[nodiscard]] std::optional<Row> fetch_row() override;
    [[nodiscard]] std::int64_t row_count() const override;

    [[nodiscard]] std::vector<CatalogTableRow> tables() override;
    [[nodiscard]] std::vector<CatalogColumnRow> columns(const std::optional<std::string>& catalog,
                                                        const std::optional<std::string>& schema,
                                                        const std::optional<std::string>& table) override;

    void close() override;

private:
    void ensure_open() const;
    void finalize_statement() noexcept;
    [[nodiscard]] std::vector<ColumnDescriptor> read_description() const;
    [[nodiscard]] Row read_current_row() const;
    void advance();

    std::shared_ptr<detail::SqliteHandle> handle_;
    sqlite3_stmt* statement_ = nullptr;
    std::vector<ColumnDescriptor> description_{};
    std::int64_t row_count_ = -1;
    bool row_pending_ = false;
    bool closed_ = false;
};

// Opens a SQLite database from a filename or file: URI; read-write, created
// on demand.
class SqliteConnection final : public Connection {
public:
    explicit SqliteConnection(const std::string& connection_string);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;
    SqliteConnection(SqliteConnection&&) = delete;
    SqliteConnection& operator=(SqliteConnection&&) = delete;

    [[nodiscard]] std::unique_ptr<Cursor> cursor() override;
    void close() override;
    [[nodiscard]] bool is_open() const noexcept override;

private:
    std::shared_ptr<detail::SqliteHandle> handle_;
};

}  // namespace rowpager::driver
