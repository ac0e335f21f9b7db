#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rowpager::driver {

struct Blob final {
    std::vector<std::byte> bytes{};

    bool operator==(const Blob& other) const = default;
};

using Value = std::variant<std::monostate, std::int64_t, double, std::string, Blob>;
using Row = std::vector<Value>;

struct ColumnDescriptor final {
    std::string name{};
    std::string type_name{};

    bool operator==(const ColumnDescriptor& other) const = default;
};

struct CatalogTableRow final {
    std::optional<std::string> catalog{};
    std::optional<std::string> schema{};
    std::string table{};
    std::string kind{};
};

struct CatalogColumnRow final {
    std::optional<std::string> catalog{};
    std::optional<std::string> schema{};
    std::string table{};
    std::string column{};
    std::string type_name{};
};

// Every operation reports failure by throwing std::system_error in the
// rowpager.driver category.
class Cursor {
public:
    virtual ~Cursor() = default;

    virtual void execute(std::string_view sql) = 0;
    [[nodiscard]] virtual std::vector<ColumnDescriptor> description() const = 0;

    // Returns std::nullopt once the result set is exhausted.
    [[nodiscard]] virtual std::optional<Row> fetch_row() = 0;

    // Rows affected by the last statement, -1 for queries.
    [[nodiscard]] virtual std::int64_t row_count() const = 0;

    [[nodiscard]] virtual std::vector<CatalogTableRow> tables() = 0;
    [[nodiscard]] virtual std::vector<CatalogColumnRow> columns(const std::optional<std::string>& catalog,
                                                                const std::optional<std::string>& schema,
                                                                const std::optional<std::string>& table) = 0;

    virtual void close() = 0;
};

class Connection {
public:
    virtual ~Connection() = default;

    [[nodiscard]] virtual std::unique_ptr<Cursor> cursor() = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

}  // namespace rowpager::driver
