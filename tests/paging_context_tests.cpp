#include "rowpager/session/paging_context.hpp"

#include "rowpager/driver/driver_errors.hpp"
#include "rowpager/driver/sqlite_driver.hpp"
#include "rowpager/session/session_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using namespace rowpager;
using namespace rowpager::session;

namespace {

struct CursorProbe final {
    std::size_t description_calls = 0U;
    std::size_t fetch_calls = 0U;
    std::size_t close_calls = 0U;
};

struct StubCursor final : driver::Cursor {
    StubCursor(CursorProbe& probe, std::vector<driver::ColumnDescriptor> descriptors, std::vector<driver::Row> rows)
        : probe{probe}
        , descriptors{std::move(descriptors)}
        , rows{std::move(rows)}
    {
    }

    void execute(std::string_view) override
    {
    }

    std::vector<driver::ColumnDescriptor> description() const override
    {
        ++probe.description_calls;
        return descriptors;
    }

    std::optional<driver::Row> fetch_row() override
    {
        ++probe.fetch_calls;
        if (next >= rows.size()) {
            return std::nullopt;
        }
        return rows[next++];
    }

    std::int64_t row_count() const override
    {
        return affected;
    }

    std::vector<driver::CatalogTableRow> tables() override
    {
        return {};
    }

    std::vector<driver::CatalogColumnRow> columns(const std::optional<std::string>&,
                                                  const std::optional<std::string>&,
                                                  const std::optional<std::string>&) override
    {
        return {};
    }

    void close() override
    {
        ++probe.close_calls;
        if (probe.close_calls > 1U) {
            throw std::system_error(make_error_code(driver::DriverErrc::CursorClosed));
        }
    }

    CursorProbe& probe;
    std::vector<driver::ColumnDescriptor> descriptors;
    std::vector<driver::Row> rows;
    std::size_t next = 0U;
    std::int64_t affected = -1;
};

std::vector<driver::Row> numbered_rows(std::int64_t count)
{
    std::vector<driver::Row> rows;
    for (std::int64_t index = 1; index <= count; ++index) {
        rows.push_back({driver::Value{index}, driver::Value{std::string{"row-"} + std::to_string(index)}});
    }
    return rows;
}

std::unique_ptr<StubCursor> make_cursor(CursorProbe& probe, std::int64_t count)
{
    return std::make_unique<StubCursor>(probe,
                                        std::vector<driver::ColumnDescriptor>{{"id", "INTEGER"}, {"label", "TEXT"}},
                                        numbered_rows(count));
}

}  // namespace

TEST_CASE("value_to_text renders every driver value")
{
    CHECK(value_to_text(driver::Value{}) == "NULL");
    CHECK(value_to_text(driver::Value{std::int64_t{-42}}) == "-42");
    CHECK(value_to_text(driver::Value{std::numeric_limits<std::int64_t>::max()}) == "9223372036854775807");
    CHECK(value_to_text(driver::Value{2.5}) == "2.5");
    CHECK(value_to_text(driver::Value{0.1}) == "0.1");
    CHECK(value_to_text(driver::Value{std::string{"hello"}}) == "hello");
    CHECK(value_to_text(driver::Value{std::string{}}).empty());
    CHECK(value_to_text(driver::Value{driver::Blob{{std::byte{0x00}, std::byte{0xab}, std::byte{0x7f}}}}) == "00ab7f");
}

TEST_CASE("PagingContext captures metadata once at construction")
{
    CursorProbe probe;
    auto cursor = make_cursor(probe, 2);
    auto* raw = cursor.get();
    PagingContext context{std::move(cursor)};
    CHECK(probe.description_calls == 1U);

    raw->descriptors.push_back({"late", "TEXT"});

    const auto& columns = context.metadata();
    REQUIRE(columns.size() == 2U);
    CHECK(columns[0].name == "id");
    CHECK(columns[1].type_name == "TEXT");
    (void)context.metadata();
    CHECK(probe.description_calls == 1U);
}

TEST_CASE("PagingContext pages partition the result set")
{
    CursorProbe probe;
    PagingContext context{make_cursor(probe, 7)};

    std::vector<std::string> seen;
    std::vector<std::size_t> page_sizes;
    while (true) {
        const auto rows = context.page(3);
        CHECK(rows.size() <= 3U);
        page_sizes.push_back(rows.size());
        if (rows.empty()) {
            break;
        }
        for (const auto& row : rows) {
            REQUIRE(row.size() == 2U);
            CHECK(row[0].first == "id");
            CHECK(row[1].first == "label");
            seen.push_back(row[0].second);
        }
    }

    CHECK(page_sizes == std::vector<std::size_t>{3U, 3U, 1U, 0U});
    CHECK(seen == std::vector<std::string>{"1", "2", "3", "4", "5", "6", "7"});
    CHECK(context.page(5).empty());
}

TEST_CASE("PagingContext pages stop at the requested size without over-fetching")
{
    CursorProbe probe;
    PagingContext context{make_cursor(probe, 10)};

    const auto rows = context.page(4);
    CHECK(rows.size() == 4U);
    CHECK(probe.fetch_calls == 4U);
}

TEST_CASE("PagingContext rejects non-positive page sizes")
{
    CursorProbe probe;
    PagingContext context{make_cursor(probe, 3)};

    for (const std::int64_t size : {std::int64_t{0}, std::int64_t{-1}, std::numeric_limits<std::int64_t>::min()}) {
        try {
            (void)context.page(size);
            FAIL("expected invalid page size");
        } catch (const std::system_error& error) {
            CHECK(error.code() == SessionErrc::InvalidPageSize);
        }
    }
    CHECK(probe.fetch_calls == 0U);
    CHECK(context.page(std::numeric_limits<std::int64_t>::max()).size() == 3U);
}

TEST_CASE("PagingContext exposes the update count")
{
    CursorProbe probe;
    auto cursor = make_cursor(probe, 0);
    cursor->affected = 12;
    PagingContext context{std::move(cursor)};
    CHECK(context.count() == 12);
    CHECK(context.count() == 12);
}

TEST_CASE("PagingContext finish releases the cursor exactly once")
{
    CursorProbe probe;
    {
        PagingContext context{make_cursor(probe, 3)};
        REQUIRE(context.is_open());
        context.finish();
        CHECK_FALSE(context.is_open());
        CHECK(probe.close_calls == 1U);

        try {
            (void)context.page(1);
            FAIL("expected finished context failure");
        } catch (const std::system_error& error) {
            CHECK(error.code() == SessionErrc::NoActiveQuery);
        }

        try {
            context.finish();
            FAIL("expected second finish failure");
        } catch (const std::system_error& error) {
            CHECK(error.code() == SessionErrc::NoActiveQuery);
        }
    }
    CHECK(probe.close_calls == 1U);
}

TEST_CASE("PagingContext destructor closes an unfinished cursor")
{
    CursorProbe probe;
    {
        PagingContext context{make_cursor(probe, 3)};
        (void)context.page(1);
    }
    CHECK(probe.close_calls == 1U);
}

TEST_CASE("PagingContext stringifies SQLite rows in column order")
{
    driver::SqliteConnection connection{":memory:"};
    auto cursor = connection.cursor();
    cursor->execute("SELECT 3 AS b, 'x' AS a, NULL AS c, 1.5 AS d, x'beef' AS e");

    PagingContext context{std::move(cursor)};
    const auto rows = context.page(10);
    REQUIRE(rows.size() == 1U);
    const PageRow expected{{"b", "3"}, {"a", "x"}, {"c", "NULL"}, {"d", "1.5"}, {"e", "beef"}};
    CHECK(rows[0] == expected);
    CHECK(context.count() == -1);
    context.finish();
}
