#include "rowpager/session/session.hpp"

#include "rowpager/driver/driver_errors.hpp"
#include "rowpager/driver/sqlite_driver.hpp"
#include "rowpager/session/session_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace rowpager;
using namespace rowpager::session;

namespace {

struct DriverProbe final {
    std::size_t cursors_opened = 0U;
    std::size_t cursors_closed = 0U;
    std::size_t connection_closes = 0U;
    bool fail_execute = false;
    std::vector<std::optional<std::string>> column_filters{};
    std::vector<driver::CatalogTableRow> catalog{};
};

struct StubCursor final : driver::Cursor {
    explicit StubCursor(DriverProbe& probe)
        : probe{probe}
    {
        ++probe.cursors_opened;
    }

    void execute(std::string_view) override
    {
        if (probe.fail_execute) {
            throw std::system_error(make_error_code(driver::DriverErrc::PrepareFailed), "no such table: missing");
        }
    }

    std::vector<driver::ColumnDescriptor> description() const override
    {
        return {{"value", "INTEGER"}};
    }

    std::optional<driver::Row> fetch_row() override
    {
        return std::nullopt;
    }

    std::int64_t row_count() const override
    {
        return 0;
    }

    std::vector<driver::CatalogTableRow> tables() override
    {
        return probe.catalog;
    }

    std::vector<driver::CatalogColumnRow> columns(const std::optional<std::string>& catalog,
                                                  const std::optional<std::string>& schema,
                                                  const std::optional<std::string>& table) override
    {
        probe.column_filters = {catalog, schema, table};
        return {{std::nullopt, std::nullopt, "Orders", "id", "INTEGER"}};
    }

    void close() override
    {
        ++probe.cursors_closed;
    }

    DriverProbe& probe;
};

struct StubConnection final : driver::Connection {
    explicit StubConnection(DriverProbe& probe)
        : probe{probe}
    {
    }

    std::unique_ptr<driver::Cursor> cursor() override
    {
        return std::make_unique<StubCursor>(probe);
    }

    void close() override
    {
        ++probe.connection_closes;
        open = false;
    }

    bool is_open() const noexcept override
    {
        return open;
    }

    DriverProbe& probe;
    bool open = true;
};

struct StubSessionHarness final {
    StubSessionHarness()
        : session{std::make_unique<StubConnection>(probe), shutdown}
    {
    }

    DriverProbe probe{};
    ShutdownSignal shutdown{};
    Session session;
};

struct SqliteSessionHarness final {
    SqliteSessionHarness()
        : session{make_connection(), shutdown}
    {
    }

    static std::unique_ptr<driver::Connection> make_connection()
    {
        auto connection = std::make_unique<driver::SqliteConnection>(":memory:");
        for (const auto* sql : {"CREATE TABLE Orders (id INTEGER, amount REAL)",
                                "CREATE TABLE customers (id INTEGER, name TEXT)",
                                "CREATE VIEW order_totals AS SELECT sum(amount) AS total FROM Orders",
                                "INSERT INTO Orders VALUES (1, 10.5), (2, 20.0), (3, 30.25), (4, 40.0), (5, 50.0)"}) {
            auto cursor = connection->cursor();
            cursor->execute(sql);
            cursor->close();
        }
        return connection;
    }

    ShutdownSignal shutdown{};
    Session session;
};

void require_session_error(const std::system_error& error, SessionErrc expected)
{
    CAPTURE(error.what());
    CHECK(error.code() == expected);
}

}  // namespace

TEST_CASE("Session starts idle and moves through the query lifecycle")
{
    SqliteSessionHarness harness;
    auto& session = harness.session;
    CHECK(session.state() == SessionState::Idle);

    session.execute("SELECT id, amount FROM Orders ORDER BY id");
    CHECK(session.state() == SessionState::ActiveQuery);

    const auto metadata = session.metadata();
    REQUIRE(metadata.size() == 2U);
    CHECK(metadata[0].name == "id");
    CHECK(metadata[1].type_name == "REAL");
    CHECK(session.count() == -1);

    std::vector<std::string> ids;
    while (true) {
        const auto rows = session.page(2);
        CHECK(rows.size() <= 2U);
        if (rows.empty()) {
            break;
        }
        for (const auto& row : rows) {
            ids.push_back(row.front().second);
        }
    }
    CHECK(ids == std::vector<std::string>{"1", "2", "3", "4", "5"});

    session.finish();
    CHECK(session.state() == SessionState::Idle);
    CHECK_FALSE(harness.shutdown.requested());
}

TEST_CASE("Session allows a single active query")
{
    SqliteSessionHarness harness;
    auto& session = harness.session;
    session.execute("SELECT id FROM Orders");

    try {
        session.execute("SELECT id FROM customers");
        FAIL("expected active query failure");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::ExecuteWhileActive);
        CHECK(std::string{error.what()} == "cannot execute while a query is active");
    }

    CHECK(session.state() == SessionState::ActiveQuery);
    CHECK(session.page(10).size() == 5U);
}

TEST_CASE("Session query operations require an active query")
{
    SqliteSessionHarness harness;
    auto& session = harness.session;

    try {
        (void)session.metadata();
        FAIL("expected no active query");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::NoActiveQuery);
        CHECK(std::string{error.what()} == "no active query");
    }

    try {
        (void)session.count();
        FAIL("expected no active query");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::NoActiveQuery);
    }

    try {
        (void)session.page(1);
        FAIL("expected no active query");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::NoActiveQuery);
    }

    try {
        session.finish();
        FAIL("expected no active query");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::NoActiveQuery);
    }

    CHECK(session.state() == SessionState::Idle);
}

TEST_CASE("Session page size errors keep the query active")
{
    SqliteSessionHarness harness;
    auto& session = harness.session;
    session.execute("SELECT id FROM Orders");

    try {
        (void)session.page(0);
        FAIL("expected invalid page size");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::InvalidPageSize);
    }

    CHECK(session.state() == SessionState::ActiveQuery);
    CHECK(session.page(1).size() == 1U);
}

TEST_CASE("Session reports update counts for data changes")
{
    SqliteSessionHarness harness;
    auto& session = harness.session;
    session.execute("UPDATE Orders SET amount = amount * 2 WHERE id <= 3");
    CHECK(session.count() == 3);
    CHECK(session.metadata().empty());
    CHECK(session.page(5).empty());
    session.finish();
}

TEST_CASE("Session execute failure leaves the session idle and closes the cursor")
{
    StubSessionHarness harness;
    harness.probe.fail_execute = true;

    try {
        harness.session.execute("SELECT * FROM missing");
        FAIL("expected driver failure");
    } catch (const std::system_error& error) {
        CHECK(error.code() == driver::DriverErrc::PrepareFailed);
        CHECK(std::string{error.what()}.find("no such table") != std::string::npos);
    }

    CHECK(harness.session.state() == SessionState::Idle);
    CHECK(harness.probe.cursors_opened == 1U);
    CHECK(harness.probe.cursors_closed == 1U);

    harness.probe.fail_execute = false;
    harness.session.execute("SELECT 1");
    CHECK(harness.session.state() == SessionState::ActiveQuery);
}

TEST_CASE("Session execute failure on SQLite propagates the driver error")
{
    SqliteSessionHarness harness;
    try {
        harness.session.execute("SELECT * FROM missing");
        FAIL("expected driver failure");
    } catch (const std::system_error& error) {
        CHECK(error.code() == driver::DriverErrc::PrepareFailed);
    }
    CHECK(harness.session.state() == SessionState::Idle);
}

TEST_CASE("Session catalog listings split tables from views")
{
    SqliteSessionHarness harness;
    auto& session = harness.session;

    const auto tables = session.tables();
    std::vector<std::string> table_names;
    for (const auto& table : tables) {
        CHECK(table.catalog.empty());
        CHECK(table.schema == "main");
        table_names.push_back(table.table);
    }
    std::sort(table_names.begin(), table_names.end());
    CHECK(table_names == std::vector<std::string>{"Orders", "customers"});

    const auto views = session.views();
    REQUIRE(views.size() == 1U);
    CHECK(views[0].table == "order_totals");
}

TEST_CASE("Session catalog kinds compare case-insensitively and normalize nulls")
{
    StubSessionHarness harness;
    harness.probe.catalog = {
        {std::nullopt, std::nullopt, "alpha", "TABLE"},
        {std::string{"cat"}, std::string{"dbo"}, "beta", "table"},
        {std::nullopt, std::string{"dbo"}, "gamma", "View"},
        {std::nullopt, std::nullopt, "sqlite_master", "SYSTEM TABLE"},
    };

    const auto tables = harness.session.tables();
    REQUIRE(tables.size() == 2U);
    CHECK(tables[0].catalog.empty());
    CHECK(tables[0].schema.empty());
    CHECK(tables[0].table == "alpha");
    CHECK(tables[1].catalog == "cat");
    CHECK(tables[1].schema == "dbo");

    const auto views = harness.session.views();
    REQUIRE(views.size() == 1U);
    CHECK(views[0].table == "gamma");
    CHECK(harness.probe.cursors_opened == harness.probe.cursors_closed);
}

TEST_CASE("Session columns treats empty filters as unspecified")
{
    StubSessionHarness harness;

    const auto columns = harness.session.columns("", "", "Orders");
    REQUIRE(columns.size() == 1U);
    CHECK(columns[0].catalog.empty());
    CHECK(columns[0].schema.empty());
    CHECK(columns[0].column == "id");
    CHECK(columns[0].datatype == "INTEGER");

    REQUIRE(harness.probe.column_filters.size() == 3U);
    CHECK_FALSE(harness.probe.column_filters[0].has_value());
    CHECK_FALSE(harness.probe.column_filters[1].has_value());
    REQUIRE(harness.probe.column_filters[2].has_value());
    CHECK(*harness.probe.column_filters[2] == "Orders");

    (void)harness.session.columns("cat", "dbo", "");
    CHECK(harness.probe.column_filters[0] == std::optional<std::string>{"cat"});
    CHECK(harness.probe.column_filters[1] == std::optional<std::string>{"dbo"});
    CHECK_FALSE(harness.probe.column_filters[2].has_value());
}

TEST_CASE("Session catalog calls do not disturb the active query")
{
    SqliteSessionHarness harness;
    auto& session = harness.session;
    session.execute("SELECT id FROM Orders ORDER BY id");
    CHECK(session.page(2).size() == 2U);

    const auto columns = session.columns("", "", "orders");
    CHECK(columns.size() == 2U);
    CHECK(session.tables().size() == 2U);

    CHECK(session.state() == SessionState::ActiveQuery);
    const auto rest = session.page(10);
    REQUIRE(rest.size() == 3U);
    CHECK(rest.front().front().second == "3");
}

TEST_CASE("Session quit is rejected while a query is active")
{
    StubSessionHarness harness;
    harness.session.execute("SELECT 1");

    try {
        harness.session.quit();
        FAIL("expected quit failure");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::QuitWhileActive);
        CHECK(std::string{error.what()} == "cannot quit while a query is active");
    }

    CHECK(harness.probe.connection_closes == 0U);
    CHECK_FALSE(harness.shutdown.requested());
    CHECK(harness.session.state() == SessionState::ActiveQuery);
}

TEST_CASE("Session quit closes the connection and raises shutdown")
{
    StubSessionHarness harness;
    harness.session.quit();

    CHECK(harness.probe.connection_closes == 1U);
    CHECK(harness.shutdown.requested());
    CHECK(harness.session.state() == SessionState::Closed);

    try {
        (void)harness.session.tables();
        FAIL("expected closed session failure");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::ConnectionClosed);
    }

    try {
        harness.session.quit();
        FAIL("expected closed session failure");
    } catch (const std::system_error& error) {
        require_session_error(error, SessionErrc::ConnectionClosed);
    }
    CHECK(harness.probe.connection_closes == 1U);
}

TEST_CASE("session_state_to_string names every state")
{
    CHECK(session_state_to_string(SessionState::Idle) == "idle");
    CHECK(session_state_to_string(SessionState::ActiveQuery) == "active_query");
    CHECK(session_state_to_string(SessionState::Closed) == "closed");
}
