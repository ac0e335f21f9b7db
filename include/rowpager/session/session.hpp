#pragma once

#include "rowpager/driver/driver.hpp"
#include "rowpager/session/paging_context.hpp"
#include "rowpager/session/shutdown_signal.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rowpager::session {

struct TableInfo final {
    std::string catalog{};
    std::string schema{};
    std::string table{};
};

struct ColumnInfo final {
    std::string catalog{};
    std::string schema{};
    std::string table{};
    std::string column{};
    std::string datatype{};
};

enum class SessionState : std::uint8_t {
    Idle = 0,
    ActiveQuery,
    Closed
};

[[nodiscard]] std::string_view session_state_to_string(SessionState state) noexcept;

// Holds the connection and at most one PagingContext. Every operation takes
// the session mutex, so callers on different threads never interleave.
// Rule violations throw std::system_error with a SessionErrc code; driver
// failures propagate unchanged.
class Session final {
public:
    Session(std::unique_ptr<driver::Connection> connection, ShutdownSignal& shutdown);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    [[nodiscard]] std::vector<TableInfo> tables();
    [[nodiscard]] std::vector<TableInfo> views();

    // An empty catalog, schema or table means "no filter".
    [[nodiscard]] std::vector<ColumnInfo> columns(const std::string& catalog,
                                                  const std::string& schema,
                                                  const std::string& table);

    void execute(const std::string& sql);
    [[nodiscard]] std::vector<driver::ColumnDescriptor> metadata();
    [[nodiscard]] std::int64_t count();
    [[nodiscard]] std::vector<PageRow> page(std::int64_t max_rows);
    void finish();

    // Closes the connection and raises the shutdown signal. Rejected while a
    // query is active.
    void quit();

    [[nodiscard]] SessionState state() const;

private:
    [[nodiscard]] std::vector<TableInfo> table_like(std::string_view kind);
    void ensure_connected() const;
    [[nodiscard]] PagingContext& active_context();

    mutable std::mutex mutex_{};
    std::unique_ptr<driver::Connection> connection_;
    ShutdownSignal& shutdown_;
    std::unique_ptr<PagingContext> context_{};
    bool closed_ = false;
};

}  // namespace rowpager::session
