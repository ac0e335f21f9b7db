#pragma once

#include "rowpager/driver/driver.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rowpager::session {

// Column name to stringified value, in column order.
using PageRow = std::vector<std::pair<std::string, std::string>>;

[[nodiscard]] std::string value_to_text(const driver::Value& value);

// Owns one executed cursor. The column descriptors are captured once, at
// construction, and never re-read from the driver.
class PagingContext final {
public:
    explicit PagingContext(std::unique_ptr<driver::Cursor> cursor);
    ~PagingContext();

    PagingContext(const PagingContext&) = delete;
    PagingContext& operator=(const PagingContext&) = delete;
    PagingContext(PagingContext&&) = delete;
    PagingContext& operator=(PagingContext&&) = delete;

    [[nodiscard]] const std::vector<driver::ColumnDescriptor>& metadata() const;
    [[nodiscard]] std::int64_t count() const;

    // Returns at most max_rows rows; an empty page means the result set is
    // exhausted. max_rows < 1 fails with SessionErrc::InvalidPageSize.
    [[nodiscard]] std::vector<PageRow> page(std::int64_t max_rows);

    // Releases the cursor. The context must not be used afterwards.
    void finish();

    [[nodiscard]] bool is_open() const noexcept { return cursor_ != nullptr; }

private:
    void ensure_open() const;

    std::unique_ptr<driver::Cursor> cursor_;
    std::vector<driver::ColumnDescriptor> columns_{};
};

}  // namespace rowpager::session
