#include "rowpager/session/paging_context.hpp"

#include "rowpager/session/session_errors.hpp"

#include <array>
#include <charconv>
#include <stdexcept>
#include <system_error>

namespace rowpager::session {

namespace {

[[nodiscard]] std::string double_to_text(double value)
{
    std::array<char, 64> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string{buffer.data(), end};
}

[[nodiscard]] std::string blob_to_hex(const driver::Blob& blob)
{
    constexpr char kHex[] = "0123456789abcdef";
    std::string text;
    text.reserve(blob.bytes.size() * 2U);
    for (const auto byte : blob.bytes) {
        const auto value = static_cast<unsigned char>(byte);
        text.push_back(kHex[(value >> 4U) & 0x0F]);
        text.push_back(kHex[value & 0x0F]);
    }
    return text;
}

}  // namespace

std::string value_to_text(const driver::Value& value)
{
    struct Visitor final {
        std::string operator()(std::monostate) const
        {
            return "NULL";
        }
        std::string operator()(std::int64_t number) const
        {
            return std::to_string(number);
        }
        std::string operator()(double number) const
        {
            return double_to_text(number);
        }
        std::string operator()(const std::string& text) const
        {
            return text;
        }
        std::string operator()(const driver::Blob& blob) const
        {
            return blob_to_hex(blob);
        }
    };
    return std::visit(Visitor{}, value);
}

PagingContext::PagingContext(std::unique_ptr<driver::Cursor> cursor)
    : cursor_{std::move(cursor)}
{
    if (!cursor_) {
        throw std::invalid_argument("PagingContext requires a cursor");
    }
    columns_ = cursor_->description();
}

PagingContext::~PagingContext()
{
    if (cursor_) {
        try {
            cursor_->close();
        } catch (const std::system_error&) {
            // the connection may already be gone; nothing left to release
        }
    }
}

void PagingContext::ensure_open() const
{
    if (!cursor_) {
        throw std::system_error(make_error_code(SessionErrc::NoActiveQuery));
    }
}

const std::vector<driver::ColumnDescriptor>& PagingContext::metadata() const
{
    ensure_open();
    return columns_;
}

std::int64_t PagingContext::count() const
{
    ensure_open();
    return cursor_->row_count();
}

std::vector<PageRow> PagingContext::page(std::int64_t max_rows)
{
    ensure_open();
    if (max_rows < 1) {
        throw std::system_error(make_error_code(SessionErrc::InvalidPageSize));
    }

    std::vector<PageRow> rows;
    while (static_cast<std::int64_t>(rows.size()) < max_rows) {
        auto row = cursor_->fetch_row();
        if (!row) {
            break;
        }

        PageRow named;
        named.reserve(columns_.size());
        for (std::size_t index = 0U; index < columns_.size() && index < row->size(); ++index) {
            named.emplace_back(columns_[index].name, value_to_text((*row)[index]));
        }
        rows.push_back(std::move(named));
    }
    return rows;
}

void PagingContext::finish()
{
    ensure_open();
    auto cursor = std::move(cursor_);
    cursor->close();
}

}  // namespace rowpager::session
