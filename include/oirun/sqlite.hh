#pragma once

#include <oirun/macros/throw.hh>
#include <sqlite3.h>
#include <string>
#include <string_view>

#define THROW_SQLITE_ERROR(db, ...) \
    THROW(__VA_ARGS__, " - ", sqlite3_errcode(db), ": ", sqlite3_errmsg(db))

namespace SQLite {

class Statement {
    sqlite3_stmt* stmt_ = nullptr;

    explicit Statement(sqlite3_stmt* st) noexcept : stmt_(st) {}

public:
    Statement() noexcept = default;

    Statement(const Statement&) = delete;

    Statement(Statement&& s) noexcept : stmt_{s.stmt_} { s.stmt_ = nullptr; }

    Statement& operator=(const Statement&) = delete;

    Statement& operator=(Statement&& s) noexcept {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
        stmt_ = s.stmt_;
        s.stmt_ = nullptr;
        return *this;
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    // Returns SQLITE_ROW or SQLITE_DONE, throws on error
    int step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_DONE or rc == SQLITE_ROW) {
            return rc;
        }
        THROW_SQLITE_ERROR(sqlite3_db_handle(stmt_), "sqlite3_step()");
    }

    int reset() noexcept { return sqlite3_reset(stmt_); }

    void bind_null(int i_col) {
        if (sqlite3_bind_null(stmt_, i_col)) {
            THROW_SQLITE_ERROR(sqlite3_db_handle(stmt_), "sqlite3_bind_null()");
        }
    }

    // The value is copied by sqlite
    void bind_text(int i_col, std::string_view val) {
        if (sqlite3_bind_text(
                stmt_, i_col, val.data(), static_cast<int>(val.size()), SQLITE_TRANSIENT
            ))
        {
            THROW_SQLITE_ERROR(sqlite3_db_handle(stmt_), "sqlite3_bind_text()");
        }
    }

    void bind_int(int i_col, int val) {
        if (sqlite3_bind_int(stmt_, i_col, val)) {
            THROW_SQLITE_ERROR(sqlite3_db_handle(stmt_), "sqlite3_bind_int()");
        }
    }

    void bind_int64(int i_col, sqlite3_int64 val) {
        if (sqlite3_bind_int64(stmt_, i_col, val)) {
            THROW_SQLITE_ERROR(sqlite3_db_handle(stmt_), "sqlite3_bind_int64()");
        }
    }

    [[nodiscard]] bool is_null(int i_col) noexcept {
        return sqlite3_column_type(stmt_, i_col) == SQLITE_NULL;
    }

    [[nodiscard]] std::string_view get_str(int i_col) noexcept {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i_col));
        if (text == nullptr) {
            return {};
        }
        return {text, static_cast<size_t>(sqlite3_column_bytes(stmt_, i_col))};
    }

    [[nodiscard]] int get_int(int i_col) noexcept { return sqlite3_column_int(stmt_, i_col); }

    [[nodiscard]] sqlite3_int64 get_int64(int i_col) noexcept {
        return sqlite3_column_int64(stmt_, i_col);
    }

    friend class Connection;
};

class Connection {
    sqlite3* db_ = nullptr;

public:
    Connection() noexcept = default;

    Connection(const std::string& file, int flags, const char* z_vfs = nullptr) {
        if (sqlite3_open_v2(file.c_str(), &db_, flags, z_vfs)) {
            // sqlite3_open_v2() allocates the handle even on failure
            auto msg = concat_tostr(
                "sqlite3_open_v2(", file, ") - ", sqlite3_errcode(db_), ": ", sqlite3_errmsg(db_)
            );
            sqlite3_close(db_);
            db_ = nullptr;
            THROW(msg);
        }
    }

    Connection(const Connection&) = delete;

    Connection(Connection&& c) noexcept : db_{c.db_} { c.db_ = nullptr; }

    Connection& operator=(const Connection&) = delete;

    Connection& operator=(Connection&& c) noexcept {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = c.db_;
        c.db_ = nullptr;
        return *this;
    }

    ~Connection() { sqlite3_close(db_); }

    [[nodiscard]] bool is_open() const noexcept { return db_ != nullptr; }

    void busy_timeout(int milliseconds) {
        if (sqlite3_busy_timeout(db_, milliseconds)) {
            THROW_SQLITE_ERROR(db_, "sqlite3_busy_timeout()");
        }
    }

    void execute(const std::string& sql) {
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr)) {
            THROW_SQLITE_ERROR(db_, "sqlite3_exec()");
        }
    }

    Statement prepare(std::string_view sql) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr)) {
            THROW_SQLITE_ERROR(db_, "sqlite3_prepare_v2()");
        }
        return Statement{stmt};
    }
};

} // namespace SQLite
