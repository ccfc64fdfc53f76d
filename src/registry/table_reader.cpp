#include "simpaths/registry/table_reader.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <memory>

#include <fmt/format.h>
#include <sqlite3.h>

#include "simpaths/utils/Logger.hpp"

namespace simpaths::registry
{

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{

constexpr std::array<std::string_view, 6> kOps = {"==", "!=", "<=", ">=", "<", ">"};

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())) != 0)
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())) != 0)
        s.remove_suffix(1);
    return s;
}

bool is_identifier(std::string_view s)
{
    if (s.empty() || (std::isalpha(static_cast<unsigned char>(s[0])) == 0 && s[0] != '_'))
        return false;
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; });
}

std::string sql_op(std::string_view op)
{
    return op == "==" ? std::string("=") : std::string(op);
}

std::string quote_identifier(std::string_view name)
{
    std::string out = "\"";
    for (char c : name)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

struct SqliteCloser
{
    void operator()(sqlite3 *db) const { sqlite3_close(db); }
};
struct StmtFinalizer
{
    void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
};
using DbHandle = std::unique_ptr<sqlite3, SqliteCloser>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

int bind_value(sqlite3_stmt *stmt, int idx, const json &v)
{
    if (v.is_null())
        return sqlite3_bind_null(stmt, idx);
    if (v.is_boolean())
        return sqlite3_bind_int(stmt, idx, v.get<bool>() ? 1 : 0);
    if (v.is_number_integer())
        return sqlite3_bind_int64(stmt, idx, v.get<sqlite3_int64>());
    if (v.is_number())
        return sqlite3_bind_double(stmt, idx, v.get<double>());
    if (v.is_string())
    {
        const auto &s = v.get_ref<const std::string &>();
        return sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    const std::string dumped = v.dump(-1, ' ', false, json::error_handler_t::replace);
    return sqlite3_bind_text(stmt, idx, dumped.c_str(), static_cast<int>(dumped.size()), SQLITE_TRANSIENT);
}

/// Invalid UTF-8 sequences become U+FFFD so every cell serializes.
std::string utf8_text(std::string text)
{
    const std::string quoted = json(std::move(text)).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(quoted).get<std::string>();
}

json column_value(sqlite3_stmt *stmt, int col)
{
    switch (sqlite3_column_type(stmt, col))
    {
    case SQLITE_INTEGER:
        return static_cast<std::int64_t>(sqlite3_column_int64(stmt, col));
    case SQLITE_FLOAT:
        return sqlite3_column_double(stmt, col);
    case SQLITE_TEXT:
    {
        const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, col));
        return utf8_text(std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt, col))));
    }
    case SQLITE_BLOB:
    {
        const auto *data = static_cast<const unsigned char *>(sqlite3_column_blob(stmt, col));
        const int n = sqlite3_column_bytes(stmt, col);
        std::string hex;
        hex.reserve(static_cast<std::size_t>(n) * 2);
        for (int i = 0; i < n; ++i)
            fmt::format_to(std::back_inserter(hex), "{:02x}", data[i]);
        return hex;
    }
    default:
        return nullptr;
    }
}

} // namespace

std::optional<TableFormat> parse_table_format(std::string_view name) noexcept
{
    if (name == "json")
        return TableFormat::Json;
    if (name == "json:dict")
        return TableFormat::JsonDict;
    return std::nullopt;
}

std::optional<Orient> parse_orient(std::string_view name) noexcept
{
    if (name == "split")
        return Orient::Split;
    if (name == "records")
        return Orient::Records;
    if (name == "index")
        return Orient::Index;
    if (name == "columns")
        return Orient::Columns;
    if (name == "values")
        return Orient::Values;
    return std::nullopt;
}

Outcome<Condition> parse_condition(std::string_view text)
{
    const std::size_t pos = text.find_first_of("=!<>");
    if (pos == std::string_view::npos)
        return Outcome<Condition>::failure(fmt::format("condition '{}' has no operator", text));

    std::string_view op;
    for (auto candidate : kOps)
    {
        if (text.substr(pos, candidate.size()) == candidate)
        {
            op = candidate;
            break;
        }
    }
    if (op.empty())
        return Outcome<Condition>::failure(fmt::format("condition '{}' has an unknown operator", text));

    const std::string_view column = trim(text.substr(0, pos));
    const std::string_view raw_value = trim(text.substr(pos + op.size()));
    if (!is_identifier(column))
        return Outcome<Condition>::failure(fmt::format("condition '{}': '{}' is not a column name", text, column));

    json value = json::parse(raw_value, nullptr, /*allow_exceptions=*/false);
    if (value.is_discarded())
        value = std::string(raw_value);
    return Outcome<Condition>::success(Condition{std::string(column), std::string(op), std::move(value)});
}

json to_oriented_json(const TableData &table, Orient orient)
{
    switch (orient)
    {
    case Orient::Split:
    {
        json index = json::array();
        json data = json::array();
        for (std::size_t r = 0; r < table.rows.size(); ++r)
        {
            index.push_back(r);
            data.push_back(table.rows[r]);
        }
        return json{{"columns", table.columns}, {"index", std::move(index)}, {"data", std::move(data)}};
    }
    case Orient::Records:
    {
        json out = json::array();
        for (const auto &row : table.rows)
        {
            json rec = json::object();
            for (std::size_t c = 0; c < table.columns.size(); ++c)
                rec[table.columns[c]] = row[c];
            out.push_back(std::move(rec));
        }
        return out;
    }
    case Orient::Index:
    {
        json out = json::object();
        for (std::size_t r = 0; r < table.rows.size(); ++r)
        {
            json rec = json::object();
            for (std::size_t c = 0; c < table.columns.size(); ++c)
                rec[table.columns[c]] = table.rows[r][c];
            out[std::to_string(r)] = std::move(rec);
        }
        return out;
    }
    case Orient::Columns:
    {
        json out = json::object();
        for (std::size_t c = 0; c < table.columns.size(); ++c)
        {
            json col = json::object();
            for (std::size_t r = 0; r < table.rows.size(); ++r)
                col[std::to_string(r)] = table.rows[r][c];
            out[table.columns[c]] = std::move(col);
        }
        return out;
    }
    case Orient::Values:
    default:
    {
        json out = json::array();
        for (const auto &row : table.rows)
            out.push_back(row);
        return out;
    }
    }
}

bool SqliteTableReader::supports(const fs::path &artifact) const
{
    std::string ext = artifact.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".sqlite" || ext == ".db";
}

Outcome<TableData> SqliteTableReader::read(const fs::path &artifact, const std::string &table,
                                           const std::vector<Condition> &conds) const
{
    if (table.empty())
        return Outcome<TableData>::failure("table name must not be empty");

    sqlite3 *raw_db = nullptr;
    int rc = sqlite3_open_v2(artifact.c_str(), &raw_db, SQLITE_OPEN_READONLY, nullptr);
    DbHandle db(raw_db);
    if (rc != SQLITE_OK)
    {
        return Outcome<TableData>::failure(fmt::format("could not open {}: {}", artifact.string(),
                                                       raw_db ? sqlite3_errmsg(raw_db) : "sqlite open failed"));
    }

    std::string sql = fmt::format("SELECT * FROM {}", quote_identifier(table));
    for (std::size_t i = 0; i < conds.size(); ++i)
    {
        const auto &c = conds[i];
        if (!is_identifier(c.column))
            return Outcome<TableData>::failure(fmt::format("'{}' is not a column name", c.column));
        if (std::find(kOps.begin(), kOps.end(), c.op) == kOps.end())
            return Outcome<TableData>::failure(fmt::format("'{}' is not a supported operator", c.op));
        sql += i == 0 ? " WHERE " : " AND ";
        sql += fmt::format("{} {} ?", quote_identifier(c.column), sql_op(c.op));
    }

    sqlite3_stmt *raw_stmt = nullptr;
    rc = sqlite3_prepare_v2(db.get(), sql.c_str(), -1, &raw_stmt, nullptr);
    StmtHandle stmt(raw_stmt);
    if (rc != SQLITE_OK)
    {
        LOGGER_DEBUG("SqliteTableReader: prepare failed for '{}': {}", sql, sqlite3_errmsg(db.get()));
        return Outcome<TableData>::failure(
            fmt::format("could not query table {} in {}: {}", table, artifact.string(), sqlite3_errmsg(db.get())));
    }
    for (std::size_t i = 0; i < conds.size(); ++i)
    {
        if (bind_value(stmt.get(), static_cast<int>(i) + 1, conds[i].value) != SQLITE_OK)
            return Outcome<TableData>::failure(
                fmt::format("could not bind value for {}: {}", conds[i].column, sqlite3_errmsg(db.get())));
    }

    TableData out;
    const int ncols = sqlite3_column_count(stmt.get());
    for (int c = 0; c < ncols; ++c)
        out.columns.push_back(utf8_text(sqlite3_column_name(stmt.get(), c)));

    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW)
    {
        std::vector<json> row;
        row.reserve(static_cast<std::size_t>(ncols));
        for (int c = 0; c < ncols; ++c)
            row.push_back(column_value(stmt.get(), c));
        out.rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE)
        return Outcome<TableData>::failure(
            fmt::format("error reading table {} in {}: {}", table, artifact.string(), sqlite3_errmsg(db.get())));

    return Outcome<TableData>::success(std::move(out));
}

std::vector<std::shared_ptr<const TableReader>> default_table_readers()
{
    return {std::make_shared<SqliteTableReader>()};
}

} // namespace simpaths::registry
