/**
 * @file table_reader.hpp
 * @brief Reading a named table out of a registered artifact.
 *
 * `TableReader` is the seam for artifact formats; a reader is picked by the
 * artifact's file extension. `SqliteTableReader` handles `.sqlite` and `.db`
 * files. Results are rendered in one of the row orientations `split`,
 * `records`, `index`, `columns`, `values`:
 *
 * @code
 * split:   {"columns": ["a","b"], "index": [0,1], "data": [[1,"x"],[2,"y"]]}
 * records: [{"a":1,"b":"x"}, {"a":2,"b":"y"}]
 * index:   {"0": {"a":1,"b":"x"}, "1": {"a":2,"b":"y"}}
 * columns: {"a": {"0":1,"1":2}, "b": {"0":"x","1":"y"}}
 * values:  [[1,"x"],[2,"y"]]
 * @endcode
 */
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "simpaths/platform.hpp"
#include "simpaths/registry/outcome.hpp"

namespace simpaths::registry
{

/// Row filter `column op value`; op is one of == != < <= > >=.
struct Condition
{
    std::string column;
    std::string op;
    nlohmann::json value;
};

enum class TableFormat
{
    Json,     ///< JSON text.
    JsonDict, ///< Decoded JSON document.
};

enum class Orient
{
    Split,
    Records,
    Index,
    Columns,
    Values,
};

SIMPATHS_EXPORT std::optional<TableFormat> parse_table_format(std::string_view name) noexcept;
SIMPATHS_EXPORT std::optional<Orient> parse_orient(std::string_view name) noexcept;

/// Parses "column op value"; value is read as JSON, falling back to a plain string.
SIMPATHS_EXPORT Outcome<Condition> parse_condition(std::string_view text);

struct TableData
{
    std::vector<std::string> columns;
    std::vector<std::vector<nlohmann::json>> rows;
};

SIMPATHS_EXPORT nlohmann::json to_oriented_json(const TableData &table, Orient orient);

struct TableRequest
{
    std::string table;
    std::vector<Condition> conds;
    TableFormat format = TableFormat::Json;
    Orient orient = Orient::Split;
};

/// JSON text for TableFormat::Json, a document for TableFormat::JsonDict.
using TableResult = std::variant<std::string, nlohmann::json>;

class SIMPATHS_EXPORT TableReader
{
  public:
    virtual ~TableReader() = default;

    /// True if this reader handles @p artifact (by extension).
    virtual bool supports(const std::filesystem::path &artifact) const = 0;

    /// Reads @p table, keeping rows that satisfy every condition.
    virtual Outcome<TableData> read(const std::filesystem::path &artifact, const std::string &table,
                                    const std::vector<Condition> &conds) const = 0;
};

class SIMPATHS_EXPORT SqliteTableReader : public TableReader
{
  public:
    bool supports(const std::filesystem::path &artifact) const override;
    Outcome<TableData> read(const std::filesystem::path &artifact, const std::string &table,
                            const std::vector<Condition> &conds) const override;
};

/// Readers known to the registry, in lookup order.
SIMPATHS_EXPORT std::vector<std::shared_ptr<const TableReader>> default_table_readers();

} // namespace simpaths::registry
