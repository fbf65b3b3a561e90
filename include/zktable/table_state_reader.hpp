#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "zktable/table.pb.h"
#include "coordination.hpp"
#include "errors.hpp"

namespace zktable {

/**
 * Reads table lifecycle state straight from the coordination service.
 *
 * Intended for components other than the master, which keeps its own cached
 * view. Nothing is cached here: every call goes to the coordination service
 * and observes whatever snapshot it returns at that moment.
 *
 * The reader only borrows the client and holds no mutable state, so one
 * instance may be shared by concurrent callers provided the client itself
 * tolerates concurrent use.
 *
 * Example:
 *   TableStateReader reader(client, config.tables_root());
 *   if (reader.is_disabling_or_disabled_table("orders")) { ... }
 */
class TableStateReader {
public:
    /**
     * @param client Coordination client, must outlive the reader
     * @param tables_root Parent node of all table nodes, e.g. "/wasp/table"
     */
    TableStateReader(CoordinationClient& client, std::string tables_root);

    const std::string& tables_root() const { return tables_root_; }

    /**
     * Path of the node holding a table's state.
     */
    std::string table_path(const std::string& table) const;

    /**
     * Read a table's state.
     *
     * @param table Table name
     * @return The recorded state, or std::nullopt if the node is missing or empty
     * @throws InvalidArgumentError if the table name is empty or contains '/'
     * @throws DataInconsistencyError if the node holds an undecodable payload
     * @throws CoordinationError from the client, unchanged
     */
    std::optional<Table::State> get_table_state(const std::string& table) const;

    /**
     * True iff the table is in state DISABLED.
     */
    bool is_disabled_table(const std::string& table) const;

    /**
     * True iff the table is in state ENABLED.
     */
    bool is_enabled_table(const std::string& table) const;

    /**
     * True iff the table is in state DISABLING or DISABLED.
     */
    bool is_disabling_or_disabled_table(const std::string& table) const;

    /**
     * Names of all tables whose state is one of `states`.
     *
     * Lists the tables root once, then reads each child. A failure on any
     * child aborts the whole call; no partial result is returned.
     *
     * @return Matching table names, empty if none match or the root is missing
     */
    std::unordered_set<std::string> get_tables_in_states(
        const std::vector<Table::State>& states) const;

    std::unordered_set<std::string> get_tables_in_states(
        std::initializer_list<Table::State> states) const {
        return get_tables_in_states(std::vector<Table::State>(states));
    }

    /**
     * Names of all tables in state DISABLED.
     */
    std::unordered_set<std::string> get_disabled_tables() const;

    /**
     * Names of all tables in state DISABLED or DISABLING.
     */
    std::unordered_set<std::string> get_disabled_or_disabling_tables() const;

    /**
     * True iff `actual` is present and equal to `expected`.
     */
    static bool is_table_state(Table::State expected, const std::optional<Table::State>& actual) {
        return actual.has_value() && *actual == expected;
    }

private:
    CoordinationClient& client_;
    const std::string tables_root_;

    std::optional<Table::State> read_state(const std::string& table) const;
};

} // namespace zktable
