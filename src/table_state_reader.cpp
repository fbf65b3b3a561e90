#include "zktable/table_state_reader.hpp"

#include <algorithm>
#include <utility>
#include "zktable/codec.hpp"
#include "zktable/logging.hpp"

namespace zktable {

namespace {

constexpr const char* COMPONENT = "table-state-reader";

void require_valid_table_name(const std::string& table) {
    if (table.empty()) {
        throw InvalidArgumentError("table name must not be empty");
    }
    if (table.find('/') != std::string::npos) {
        throw InvalidArgumentError("table name must not contain '/': " + table);
    }
}

} // namespace

TableStateReader::TableStateReader(CoordinationClient& client, std::string tables_root)
    : client_(client), tables_root_(std::move(tables_root)) {}

std::string TableStateReader::table_path(const std::string& table) const {
    return join_path(tables_root_, table);
}

std::optional<Table::State> TableStateReader::get_table_state(const std::string& table) const {
    require_valid_table_name(table);
    return read_state(table);
}

bool TableStateReader::is_disabled_table(const std::string& table) const {
    return is_table_state(Table::DISABLED, get_table_state(table));
}

bool TableStateReader::is_enabled_table(const std::string& table) const {
    return is_table_state(Table::ENABLED, get_table_state(table));
}

bool TableStateReader::is_disabling_or_disabled_table(const std::string& table) const {
    auto state = get_table_state(table);
    return is_table_state(Table::DISABLING, state) || is_table_state(Table::DISABLED, state);
}

std::unordered_set<std::string> TableStateReader::get_tables_in_states(
        const std::vector<Table::State>& states) const {
    std::unordered_set<std::string> tables;
    auto children = client_.list_children(tables_root_);
    for (const auto& child : children) {
        // Child names come from the service itself, so they skip the caller-input check.
        auto state = read_state(child);
        bool matches = std::any_of(states.begin(), states.end(), [&](Table::State expected) {
            return is_table_state(expected, state);
        });
        if (matches) {
            tables.insert(child);
        }
    }
    log_debug(COMPONENT, "listed tables", {
        {"root", tables_root_},
        {"children", children.size()},
        {"matched", tables.size()}
    });
    return tables;
}

std::unordered_set<std::string> TableStateReader::get_disabled_tables() const {
    return get_tables_in_states({Table::DISABLED});
}

std::unordered_set<std::string> TableStateReader::get_disabled_or_disabling_tables() const {
    return get_tables_in_states({Table::DISABLED, Table::DISABLING});
}

std::optional<Table::State> TableStateReader::read_state(const std::string& table) const {
    auto path = table_path(table);
    auto data = client_.get_data(path);
    if (!data || data->empty()) {
        log_debug(COMPONENT, "no recorded state", {{"path", path}});
        return std::nullopt;
    }
    try {
        return decode_table_state(*data);
    } catch (const DecodeError& e) {
        log_warn(COMPONENT, "undecodable table state", {
            {"path", path},
            {"payload_size", e.payload_size()},
            {"reason", e.reason()}
        });
        throw DataInconsistencyError(path, e);
    }
}

} // namespace zktable
