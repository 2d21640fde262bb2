// =============================================================================
// hexzset CLI - geo commands over a PostgreSQL member table
// =============================================================================
//
// Usage:
//   hexzset [options] <command> <key> [args...]
//
// Commands:
//   status        Check that the store answers
//   add           Add named points (lng lat name ...)
//   addbyindex    Add named leaf cells (index name ...)
//   index         Leaf cell index of members
//   pos           Cell centroid of members
//   dist          Distance between two members
//   contains      Members inside a cell
//   count         Number of members inside a cell
//   remcontained  Remove members inside a cell
//   scan          Enumerate members with their cells
//   version       Show version information
//
// Examples:
//   hexzset add places -122.42 37.77 sf
//   hexzset contains places 8928308280fffff WITHINDICES
//   hexzset -h db.local dist places sf oakland km
//
// =============================================================================

#include <cstring>
#include <strings.h>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "hexzset/command_args.hpp"
#include "hexzset/config.hpp"
#include "hexzset/error.hpp"
#include "hexzset/geo_set.hpp"
#include "hexzset/logging.hpp"
#include "hexzset/db/connection.hpp"
#include "hexzset/db/pg_member_store.hpp"
#include "hexzset/geo/h3_indexer.hpp"

#define HEXZSET_VERSION_STRING "1.0.0"

namespace hexzset::cli {

using Tokens = std::vector<std::string>;

int cmd_status(const Tokens& args);
int cmd_add(const Tokens& args);
int cmd_addbyindex(const Tokens& args);
int cmd_index(const Tokens& args);
int cmd_pos(const Tokens& args);
int cmd_dist(const Tokens& args);
int cmd_contains(const Tokens& args);
int cmd_count(const Tokens& args);
int cmd_remcontained(const Tokens& args);
int cmd_scan(const Tokens& args);
int cmd_version(const Tokens& args);
int cmd_help(const Tokens& args);

} // namespace hexzset::cli

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* usage;
    const char* description;
    int (*handler)(const hexzset::cli::Tokens& args);
};

static const Command g_commands[] = {
    {"status",       "",                                     "Check that the store answers", hexzset::cli::cmd_status},
    {"add",          "key lng lat name [...]",               "Add named points", hexzset::cli::cmd_add},
    {"addbyindex",   "key index name [...]",                 "Add named resolution 15 cells", hexzset::cli::cmd_addbyindex},
    {"index",        "key name [...]",                       "Leaf cell index of members", hexzset::cli::cmd_index},
    {"pos",          "key name [...]",                       "Cell centroid of members", hexzset::cli::cmd_pos},
    {"dist",         "key name1 name2 [m|km|ft|mi]",         "Distance between two members", hexzset::cli::cmd_dist},
    {"contains",     "key cell [WITHINDICES] [LIMIT o c]",   "Members inside a cell", hexzset::cli::cmd_contains},
    {"count",        "key cell",                             "Number of members inside a cell", hexzset::cli::cmd_count},
    {"remcontained", "key cell",                             "Remove members inside a cell", hexzset::cli::cmd_remcontained},
    {"scan",         "key cursor [MATCH p] [COUNT n]",       "Enumerate members with their cells", hexzset::cli::cmd_scan},
    {"version",      "",                                     "Show version information", hexzset::cli::cmd_version},
    {"help",         "",                                     "Show this help message", hexzset::cli::cmd_help},
    {nullptr, nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "hexzset.env";
    std::string table;
    bool verbose = false;
};

static GlobalOptions g_options;
static std::unique_ptr<hexzset::db::ConnectionConfig> g_conn_config;

namespace hexzset::cli {

// =============================================================================
// Session: one connection, one store, one GeoSet per invocation
// =============================================================================

// -t wins over store.table
static std::string store_table() {
    return g_options.table.empty()
        ? Config::getInstance().get<std::string>("store.table", "hexzset_member")
        : g_options.table;
}

struct Session {
    H3CellIndexer indexer;
    std::unique_ptr<db::PgMemberStore> store;
    std::unique_ptr<GeoSet> geo;

    Session() {
        db::Connection conn(*g_conn_config);
        store = std::make_unique<db::PgMemberStore>(std::move(conn), store_table());
        store->ensure_schema();
        geo = std::make_unique<GeoSet>(*store, indexer);
    }
};

static void print_nil(size_t n) {
    std::cout << n << ") (nil)\n";
}

static std::string format_coord(double v) {
    std::ostringstream ss;
    ss << std::setprecision(17) << v;
    return ss.str();
}

static void require_key(const Tokens& args, const char* usage) {
    if (args.empty()) {
        throw InvalidArgumentError(std::string("missing key. Usage: ") + usage);
    }
}

static Tokens rest(const Tokens& args) {
    return Tokens(args.begin() + 1, args.end());
}

int cmd_help(const Tokens&) {
    std::cout << "hexzset - hexagonal cell geo index over an ordered member store\n";
    std::cout << "Version " << HEXZSET_VERSION_STRING << "\n\n";
    std::cout << "Usage: hexzset [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 14; ++i) std::cout << ' ';
        std::cout << cmd->description;
        if (cmd->usage[0]) std::cout << "\n                " << cmd->name << " " << cmd->usage;
        std::cout << "\n";
    }

    std::cout << "\nOptions:\n";
    std::cout << "  -d, --dbname <name>     Database name (default: hexzset)\n";
    std::cout << "  -U, --user <user>       Database user (default: postgres)\n";
    std::cout << "  -h, --host <host>       Database host (default: localhost)\n";
    std::cout << "  -p, --port <port>       Database port (default: 5432)\n";
    std::cout << "  -W, --password <pass>   Database password\n";
    std::cout << "  -t, --table <name>      Member table (default: hexzset_member)\n";
    std::cout << "  -c, --config <file>     key=value config file (default: hexzset.env)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  HZ_DB_HOST HZ_DB_PORT HZ_DB_USER HZ_DB_PASS HZ_DB_NAME\n";
    std::cout << "  HZ_STORE_TABLE HZ_LOG_LEVEL HZ_LOG_FILE\n";
    return 0;
}

int cmd_version(const Tokens&) {
    std::cout << "hexzset " << HEXZSET_VERSION_STRING << "\n";
    return 0;
}

int cmd_status(const Tokens&) {
    Session s;
    std::cout << s.geo->status() << "\n";
    return 0;
}

int cmd_add(const Tokens& args) {
    require_key(args, "add key lng lat name [...]");
    auto members = args::parse_add(rest(args));
    Session s;
    std::cout << "(integer) " << s.geo->add(args[0], members) << "\n";
    return 0;
}

int cmd_addbyindex(const Tokens& args) {
    require_key(args, "addbyindex key index name [...]");
    auto members = args::parse_add_by_index(rest(args));
    Session s;
    std::cout << "(integer) " << s.geo->add_by_index(args[0], members) << "\n";
    return 0;
}

int cmd_index(const Tokens& args) {
    require_key(args, "index key name [...]");
    Session s;
    auto indices = s.geo->index(args[0], rest(args));
    for (size_t i = 0; i < indices.size(); ++i) {
        if (indices[i]) std::cout << i + 1 << ") \"" << *indices[i] << "\"\n";
        else print_nil(i + 1);
    }
    return 0;
}

int cmd_pos(const Tokens& args) {
    require_key(args, "pos key name [...]");
    Session s;
    auto points = s.geo->pos(args[0], rest(args));
    for (size_t i = 0; i < points.size(); ++i) {
        if (points[i]) {
            std::cout << i + 1 << ") 1) \"" << format_coord(points[i]->lon) << "\"\n"
                      << "   2) \"" << format_coord(points[i]->lat) << "\"\n";
        } else {
            print_nil(i + 1);
        }
    }
    return 0;
}

int cmd_dist(const Tokens& args) {
    require_key(args, "dist key name1 name2 [unit]");
    auto dist_args = args::parse_dist(rest(args));
    Session s;
    auto d = s.geo->dist(args[0], dist_args.name1, dist_args.name2, dist_args.unit);
    if (d) {
        std::cout << "\"" << std::fixed << std::setprecision(4) << *d << "\"\n";
    } else {
        std::cout << "(nil)\n";
    }
    return 0;
}

int cmd_contains(const Tokens& args) {
    require_key(args, "contains key cell [WITHINDICES] [LIMIT offset count]");
    auto contains_args = args::parse_contains(rest(args));
    Session s;
    auto entries = s.geo->contains(args[0], contains_args.cell, contains_args.with_indices,
                                   contains_args.limit);
    if (entries.empty()) {
        std::cout << "(empty array)\n";
        return 0;
    }
    size_t n = 0;
    for (const auto& e : entries) {
        std::cout << ++n << ") \"" << e.name << "\"\n";
        if (e.index) std::cout << ++n << ") \"" << *e.index << "\"\n";
    }
    return 0;
}

int cmd_count(const Tokens& args) {
    if (args.size() != 2) {
        throw InvalidArgumentError("syntax error. Try COUNT key cell");
    }
    Session s;
    std::cout << "(integer) " << s.geo->count(args[0], args[1]) << "\n";
    return 0;
}

int cmd_remcontained(const Tokens& args) {
    if (args.size() != 2) {
        throw InvalidArgumentError("syntax error. Try REMCONTAINED key cell");
    }
    Session s;
    std::cout << "(integer) " << s.geo->remove_contained(args[0], args[1]) << "\n";
    return 0;
}

int cmd_scan(const Tokens& args) {
    require_key(args, "scan key cursor [MATCH pattern] [COUNT count]");
    auto scan_args = args::parse_scan(rest(args));
    Session s;
    auto page = s.geo->scan(args[0], scan_args.cursor, scan_args.match, scan_args.count);
    std::cout << "1) \"" << page.cursor << "\"\n";
    if (page.entries.empty()) {
        std::cout << "2) (empty array)\n";
        return 0;
    }
    size_t n = 0;
    for (const auto& [name, index] : page.entries) {
        std::cout << (n == 0 ? "2) " : "   ") << ++n << ") \"" << name << "\"\n";
        std::cout << "   " << ++n << ") \"" << index << "\"\n";
    }
    return 0;
}

} // namespace hexzset::cli

// =============================================================================
// Main Entry Point
// =============================================================================

// Consumes leading options; returns the index of the command name
static int parse_global_options(int argc, char* argv[]) {
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') break;

        if (g_conn_config->parse_arg(argc, argv, i)) continue;

        if ((arg == "-t" || arg == "--table") && i + 1 < argc) {
            g_options.table = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return -1;
        }
    }
    return i;
}

static bool config_file_flag(int argc, char* argv[], std::string& file) {
    for (int i = 1; i + 1 < argc; ++i) {
        std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') break;
        if (arg == "-c" || arg == "--config") {
            file = argv[i + 1];
            return true;
        }
    }
    return false;
}

int main(int argc, char* argv[]) {
    // The config file must be loaded before ConnectionConfig reads its defaults
    config_file_flag(argc, argv, g_options.config_file);
    if (!hexzset::init_config(g_options.config_file)) {
        return 1;
    }

    g_conn_config = std::make_unique<hexzset::db::ConnectionConfig>();
    int cmd_at = parse_global_options(argc, argv);
    if (cmd_at < 0) {
        return 1;
    }
    if (g_options.verbose) {
        hexzset::set_log_level(hexzset::LogLevel::DEBUG);
        hexzset::Config::getInstance().print();
    }
    LOG_INFO("hexzset ", HEXZSET_VERSION_STRING, " store=postgresql://", g_conn_config->describe(),
             " table=", hexzset::cli::store_table());

    if (cmd_at >= argc) {
        hexzset::cli::cmd_help({});
        return 1;
    }

    const char* cmd_name = argv[cmd_at];
    hexzset::cli::Tokens args(argv + cmd_at + 1, argv + argc);

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcasecmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(args);
            } catch (const hexzset::HexzsetException& e) {
                LOG_DEBUG("command ", cmd->name, " failed: ", e.what());
                std::cerr << "(error) " << e.what() << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'hexzset help' for usage.\n";
    return 1;
}
