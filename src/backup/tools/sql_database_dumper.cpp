#include "backup/tools/sql_database_dumper.hpp"
#include "common/logger.hpp"
#include "common/process_runner.hpp"
#include <filesystem>

namespace fs = std::filesystem;

SqlDatabaseDumper::SqlDatabaseDumper(bool useSudo)
    : useSudo_(useSudo) {
}

bool SqlDatabaseDumper::isAvailable() const {
    return ProcessRunner::commandExists("mysqldump") || ProcessRunner::commandExists("pg_dumpall");
}

ToolResult SqlDatabaseDumper::dumpAll(const std::string& destDir) {
    bool dumped = false;

    if (ProcessRunner::commandExists("mysqldump")) {
        std::string out = (fs::path(destDir) / "mysql_dump.sql").string();
        std::string command = (useSudo_ ? "sudo " : "") +
                              ProcessRunner::join({"mysqldump", "--all-databases"}) +
                              " > " + ProcessRunner::quote(out);
        CommandResult result = ProcessRunner::run(command);
        if (!result.succeeded()) {
            return ToolResult::failure("mysqldump failed: " + ProcessRunner::describe(result));
        }
        Logger::info("MySQL databases dumped to " + out);
        dumped = true;
    }

    if (ProcessRunner::commandExists("pg_dumpall")) {
        std::string out = (fs::path(destDir) / "postgresql_dump.sql").string();
        std::string command = (useSudo_ ? "sudo -u postgres " : "") +
                              ProcessRunner::join({"pg_dumpall"}) +
                              " > " + ProcessRunner::quote(out);
        CommandResult result = ProcessRunner::run(command);
        if (!result.succeeded()) {
            return ToolResult::failure("pg_dumpall failed: " + ProcessRunner::describe(result));
        }
        Logger::info("PostgreSQL databases dumped to " + out);
        dumped = true;
    }

    if (!dumped) {
        return ToolResult::failure("No database dump tool found");
    }
    return ToolResult::ok();
}
