#pragma once

#include "backup/collaborators.hpp"

// Full dumps of the local MySQL/MariaDB and PostgreSQL servers, whichever
// are installed.
class SqlDatabaseDumper : public DatabaseDumper {
public:
    explicit SqlDatabaseDumper(bool useSudo = false);

    bool isAvailable() const override;
    ToolResult dumpAll(const std::string& destDir) override;

private:
    bool useSudo_;
};
