#include "backup/backup_cli.hpp"
#include "backup/collaborator_factory.hpp"
#include "backup/confirmation_gate.hpp"
#include "common/cancellation.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    Cancellation::installSignalHandlers();

    auto gate = std::make_shared<ConsoleConfirmationGate>(std::cin, std::cout);
    BackupCLI cli(createCollaborators, gate);

    try {
        int status = cli.run(argc, argv);
        Logger::shutdown();
        return status;
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
        return 1;
    }
}
