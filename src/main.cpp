#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "common/Config.hpp"
#include "common/Logger.hpp"
#include "common/Types.hpp"
#include "core/UserService.hpp"
#include "dal/StorageBackend.hpp"

// Fixed demonstration sequence: create, fetch, list, update, delete.
// Any error is fatal.

namespace {

constexpr int64_t kDemoUserId = 1;

void printUser(const ustore::common::UserRecord& urUser) {
  std::cout << urUser.iId << " " << urUser.sName << " " << urUser.sEmail << "\n";
}

}  // namespace

int main() {
  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = ustore::common::Config::load();

    ustore::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = ustore::common::Logger::get();
    spLog->info("Step 1: Configuration loaded successfully");

    // ── Step 2: Open storage ─────────────────────────────────────────────
    ustore::dal::StorageBackend sbBackend(cfgApp.sDbUrl, cfgApp.iDbPoolSize);
    ustore::core::UserService usService(sbBackend.users());
    spLog->info("Step 2: Storage backend opened");

    // ── Step 3: Create ───────────────────────────────────────────────────
    usService.createUser("John Doe", "john@example.com");
    spLog->info("Step 3: User created");

    // ── Step 4: Fetch by id ──────────────────────────────────────────────
    printUser(usService.getUser(kDemoUserId));

    // ── Step 5: List ─────────────────────────────────────────────────────
    for (const auto& urUser : usService.getAllUsers()) {
      printUser(urUser);
    }

    // ── Step 6: Update ───────────────────────────────────────────────────
    usService.updateUser(kDemoUserId, "John Smith", "john.smith@example.com");
    spLog->info("Step 6: User {} updated", kDemoUserId);

    // ── Step 7: Delete ───────────────────────────────────────────────────
    usService.deleteUser(kDemoUserId);
    spLog->info("Step 7: User {} deleted", kDemoUserId);

    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
