#include "mongo_manager.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>

#include <exception>

mongocxx::instance &MongoManager::driver_instance() {
  // One per process, created on first use
  static mongocxx::instance instance{};
  return instance;
}

MongoManager::MongoManager(const Config::StorageConfig &config)
    : database_name_(config.mongo_database) {
  if (database_name_.empty())
    throw StorageError("MongoDB database name is empty");

  driver_instance();
  try {
    mongocxx::uri mongo_uri(config.mongo_uri);
    pool_ = std::make_unique<mongocxx::pool>(mongo_uri);
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_STORE,
        "Could not set up MongoDB pool for " << config.mongo_uri << ": "
                                             << e.what());
    throw StorageError(std::string("MongoDB pool initialization failed: ") +
                       e.what());
  }
  LOG(LogLevel::INFO, LogComponent::IO_STORE,
      "MongoDB pool ready for " << config.mongo_uri << ", database "
                                << database_name_);
}

mongocxx::pool::entry MongoManager::get_client() { return pool_->acquire(); }

bool MongoManager::ping() {
  try {
    auto client = pool_->acquire();
    bsoncxx::builder::basic::document command{};
    command.append(bsoncxx::builder::basic::kvp("ping", 1));
    (*client)[database_name_].run_command(command.view());
    return true;
  } catch (const std::exception &e) {
    LOG(LogLevel::WARN, LogComponent::IO_STORE,
        "MongoDB ping failed: " << e.what());
    return false;
  }
}
