#ifndef MONGO_MANAGER_HPP
#define MONGO_MANAGER_HPP

#include "core/config.hpp"

#include <mongocxx/client.hpp>
#include <mongocxx/instance.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/uri.hpp>

#include <memory>
#include <string>

// Owns the driver instance and a client pool for the [Storage] deployment
class MongoManager {
public:
  // Throws StorageError when the URI is unusable
  explicit MongoManager(const Config::StorageConfig &config);

  // Blocks while every pooled client is in use
  mongocxx::pool::entry get_client();

  const std::string &database_name() const { return database_name_; }

  // Round trip to the server; false when it cannot be reached
  bool ping();

private:
  static mongocxx::instance &driver_instance();

  std::string database_name_;
  std::unique_ptr<mongocxx::pool> pool_;
};

#endif // MONGO_MANAGER_HPP
