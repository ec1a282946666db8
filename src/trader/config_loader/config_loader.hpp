#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include <string>
#include <vector>
#include "configs/system_config.hpp"

// Returns false when the file cannot be opened. Unknown keys and malformed values throw std::runtime_error.
bool load_config_from_csv(ConfluenceTrader::Config::SystemConfig& cfg, const std::string& csv_path);

// Loads every config/*.csv file from config_directory and validates the result. 0 on success.
int load_system_config(ConfluenceTrader::Config::SystemConfig& config, const std::string& config_directory);

bool validate_config(const ConfluenceTrader::Config::SystemConfig& config, std::string& error_message);

std::vector<std::string> get_config_file_names();

#endif // CONFIG_LOADER_HPP
