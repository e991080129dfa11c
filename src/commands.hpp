#pragma once
#include <string>
#include <vector>

namespace cmdb {

// Exit codes: 0 graceful stop, 1 startup failure, 2 fatal watch error.
int cmd_serve(const std::string& config_path);

int cmd_next(const std::string& config_path, const std::string& expression, int count);

int cmd_machines(const std::string& config_path, const std::vector<std::string>& args);

} // namespace cmdb
