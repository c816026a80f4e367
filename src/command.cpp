#include "command.hpp"
#include <sstream>

Command parse_command(const std::string& line) {
  std::istringstream iss(line);
  Command c;
  iss >> c.name;
  std::string a;
  while (iss >> a) c.args.push_back(a);
  return c;
}
