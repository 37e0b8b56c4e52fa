#include "util.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace fog {
namespace util {

std::vector<std::string> split(const std::string& text, char delim) {
  std::string line;
  std::vector<std::string> vec;
  std::stringstream ss(text);
  while(std::getline(ss, line, delim)) {
      vec.push_back(line);
  }
  return vec;
}

std::vector<std::string> splitWhitespace(const std::string& text) {
  std::vector<std::string> vec;
  std::stringstream ss(text);
  std::string word;
  while(ss >> word) vec.push_back(word);
  return vec;
}

std::string toLower(std::string value) {
	std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
	return value;
}

std::string trim(const std::string& str) {
	size_t first = str.find_first_not_of(" \t\r\n");
	if(std::string::npos == first) return "";
	size_t last = str.find_last_not_of(" \t\r\n");
	return str.substr(first, (last - first + 1));
}

std::string env(const char* name) {
  const char* value = std::getenv(name);
  return value? trim(value): "";
}

int toInt(const std::string& str) {
  size_t pos = 0;
  int value = std::stoi(str, &pos);
  if(pos != str.size()) throw std::invalid_argument("trailing characters in '" + str + "'");
  return value;
}

double toDouble(const std::string& str) {
  size_t pos = 0;
  double value = std::stod(str, &pos);
  if(pos != str.size()) throw std::invalid_argument("trailing characters in '" + str + "'");
  return value;
}

}
}
