#include "FsHelpers.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <vector>

std::string FsHelpers::normalisePath(const std::string& path) {
  std::vector<std::string> components;
  std::string component;

  for (const auto c : path) {
    if (c == '/') {
      if (!component.empty()) {
        if (component == "..") {
          if (!components.empty()) {
            components.pop_back();
          }
        } else {
          components.push_back(component);
        }
        component.clear();
      }
    } else {
      component += c;
    }
  }

  if (!component.empty()) {
    if (component == "..") {
      if (!components.empty()) components.pop_back();
    } else {
      components.push_back(component);
    }
  }

  std::string result;
  for (const auto& c : components) {
    if (!result.empty()) {
      result += "/";
    }
    result += c;
  }

  return result;
}

std::string FsHelpers::parentDir(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  if (slash == std::string::npos) return "";
  return path.substr(0, slash + 1);
}

std::string FsHelpers::fileName(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string FsHelpers::lowercaseExtension(const std::string& path) {
  const std::string name = fileName(path);
  const size_t dot = name.find_last_of('.');
  std::string ext = dot == std::string::npos ? name : name.substr(dot + 1);
  for (auto& c : ext) {
    c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
  }
  return ext;
}

bool FsHelpers::fileExists(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

long FsHelpers::readHeader(const std::string& path, uint8_t* buffer, const size_t size) {
  FILE* file = fopen(path.c_str(), "rb");
  if (!file) return -1;
  const size_t read = fread(buffer, 1, size, file);
  fclose(file);
  return static_cast<long>(read);
}

bool FsHelpers::makeDirs(const std::string& path) {
  if (path.empty()) return false;

  std::string current;
  size_t start = 0;
  if (path[0] == '/') {
    current = "/";
    start = 1;
  }

  while (start <= path.size()) {
    const size_t slash = path.find('/', start);
    const std::string part = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    if (!part.empty()) {
      current += part;
      if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
        return false;
      }
      current += "/";
    }
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  return true;
}
