#pragma once
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace fs = std::filesystem;

/**
 * Unique scratch directory, removed on destruction. path() is canonical so
 * that it compares equal to resolver output even when /tmp is a symlink.
 */
class TempDir {
public:
  explicit TempDir(const std::string& tag) {
    static std::atomic<int> counter{0};
#ifndef _WIN32
    long pid = static_cast<long>(getpid());
#else
    long pid = 0;
#endif
    fs::path p = fs::temp_directory_path() /
        ("bastion_" + tag + "_" + std::to_string(pid) + "_" + std::to_string(counter++));
    std::error_code ec;
    fs::remove_all(p, ec);
    fs::create_directories(p);
    root = fs::canonical(p);
  }

  ~TempDir() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return root; }

  fs::path write(const std::string& rel, const std::string& content) const {
    fs::path p = root / rel;
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << content;
    return p;
  }

  fs::path mkdir(const std::string& rel) const {
    fs::path p = root / rel;
    fs::create_directories(p);
    return p;
  }

private:
  fs::path root;
};

inline std::string readAll(const fs::path& p) {
  std::string s;
  std::ifstream f(p, std::ios::binary);
  if (f) s.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
  return s;
}

/** Collects audit lines in memory. */
class CapturedAudit {
public:
  std::function<void(const std::string&)> sink() {
    return [this](const std::string& line) {
      std::lock_guard<std::mutex> lock(mtx);
      lines.push_back(line);
    };
  }

  std::vector<std::string> snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return lines;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return lines.size();
  }

  nlohmann::json last() const {
    std::lock_guard<std::mutex> lock(mtx);
    return nlohmann::json::parse(lines.back());
  }

private:
  mutable std::mutex mtx;
  std::vector<std::string> lines;
};
