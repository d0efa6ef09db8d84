#ifndef CNPJ_FORGE_CNPJ_CHUNKED_WRITER_H_
#define CNPJ_FORGE_CNPJ_CHUNKED_WRITER_H_

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <vector>
#include <sys/stat.h>
#include <sys/types.h>

#include <grpcpp/support/status.h>

#include "CNPJ.hpp"
#include "CNPJStatus.hpp"

// Writes identifiers one per line into prefix.txt (chunk_size == 0) or into
// prefix_00001.txt, prefix_00002.txt, ... holding at most chunk_size lines
// each. A new chunk is opened only right before the line that would overflow
// the current one, so every file on disk always ends with a complete line.
class CNPJChunkedWriter {
 public:
  // Receives the running total every progress_every lines. Called inline from
  // Write(), so it must return quickly.
  typedef std::function<void(int64_t)> ProgressFn;

  CNPJChunkedWriter() {}

  CNPJChunkedWriter(int64_t progress_every, ProgressFn progress)
      : progress_every_(progress_every), progress_(progress) {}

  ~CNPJChunkedWriter() {
    if (fs_.is_open()) {
      fs_.close();
    }
  }

  grpc::Status Open(const std::string& prefix, int64_t chunk_size, bool masked) {
    if (prefix.empty()) {
      return CNPJStatus::ConfigurationError("output prefix is empty");
    }
    if (chunk_size < 0) {
      return CNPJStatus::ConfigurationError("chunk size must be >= 0");
    }
    prefix_ = prefix;
    chunk_size_ = chunk_size;
    masked_ = masked;
    written_ = 0;
    chunk_index_ = 0;
    files_.clear();

    grpc::Status status = CreateParentDirectories(prefix_);
    if (!status.ok()) {
      return status;
    }
    // The first file is opened eagerly so a bad destination fails the run
    // before anything is generated.
    return OpenNext();
  }

  grpc::Status Write(const CNPJ& cnpj) {
    if (!fs_.is_open()) {
      return CNPJStatus::IOError("write on a closed writer");
    }
    if (chunk_size_ > 0 && chunk_written_ >= chunk_size_) {
      grpc::Status status = OpenNext();
      if (!status.ok()) {
        return status;
      }
    }

    // One insertion per line, newline included.
    fs_ << (masked_ ? cnpj.Masked() : cnpj.Digits()) + '\n';
    if (!fs_.good()) {
      return CNPJStatus::IOError("failed to write to " + files_.back());
    }
    ++chunk_written_;
    ++written_;
    if (progress_every_ > 0 && written_ % progress_every_ == 0 && progress_) {
      progress_(written_);
    }
    return grpc::Status::OK;
  }

  grpc::Status Close() {
    if (!fs_.is_open()) {
      return grpc::Status::OK;
    }
    fs_.close();
    if (fs_.fail()) {
      return CNPJStatus::IOError("failed to close " + files_.back());
    }
    return grpc::Status::OK;
  }

  int64_t written() const { return written_; }

  // Paths of every file opened so far, in order.
  const std::vector<std::string>& files() const { return files_; }

  static std::string ChunkPath(const std::string& prefix, int64_t index) {
    char suffix[32];
    snprintf(suffix, sizeof(suffix), "_%05lld.txt", static_cast<long long>(index));
    return prefix + suffix;
  }

 private:
  grpc::Status OpenNext() {
    grpc::Status status = Close();
    if (!status.ok()) {
      return status;
    }
    ++chunk_index_;
    std::string path =
        chunk_size_ > 0 ? ChunkPath(prefix_, chunk_index_) : prefix_ + ".txt";
    fs_.clear();
    fs_.open(path, std::ios::out | std::ios::trunc);
    if (!fs_.is_open()) {
      return CNPJStatus::IOError("cannot open " + path + ": " + strerror(errno));
    }
    files_.push_back(path);
    chunk_written_ = 0;
    if (chunk_size_ > 0) {
      std::cerr << "[chunk] writing " << path << std::endl;
    }
    return grpc::Status::OK;
  }

  static bool FileExists(const std::string& filename) {
    struct stat buffer;
    return stat(filename.c_str(), &buffer) == 0;
  }

  // mkdir -p for everything before the last '/' of prefix.
  static grpc::Status CreateParentDirectories(const std::string& prefix) {
    size_t pos = prefix.find('/', 1);
    while (pos != std::string::npos) {
      std::string dir = prefix.substr(0, pos);
      if (!FileExists(dir) && mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
        return CNPJStatus::IOError("cannot create directory " + dir + ": " +
                                   strerror(errno));
      }
      pos = prefix.find('/', pos + 1);
    }
    return grpc::Status::OK;
  }

  int64_t progress_every_ = 0;
  ProgressFn progress_;

  std::string prefix_;
  int64_t chunk_size_ = 0;
  bool masked_ = false;

  std::ofstream fs_;
  std::vector<std::string> files_;
  int64_t chunk_index_ = 0;
  int64_t chunk_written_ = 0;
  int64_t written_ = 0;
};

#endif  // CNPJ_FORGE_CNPJ_CHUNKED_WRITER_H_
