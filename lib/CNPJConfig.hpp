#ifndef CNPJ_FORGE_CNPJ_CONFIG_H_
#define CNPJ_FORGE_CNPJ_CONFIG_H_

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>

#include <google/protobuf/text_format.h>
#include <grpcpp/support/status.h>

#include "cnpjforge.pb.h"

#include "CNPJ.hpp"
#include "CNPJSequenceFilter.hpp"
#include "CNPJStatus.hpp"
#include "CNPJStrategy.hpp"
#include "CNPJStrategy_Neighborhood.hpp"
#include "CNPJStrategy_Random.hpp"
#include "CNPJStrategy_Sequential.hpp"
#include "CNPJUtil.hpp"

using cnpjforge::GenerationConfig;
using cnpjforge::NeighborhoodParams;
using cnpjforge::RandomParams;
using cnpjforge::SequentialParams;

// Loading, defaults and validation of a GenerationConfig, plus the factory
// that turns a valid config into its strategy. Every check happens here, so a
// strategy never sees parameters it cannot honor.
class CNPJConfig {
 public:
  static constexpr int64_t kDefaultRootMin = 35000000;
  static constexpr int64_t kDefaultRootMax = 99999999;
  static constexpr int kDefaultFixedBranch = 1;
  static constexpr int64_t kDefaultSpread = 30000000;
  static constexpr const char* kDefaultOutputPrefix = "out/cnpjs";

  static grpc::Status ParseText(const std::string& text, GenerationConfig* config) {
    if (!google::protobuf::TextFormat::ParseFromString(text, config)) {
      return CNPJStatus::ConfigurationError("config is not a valid GenerationConfig");
    }
    return grpc::Status::OK;
  }

  static grpc::Status LoadFromFile(const std::string& filename, GenerationConfig* config) {
    std::ifstream input(filename);
    if (!input.is_open()) {
      return CNPJStatus::ConfigurationError("cannot read config file " + filename);
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return ParseText(buffer.str(), config);
  }

  static std::string OutputPrefix(const GenerationConfig& config) {
    return config.output().prefix().empty() ? kDefaultOutputPrefix
                                            : config.output().prefix();
  }

  static grpc::Status Validate(const GenerationConfig& config) {
    if (config.output().chunk_size() < 0) {
      return CNPJStatus::ConfigurationError("output.chunk_size must be >= 0");
    }
    if (config.output().progress_every() < 0) {
      return CNPJStatus::ConfigurationError("output.progress_every must be >= 0");
    }
    switch (config.strategy_case()) {
      case GenerationConfig::kRandom:
        return ValidateRandom(config.random(), config.keep_degenerate());
      case GenerationConfig::kSequential:
        return ValidateSequential(config.sequential());
      case GenerationConfig::kNeighborhood:
        return ValidateNeighborhood(config.neighborhood());
      default:
        return CNPJStatus::ConfigurationError(
            "no strategy selected (random, sequential or neighborhood)");
    }
  }

  // Validates the config and builds its strategy. Unseeded strategies get a
  // seed from std::random_device, which is reported on stderr so the run can
  // be reproduced.
  static grpc::Status NewStrategy(const GenerationConfig& config,
                                  std::unique_ptr<CNPJStrategy>* strategy) {
    grpc::Status status = Validate(config);
    if (!status.ok()) {
      return status;
    }
    CNPJSequenceFilter filter(!config.keep_degenerate());
    switch (config.strategy_case()) {
      case GenerationConfig::kRandom: {
        const RandomParams& params = config.random();
        strategy->reset(new CNPJStrategy_Random(
            RandomOptions(params), filter,
            MakeRng(params.has_seed(), params.seed())));
        break;
      }
      case GenerationConfig::kSequential:
        strategy->reset(new CNPJStrategy_Sequential(
            SequentialOptions(config.sequential()), filter));
        break;
      case GenerationConfig::kNeighborhood: {
        const NeighborhoodParams& params = config.neighborhood();
        strategy->reset(new CNPJStrategy_Neighborhood(
            NeighborhoodOptions(params), filter,
            MakeRng(params.has_seed(), params.seed())));
        break;
      }
      default:
        return CNPJStatus::ConfigurationError("no strategy selected");
    }
    return grpc::Status::OK;
  }

  static CNPJStrategy_Random::Options RandomOptions(const RandomParams& params) {
    CNPJStrategy_Random::Options options;
    options.count = params.count();
    options.root_min = params.has_root_min() ? params.root_min() : kDefaultRootMin;
    options.root_max = params.has_root_max() ? params.root_max() : kDefaultRootMax;
    options.random_branch = params.random_branch();
    options.fixed_branch =
        params.has_fixed_branch() ? params.fixed_branch() : kDefaultFixedBranch;
    options.bias_upper = params.bias_upper();
    return options;
  }

  static CNPJStrategy_Sequential::Options SequentialOptions(const SequentialParams& params) {
    CNPJStrategy_Sequential::Options options;
    if (params.has_start()) options.start = params.start();
    if (params.has_end()) options.end = params.end();
    if (params.has_step()) options.step = params.step();
    if (params.has_count()) options.count = params.count();
    if (params.has_shard()) {
      options.shard_index = params.shard().index();
      options.shards_total = params.shard().total();
    }
    return options;
  }

  // Expects params already validated, the base identifier must normalize.
  static CNPJStrategy_Neighborhood::Options NeighborhoodOptions(const NeighborhoodParams& params) {
    CNPJStrategy_Neighborhood::Options options;
    options.count = params.count();
    int64_t root = 0;
    ParseBaseRoot(params.base_identifier(), &root);
    options.base_root = root;
    options.spread = params.has_spread() ? params.spread() : kDefaultSpread;
    return options;
  }

  // Extracts the root (first 8 digits) of a masked or raw identifier. Accepts
  // 12 digits (root and branch) or 14 digits (check digits are not required
  // to match).
  static bool ParseBaseRoot(const std::string& identifier, int64_t* root) {
    std::string digits = CNPJUtil::StripNonDigits(identifier);
    if (digits.size() != 12 && digits.size() != 14) {
      return false;
    }
    *root = std::stoll(digits.substr(0, 8));
    return true;
  }

 private:
  static grpc::Status ValidateRandom(const RandomParams& params, bool keep_degenerate) {
    CNPJStrategy_Random::Options options = RandomOptions(params);
    if (options.count < 1) {
      return CNPJStatus::ConfigurationError("random.count must be >= 1");
    }
    if (options.root_min < 0 || options.root_max > CNPJ::kRootMax ||
        options.root_min > options.root_max) {
      return CNPJStatus::ConfigurationError(
          "random.root_min/root_max must satisfy 0 <= min <= max <= 99999999");
    }
    if (params.random_branch() && params.has_fixed_branch()) {
      return CNPJStatus::ConfigurationError(
          "random.random_branch and random.fixed_branch are exclusive");
    }
    if (options.fixed_branch < 1 || options.fixed_branch > CNPJ::kBranchMax) {
      return CNPJStatus::ConfigurationError("random.fixed_branch must be in [1, 9999]");
    }
    // A single root with a single branch leaves exactly one base; resampling
    // a rejected one would never end.
    if (!keep_degenerate && !options.random_branch &&
        options.root_min == options.root_max &&
        CNPJSequenceFilter().Rejects(options.root_min * 10000 + options.fixed_branch)) {
      return CNPJStatus::ConfigurationError(
          "random range only contains a degenerate sequence");
    }
    return grpc::Status::OK;
  }

  static grpc::Status ValidateSequential(const SequentialParams& params) {
    CNPJStrategy_Sequential::Options options = SequentialOptions(params);
    if (options.start < 0 || options.end > CNPJ::kBase12Limit) {
      return CNPJStatus::ConfigurationError(
          "sequential.start/end must lie in [0, 1000000000000]");
    }
    if (options.step < 1) {
      return CNPJStatus::ConfigurationError("sequential.step must be >= 1");
    }
    if (params.has_count() && options.count < 1) {
      return CNPJStatus::ConfigurationError("sequential.count must be >= 1");
    }
    if (!params.has_count() && options.start >= options.end) {
      return CNPJStatus::ConfigurationError(
          "sequential.start must be < end when no count is given");
    }
    if (params.has_shard() &&
        (options.shards_total < 1 || options.shard_index < 0 ||
         options.shard_index >= options.shards_total)) {
      return CNPJStatus::ConfigurationError(
          "invalid shard: index=" + std::to_string(options.shard_index) +
          ", total=" + std::to_string(options.shards_total));
    }
    return grpc::Status::OK;
  }

  static grpc::Status ValidateNeighborhood(const NeighborhoodParams& params) {
    if (params.count() < 1) {
      return CNPJStatus::ConfigurationError("neighborhood.count must be >= 1");
    }
    int64_t root = 0;
    if (!ParseBaseRoot(params.base_identifier(), &root)) {
      return CNPJStatus::ConfigurationError(
          "neighborhood.base_identifier must hold 12 or 14 digits, got \"" +
          params.base_identifier() + "\"");
    }
    if (params.has_spread() &&
        (params.spread() < 0 || params.spread() > CNPJ::kRootMax)) {
      return CNPJStatus::ConfigurationError(
          "neighborhood.spread must be in [0, 99999999]");
    }
    return grpc::Status::OK;
  }

  static std::mt19937_64 MakeRng(bool has_seed, uint64_t seed) {
    if (!has_seed) {
      std::random_device rd;
      seed = (static_cast<uint64_t>(rd()) << 32) | rd();
      std::cerr << "Using random seed " << seed << std::endl;
    }
    return std::mt19937_64(seed);
  }
};

#endif  // CNPJ_FORGE_CNPJ_CONFIG_H_
