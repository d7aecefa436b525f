// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "chain/currency_params.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"

#include <nlohmann/json.hpp>

namespace trustledger {
namespace chain {

std::unique_ptr<CurrencyParams> CurrencyParams::CreateDefault() {
  return std::make_unique<CurrencyParams>();
}

std::unique_ptr<CurrencyParams> CurrencyParams::CreateRegTest() {
  auto params = std::make_unique<CurrencyParams>();
  params->currency_name = "regtest";
  params->fork_window_size = 10;
  params->max_forks = 10;
  params->cert_validity_blocks = 20;
  params->ms_period = 0;
  params->sig_period = 0;
  params->max_orphan_blocks = 50;
  params->orphan_expire_seconds = 600;
  return params;
}

nlohmann::json CurrencyParams::ToJson() const {
  return nlohmann::json{{"currency_name", currency_name},
                        {"fork_window_size", fork_window_size},
                        {"max_forks", max_forks},
                        {"fork_advance_blocks", fork_advance_blocks},
                        {"fork_advance_time", fork_advance_time},
                        {"cert_validity_blocks", cert_validity_blocks},
                        {"ms_period", ms_period},
                        {"sig_period", sig_period},
                        {"max_orphan_blocks", max_orphan_blocks},
                        {"orphan_expire_seconds", orphan_expire_seconds}};
}

void CurrencyParams::MergeJson(const nlohmann::json& j) {
  currency_name = j.value("currency_name", currency_name);
  fork_window_size = j.value("fork_window_size", fork_window_size);
  max_forks = j.value("max_forks", max_forks);
  fork_advance_blocks = j.value("fork_advance_blocks", fork_advance_blocks);
  fork_advance_time = j.value("fork_advance_time", fork_advance_time);
  cert_validity_blocks = j.value("cert_validity_blocks", cert_validity_blocks);
  ms_period = j.value("ms_period", ms_period);
  sig_period = j.value("sig_period", sig_period);
  max_orphan_blocks = j.value("max_orphan_blocks", max_orphan_blocks);
  orphan_expire_seconds = j.value("orphan_expire_seconds", orphan_expire_seconds);
}

std::unique_ptr<CurrencyParams> CurrencyParams::LoadFromFile(const std::filesystem::path& path) {
  auto content = util::read_file_string(path);
  if (!content) {
    LOG_ERROR("Cannot read currency parameters from {}", path.string());
    return nullptr;
  }

  try {
    auto params = CreateDefault();
    params->MergeJson(nlohmann::json::parse(*content));
    if (params->fork_window_size == 0 || params->max_forks == 0 || params->cert_validity_blocks == 0) {
      LOG_ERROR("Currency parameters in {}: fork window, fork count and certification validity must be positive",
                path.string());
      return nullptr;
    }
    return params;
  } catch (const std::exception& e) {
    LOG_ERROR("Malformed currency parameters in {}: {}", path.string(), e.what());
    return nullptr;
  }
}

bool CurrencyParams::SaveToFile(const std::filesystem::path& path) const {
  return util::atomic_write_file(path, ToJson().dump(2));
}

}  // namespace chain
}  // namespace trustledger
