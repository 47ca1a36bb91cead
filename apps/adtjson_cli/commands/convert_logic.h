#pragma once

#include "adtjson/derivation/derivation_settings.h"

#include <ostream>
#include <string>

// Exit codes shared by every adtjson_cli command.
constexpr int kExitOk = 0;
constexpr int kExitDecodeFailed = 1;
constexpr int kExitUsage = 2;

// execute_check: decode `input` as geo::Shape under `settings`. On success the
// canonical re-encoding goes to `out`; on failure the structured diagnostic goes
// to `out` and a readable error tree to `err`.
int execute_check(const std::string& input, const adtjson::derivation::DerivationSettings& settings,
                  std::ostream& out, std::ostream& err);

// execute_convert: decode `input` under `from`, re-encode under `to`, print to `out`.
int execute_convert(const std::string& input, const adtjson::derivation::DerivationSettings& from,
                    const adtjson::derivation::DerivationSettings& to, std::ostream& out,
                    std::ostream& err);
