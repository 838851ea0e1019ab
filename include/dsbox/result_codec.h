#ifndef INCLUDE_DSBOX_RESULT_CODEC_H_
#define INCLUDE_DSBOX_RESULT_CODEC_H_

#include <string>
#include <stdexcept>

#include <nlohmann/json_fwd.hpp>
#include "result.h"

class ResultCodecError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Fill result_type / result (and series_name) of a response envelope
void EncodeResultValue(const ResultValue&, nlohmann::json& envelope);
// Inverse of EncodeResultValue; throws ResultCodecError on malformed input
ResultValue DecodeResultValue(ResultType, const nlohmann::json& result,
                              const nlohmann::json& envelope);

// These throw ResultCodecError if the split-oriented object is malformed
Table TableFromJson(const nlohmann::json&);
NamedSeries SeriesFromJson(const nlohmann::json&, const std::string& name);
NumericArray ArrayFromJson(const nlohmann::json&);

nlohmann::json SerializeResult(const ExecuteResult&);
ExecuteResult DeserializeResult(const nlohmann::json&);

std::string DumpResult(const ExecuteResult&);
// Never throws; a malformed payload becomes a failed ExecuteResult
ExecuteResult ParseResult(const std::string& payload);

// Human-readable rendering for terminals and agent transcripts
std::string FormatResult(const ExecuteResult&);
std::string FormatResultValue(const ResultValue&);

#endif  // INCLUDE_DSBOX_RESULT_CODEC_H_
